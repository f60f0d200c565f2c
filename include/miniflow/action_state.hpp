#pragma once

namespace miniflow {

// Owned by the execution engine; transitions are its only mutation path.
enum class ActionState {
  kPending,
  kReady,
  kRunning,
  kSuccess,
  kFailure,
  kSkipped,
  kCancelled,
  kWarning,  // failed, but the action was declared low severity
  kOmitted,  // disabled in the workflow, never dispatched
};

inline const char* ToString(ActionState state) {
  switch (state) {
    case ActionState::kPending:
      return "PENDING";
    case ActionState::kReady:
      return "READY";
    case ActionState::kRunning:
      return "RUNNING";
    case ActionState::kSuccess:
      return "SUCCESS";
    case ActionState::kFailure:
      return "FAILURE";
    case ActionState::kSkipped:
      return "SKIPPED";
    case ActionState::kCancelled:
      return "CANCELLED";
    case ActionState::kWarning:
      return "WARNING";
    case ActionState::kOmitted:
      return "OMITTED";
  }
  return "UNKNOWN";
}

inline bool IsTerminal(ActionState state) {
  return state == ActionState::kSuccess || state == ActionState::kFailure ||
         state == ActionState::kSkipped || state == ActionState::kCancelled ||
         state == ActionState::kWarning || state == ActionState::kOmitted;
}

// States that taint every descendant.
inline bool IsFailed(ActionState state) {
  return state == ActionState::kFailure || state == ActionState::kCancelled;
}

}  // namespace miniflow
