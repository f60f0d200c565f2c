#pragma once

#include <string>

#include "miniflow/params.hpp"
#include "miniflow/runner.hpp"

namespace miniflow {

// Emits `message`; produces no outcomes.
class EchoRunner : public ActionRunner {
 public:
  std::string Name() const override { return "echo"; }

  ActionResult Run(const ParamNode& params, const CancelSignal&) override {
    Emit(params["message"].AsRequired<std::string>("'message'"));
    return Outcome{};
  }
};

}  // namespace miniflow
