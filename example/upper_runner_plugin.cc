// Runner plugin: load with `miniflow --plugins <dir>`.
//
// Action kind "upper": upper-cases params.text and yields it as outcome
// "upper".

#include <algorithm>
#include <cctype>
#include <string>

#include "miniflow/runner.hpp"

namespace {

class UpperRunner : public miniflow::ActionRunner {
 public:
  std::string Name() const override { return "upper"; }

  miniflow::ActionResult Run(const miniflow::ParamNode& params,
                             const miniflow::CancelSignal& cancel) override {
    if (cancel.IsSet()) return miniflow::Cancelled{};
    std::string text = params["text"].AsRequired<std::string>("'text'");
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    Emit(text);
    return miniflow::Outcome{{{"upper", text}}};
  }
};

REGISTER_RUNNER(UpperRunner, "upper");

}  // namespace
