#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/command.hpp"

/*
  stop-all

  Stops every application process, frees the application ports and
  clears database locks. Always exits 0: survivors are reported as
  warnings and the command is safe to run again.
*/
int main() {
  stackctl::runtime::RunCommand("stop-all: stopping all processes", [](const stackctl::runtime::config::RuntimeConfig& config) {
    auto app = stackctl::factory::Build(config);
    app.stop_sequence->Run();
    STACKCTL_LOG_INFO("Start the application again when ready");
    return stackctl::runtime::kExitOk;
  });
  return stackctl::runtime::kExitOk;
}
