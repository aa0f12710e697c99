#include "internal/factory.hpp"
#include "internal/runtime/command.hpp"

/*
  rollback-to-embedded

  Restores the most recent embedded backup and makes the embedded backend
  active. Exits non-zero when no backup exists or the stack could not be
  stopped far enough to overwrite live data safely.
*/
int main() {
  return stackctl::runtime::RunCommand("rollback-to-embedded: rolling back to the embedded backend",
                                       [](const stackctl::runtime::config::RuntimeConfig& config) {
                                         auto app = stackctl::factory::Build(config);
                                         app.rollback->RollbackTo(stackctl::runtime::config::BACKEND_KIND_EMBEDDED);
                                         return stackctl::runtime::kExitOk;
                                       });
}
