#include "internal/factory.hpp"
#include "internal/runtime/command.hpp"

/*
  rollback-to-server

  Restores the most recent server backup and makes the server backend
  active. Exits non-zero when no backup exists or the stack could not be
  stopped far enough to overwrite live data safely.
*/
int main() {
  return stackctl::runtime::RunCommand("rollback-to-server: rolling back to the server backend",
                                       [](const stackctl::runtime::config::RuntimeConfig& config) {
                                         auto app = stackctl::factory::Build(config);
                                         app.rollback->RollbackTo(stackctl::runtime::config::BACKEND_KIND_SERVER);
                                         return stackctl::runtime::kExitOk;
                                       });
}
