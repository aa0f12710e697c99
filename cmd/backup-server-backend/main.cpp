#include <iostream>

#include "internal/factory.hpp"
#include "internal/runtime/command.hpp"

/*
  backup-server-backend

  Logical export of the server database into the backup directory.
  Prints the artifact path and size on success.
*/
int main() {
  return stackctl::runtime::RunCommand("backup-server-backend: exporting the server backend", [](const stackctl::runtime::config::RuntimeConfig& config) {
    auto app      = stackctl::factory::Build(config);
    auto artifact = app.backups->Create(stackctl::runtime::config::BACKEND_KIND_SERVER);
    std::cout << artifact.path.string() << "\t" << artifact.size_bytes << "\n";
    return stackctl::runtime::kExitOk;
  });
}
