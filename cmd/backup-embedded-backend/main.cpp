#include <iostream>

#include "internal/factory.hpp"
#include "internal/runtime/command.hpp"

/*
  backup-embedded-backend

  Copies the embedded database file into the backup directory. Stop the
  stack first for a consistent copy.
*/
int main() {
  return stackctl::runtime::RunCommand("backup-embedded-backend: copying the embedded database", [](const stackctl::runtime::config::RuntimeConfig& config) {
    auto app      = stackctl::factory::Build(config);
    auto artifact = app.backups->Create(stackctl::runtime::config::BACKEND_KIND_EMBEDDED);
    std::cout << artifact.path.string() << "\t" << artifact.size_bytes << "\n";
    return stackctl::runtime::kExitOk;
  });
}
