#pragma once

#include <functional>

#include "config/config.pb.h"

namespace stackctl::runtime {

/*
  Process exit codes shared by every command.
*/
enum ExitCode : int {
  kExitOk           = 0,
  kExitPrecondition = 1, // missing input, failed export/restore, unsupported
  kExitUnexpected   = 2,
};

using CommandBody = std::function<int(const stackctl::runtime::config::RuntimeConfig&)>;

/*
  Loads configuration from the environment, initializes logging, runs
  |body| and maps any escaping exception to an exit code. Nothing is
  thrown past this function.
*/
int RunCommand(const char* name, const CommandBody& body);

} // namespace stackctl::runtime
