#include "subprocess.hpp"

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

extern char** environ;

namespace stackctl::process {

std::string ExitStatus::Describe() const {
  if (!spawned) {
    return "failed to start: " + error;
  }
  if (signal != 0) {
    return "terminated by signal " + std::to_string(signal);
  }
  return "exit code " + std::to_string(exit_code);
}

ExitStatus RunProcess(const std::vector<std::string>& argv) {
  ExitStatus status;
  if (argv.empty()) {
    status.error = "empty command";
    return status;
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  pid_t pid = 0;
  int   rc  = posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(), environ);
  if (rc != 0) {
    status.error = argv[0] + ": " + std::strerror(rc);
    return status;
  }
  status.spawned = true;

  int wstatus = 0;
  while (waitpid(pid, &wstatus, 0) < 0) {
    if (errno != EINTR) {
      status.error = std::string("waitpid: ") + std::strerror(errno);
      return status;
    }
  }

  if (WIFSIGNALED(wstatus)) {
    status.signal = WTERMSIG(wstatus);
  } else if (WIFEXITED(wstatus)) {
    status.exit_code = WEXITSTATUS(wstatus);
  }
  return status;
}

} // namespace stackctl::process
