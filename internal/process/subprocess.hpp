#pragma once

#include <string>
#include <vector>

namespace stackctl::process {

struct ExitStatus {
  bool        spawned   = false;
  int         exit_code = -1;
  int         signal    = 0;
  std::string error; // spawn failure reason

  bool Success() const {
    return spawned && signal == 0 && exit_code == 0;
  }

  std::string Describe() const;
};

/*
  Runs argv[0] (PATH lookup) with the caller's environment, stdout and
  stderr, and waits for it. Never throws for a failing child; the
  caller decides what a non-zero status means.
*/
ExitStatus RunProcess(const std::vector<std::string>& argv);

} // namespace stackctl::process
