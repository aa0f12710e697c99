#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/process.hpp"
#include "internal/process/process_table.hpp"

namespace stackctl::lifecycle {

struct LocateResult {
  std::vector<stackctl::model::ProcessHandle> matched;

  std::size_t signaled = 0;
  std::size_t gone     = 0;
  std::size_t denied   = 0;
};

/*
  Finds application processes by command-line substring and asks them
  to terminate (SIGTERM). Does not wait for exit.

  Matching is case-sensitive and deliberately broad so that children
  started through wrappers ("node .../next dev", "python -m
  se_letters.pipeline") are caught too. A process matching several
  patterns is reported once, under the first matching pattern.
*/
class ProcessLocator {
 public:
  ProcessLocator(stackctl::process::ProcessTablePtr table, std::vector<stackctl::runtime::config::ProcessPattern> patterns);

  static bool Matches(const stackctl::runtime::config::ProcessPattern& pattern, std::string_view command_line);

  std::vector<stackctl::model::ProcessHandle> Scan() const;

  LocateResult TerminateMatches();

 private:
  stackctl::process::ProcessTablePtr                     table_;
  std::vector<stackctl::runtime::config::ProcessPattern> patterns_;
};

} // namespace stackctl::lifecycle
