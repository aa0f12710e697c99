#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "internal/model/process.hpp"
#include "internal/process/process_table.hpp"

namespace stackctl::lifecycle {

enum class PortOutcome {
  kFree,    // nothing was listening
  kCleared, // every listener was killed (or was already gone)
  kFailed,  // a listener could not be signaled or its owner could not be inspected
};

struct PortReport {
  std::uint16_t                               port = 0;
  PortOutcome                                 outcome = PortOutcome::kFree;
  std::vector<stackctl::model::ProcessHandle> owners;
  std::size_t                                 unattributed = 0;
  std::size_t                                 killed       = 0;
};

struct ReclaimResult {
  std::vector<PortReport> ports;
  std::size_t             killed = 0;

  bool AllReclaimed() const;
};

/*
  Frees the application's fixed ports by SIGKILLing every listener.
  There is no grace period: this runs in a "stop everything now"
  context, after the graceful SIGTERM pass.
*/
class PortReclaimer {
 public:
  PortReclaimer(stackctl::process::ProcessTablePtr table, std::vector<std::uint16_t> ports);

  std::vector<stackctl::model::PortBinding> Bindings() const;

  ReclaimResult Reclaim();

  const std::vector<std::uint16_t>& ports() const {
    return ports_;
  }

 private:
  stackctl::process::ProcessTablePtr table_;
  std::vector<std::uint16_t>         ports_;
};

} // namespace stackctl::lifecycle
