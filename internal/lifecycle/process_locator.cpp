#include "process_locator.hpp"

#include <signal.h>

#include <map>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace stackctl::lifecycle {

using stackctl::model::ProcessHandle;
using stackctl::observability::IntField;
using stackctl::observability::StringField;
using stackctl::process::SignalResult;
using stackctl::runtime::config::ProcessPattern;

ProcessLocator::ProcessLocator(stackctl::process::ProcessTablePtr table, std::vector<ProcessPattern> patterns)
    : table_(std::move(table)),
      patterns_(std::move(patterns)) {
  for (const auto& pattern : patterns_) {
    if (pattern.pattern().empty()) {
      throw std::invalid_argument("process pattern must not be empty");
    }
  }
}

bool ProcessLocator::Matches(const ProcessPattern& pattern, std::string_view command_line) {
  if (command_line.find(pattern.pattern()) == std::string_view::npos) {
    return false;
  }
  return pattern.also_contains().empty() || command_line.find(pattern.also_contains()) != std::string_view::npos;
}

std::vector<ProcessHandle> ProcessLocator::Scan() const {
  std::vector<ProcessHandle> matched;
  for (auto& entry : table_->ListProcesses()) {
    for (const auto& pattern : patterns_) {
      if (Matches(pattern, entry.command_line)) {
        ProcessHandle handle;
        handle.pid          = entry.pid;
        handle.command_line = std::move(entry.command_line);
        handle.category     = pattern.category();
        matched.push_back(std::move(handle));
        break;
      }
    }
  }
  return matched;
}

LocateResult ProcessLocator::TerminateMatches() {
  LocateResult result;
  result.matched = Scan();

  if (result.matched.empty()) {
    STACKCTL_LOG_INFO("No application processes found");
    return result;
  }

  std::map<std::string, std::size_t> per_category;
  for (const auto& handle : result.matched) {
    switch (table_->Signal(handle.pid, SIGTERM)) {
      case SignalResult::kDelivered:
        ++result.signaled;
        ++per_category[stackctl::model::CategoryName(handle.category)];
        break;
      case SignalResult::kGone:
        ++result.gone;
        STACKCTL_LOG_WARN("Process exited before it could be signaled", {IntField("pid", handle.pid)});
        break;
      case SignalResult::kDenied:
        ++result.denied;
        STACKCTL_LOG_WARN("Not permitted to signal process",
                          {IntField("pid", handle.pid), StringField("command", handle.command_line)});
        break;
    }
  }

  for (const auto& [category, count] : per_category) {
    STACKCTL_LOG_SUCCESS("Sent SIGTERM", {StringField("category", category), IntField("count", static_cast<std::int64_t>(count))});
  }
  return result;
}

} // namespace stackctl::lifecycle
