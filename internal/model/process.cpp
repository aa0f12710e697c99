#include "process.hpp"

namespace stackctl::model {

const char* CategoryName(PatternCategory category) {
  switch (category) {
    case stackctl::runtime::config::ProcessPattern::WEB:
      return "web";
    case stackctl::runtime::config::ProcessPattern::PIPELINE:
      return "pipeline";
    case stackctl::runtime::config::ProcessPattern::APP:
      return "app";
    default:
      return "generic";
  }
}

} // namespace stackctl::model
