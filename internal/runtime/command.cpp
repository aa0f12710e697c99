#include "command.hpp"

#include <exception>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stackctl::runtime {

using stackctl::observability::StringField;

int RunCommand(const char* name, const CommandBody& body) {
  stackctl::observability::InitializeLogging();

  int code = kExitOk;
  try {
    auto config = stackctl::config::ConfigLoader::LoadFromEnvironment();
    stackctl::observability::InitializeLogging(config);

    STACKCTL_LOG_INFO(name);
    code = body(config);
  } catch (const util::PreconditionFailed& e) {
    STACKCTL_LOG_ERROR("Precondition failed", {StringField("command", name), StringField("error", e.what())});
    code = kExitPrecondition;
  } catch (const util::Unsupported& e) {
    STACKCTL_LOG_ERROR("Unsupported operation", {StringField("command", name), StringField("error", e.what())});
    code = kExitPrecondition;
  } catch (const util::ExportFailed& e) {
    STACKCTL_LOG_ERROR("Export failed", {StringField("command", name), StringField("error", e.what())});
    code = kExitPrecondition;
  } catch (const util::RestoreFailed& e) {
    STACKCTL_LOG_ERROR("Restore failed", {StringField("command", name), StringField("error", e.what())});
    code = kExitPrecondition;
  } catch (const util::InvalidConfig& e) {
    STACKCTL_LOG_ERROR("Invalid configuration", {StringField("command", name), StringField("error", e.what())});
    code = kExitPrecondition;
  } catch (const std::exception& e) {
    STACKCTL_LOG_ERROR("Fatal error", {StringField("command", name), StringField("error", e.what())});
    code = kExitUnexpected;
  }

  stackctl::observability::ShutdownLogging();
  return code;
}

} // namespace stackctl::runtime
