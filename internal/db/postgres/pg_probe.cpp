#include "pg_probe.hpp"

#include <stdexcept>

#if STACKCTL_DB_POSTGRES
#include <pqxx/pqxx>
#endif

namespace stackctl::db::postgres {

namespace {

std::string Quote(const std::string& value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\'' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

} // namespace

std::string ConnInfo(const stackctl::runtime::config::ServerBackendConfig& cfg) {
  std::string conninfo = "host=" + Quote(cfg.host()) + " port=" + std::to_string(cfg.port());
  if (!cfg.user().empty()) {
    conninfo += " user=" + Quote(cfg.user());
  }
  if (!cfg.database().empty()) {
    conninfo += " dbname=" + Quote(cfg.database());
  }
  return conninfo;
}

std::string ServerVersion(const stackctl::runtime::config::ServerBackendConfig& cfg) {
#if STACKCTL_DB_POSTGRES
  pqxx::connection    conn(ConnInfo(cfg));
  pqxx::nontransaction tx(conn);
  pqxx::result         rows = tx.exec("SHOW server_version");
  return rows.at(0).at(0).as<std::string>();
#else
  (void)cfg;
  throw std::runtime_error("postgres connectivity check requested but not enabled at build time");
#endif
}

} // namespace stackctl::db::postgres
