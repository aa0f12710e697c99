#pragma once

#include <string>

#include "config/config.pb.h"

namespace stackctl::db::postgres {

/*
  libpq key/value connection string for the server backend.
  Password is left to PGPASSWORD / ~/.pgpass.
*/
std::string ConnInfo(const stackctl::runtime::config::ServerBackendConfig& cfg);

/*
  Connects, reads `SHOW server_version`, disconnects.
  Throws on connection or query failure.
*/
std::string ServerVersion(const stackctl::runtime::config::ServerBackendConfig& cfg);

} // namespace stackctl::db::postgres
