#include "voxhub/session_auth.hpp"

#include "voxhub/log.hpp"

#include <iostream>

// Fix libpqxx ABI mismatch on Ubuntu 24.04 by hiding std::source_location symbols
#ifndef PQXX_HIDE_SOURCE_LOCATION
#define PQXX_HIDE_SOURCE_LOCATION
#endif
#include <pqxx/pqxx>

namespace voxhub {

PgSessionValidator::PgSessionValidator(std::unique_ptr<pqxx::connection> conn)
    : conn_(std::move(conn)) {
  conn_->prepare(
      "session_select_valid",
      "SELECT s.user_id, u.username FROM sessions s "
      "JOIN users u ON u.id = s.user_id "
      "WHERE s.token=$1 AND s.expires_at > now()");
}

PgSessionValidator::~PgSessionValidator() = default;

std::unique_ptr<PgSessionValidator>
PgSessionValidator::connect(const std::string &conninfo) {
  if (conninfo.empty()) {
    std::cerr << "[" << now_stamp()
              << "] [pg] disabled (env not set); every upgrade will be "
                 "rejected\n";
    return nullptr;
  }
  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo);
    if (!conn->is_open()) {
      std::cerr << "[" << now_stamp() << "] [pg] disabled (not open)\n";
      return nullptr;
    }
    std::cerr << "[" << now_stamp() << "] [pg] connected\n";
    return std::make_unique<PgSessionValidator>(std::move(conn));
  } catch (const std::exception &ex) {
    std::cerr << "[" << now_stamp() << "] [pg] disabled: " << ex.what()
              << "\n";
    return nullptr;
  }
}

std::optional<Identity> PgSessionValidator::validate(const std::string &token) {
  if (token.empty())
    return std::nullopt;
  std::scoped_lock lk(mu_);
  try {
    pqxx::work tx{*conn_};
    auto r = tx.exec_prepared("session_select_valid", token);
    if (r.empty())
      return std::nullopt;
    Identity id{r[0]["user_id"].c_str(), r[0]["username"].c_str()};
    tx.commit();
    return id;
  } catch (const pqxx::failure &ex) {
    std::cerr << "[" << now_stamp() << "] [pg] session lookup failed: "
              << ex.what() << "\n";
    return std::nullopt;
  }
}

} // namespace voxhub
