#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace pqxx {
class connection;
}

namespace voxhub {

struct Identity {
  std::string user_id;
  std::string username;
};

// Resolves a bearer/cookie token to the user it was issued to. Token issuance
// lives elsewhere; the server only checks.
class TokenValidator {
public:
  virtual ~TokenValidator() = default;
  virtual std::optional<Identity> validate(const std::string &token) = 0;
};

// Looks tokens up in the Postgres sessions table:
//   sessions(token TEXT PRIMARY KEY, user_id BIGINT, expires_at TIMESTAMPTZ)
//   users(id BIGSERIAL PRIMARY KEY, username TEXT)
// One connection, serialized by a mutex.
class PgSessionValidator : public TokenValidator {
public:
  explicit PgSessionValidator(std::unique_ptr<pqxx::connection> conn);
  ~PgSessionValidator() override;

  // nullptr when conninfo is empty or the server cannot be reached.
  static std::unique_ptr<PgSessionValidator> connect(const std::string &conninfo);

  std::optional<Identity> validate(const std::string &token) override;

private:
  std::unique_ptr<pqxx::connection> conn_;
  std::mutex mu_;
};

} // namespace voxhub
