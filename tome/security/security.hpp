#pragma once

#include <errors/errors.hpp>
#include <kvds/kvds.hpp>
#include <spdlog/spdlog.h>
#include <optional>
#include <string>

namespace tome::security {

constexpr int PBKDF2_ITERATIONS = 10000;
constexpr std::size_t HASH_BYTES = 32;
constexpr std::size_t SALT_BYTES = 24;

struct credential_s {
  std::string salt;
  std::string hash;
};

//! \brief Salts and hashes the password (PBKDF2-HMAC-SHA256)
extern result_c<credential_s> make_credential(const std::string &password);
extern bool matches(const credential_s &credential,
                    const std::string &password);

extern std::string encode(const credential_s &credential);
extern std::optional<credential_s> decode(const std::string &data);

//! \brief Stores the user's credential in the user map and commits
extern status_c create_credentials(kvds::store_if &store,
                                   const std::string &user_id,
                                   const std::string &password,
                                   spdlog::logger &logger);

/*
  An unsecured store (no user map) only accepts an empty user id and
  password. A secured store accepts the stored user id with its password.
*/
extern bool validate_user_password(kvds::store_if &store,
                                   const std::string &user_id,
                                   const std::string &password,
                                   spdlog::logger &logger);

} // namespace tome::security
