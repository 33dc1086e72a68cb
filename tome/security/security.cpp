#include "security/security.hpp"
#include <fmt/core.h>
#include <names/names.hpp>
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <vector>

namespace tome::security {

namespace {

using bytes_t = std::vector<unsigned char>;

std::string to_hex(const bytes_t &bytes) {
  std::string hex;
  hex.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    hex += fmt::format("{:02x}", byte);
  }
  return hex;
}

std::optional<bytes_t> from_hex(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }

  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
      return c - 'A' + 10;
    }
    return -1;
  };

  bytes_t bytes;
  bytes.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    int high = nibble(hex[i]);
    int low = nibble(hex[i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    bytes.push_back(static_cast<unsigned char>((high << 4) | low));
  }
  return bytes;
}

std::optional<bytes_t> derive(const std::string &password,
                              const bytes_t &salt) {
  bytes_t key(HASH_BYTES);
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                        salt.data(), static_cast<int>(salt.size()),
                        PBKDF2_ITERATIONS, EVP_sha256(),
                        static_cast<int>(key.size()), key.data()) != 1) {
    return std::nullopt;
  }
  return key;
}

} // namespace

result_c<credential_s> make_credential(const std::string &password) {
  bytes_t salt(SALT_BYTES);
  if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
    return result_c<credential_s>::fail(error_e::SECURITY,
                                        "unable to generate a salt");
  }

  auto key = derive(password, salt);
  if (!key.has_value()) {
    return result_c<credential_s>::fail(error_e::SECURITY,
                                        "unable to hash the password");
  }
  return credential_s{to_hex(salt), to_hex(*key)};
}

bool matches(const credential_s &credential, const std::string &password) {
  auto salt = from_hex(credential.salt);
  auto expected = from_hex(credential.hash);
  if (!salt.has_value() || !expected.has_value() ||
      expected->size() != HASH_BYTES) {
    return false;
  }

  auto actual = derive(password, *salt);
  if (!actual.has_value()) {
    return false;
  }
  return CRYPTO_memcmp(actual->data(), expected->data(), HASH_BYTES) == 0;
}

std::string encode(const credential_s &credential) {
  nlohmann::json data = {{"salt", credential.salt},
                         {"hash", credential.hash}};
  return data.dump();
}

std::optional<credential_s> decode(const std::string &data) {
  try {
    auto parsed = nlohmann::json::parse(data);
    return credential_s{parsed.at("salt").get<std::string>(),
                        parsed.at("hash").get<std::string>()};
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

status_c create_credentials(kvds::store_if &store, const std::string &user_id,
                            const std::string &password,
                            spdlog::logger &logger) {
  if (user_id.empty() || password.empty()) {
    return status_c::fail(error_e::SECURITY,
                          "user id and password cannot be empty");
  }

  auto map = store.open_map(names::USER_MAP);
  if (map.is_error()) {
    return map.status();
  }

  auto credential = make_credential(password);
  if (credential.is_error()) {
    return credential.status();
  }

  if (!map.value()->set(user_id, encode(credential.value()))) {
    return status_c::fail(
        error_e::STORE_FAILURE,
        fmt::format("unable to store credentials for '{}'", user_id));
  }

  logger.info("[security] credentials created for '{}'", user_id);
  return store.commit();
}

bool validate_user_password(kvds::store_if &store, const std::string &user_id,
                            const std::string &password,
                            spdlog::logger &logger) {
  const bool secured = store.has_map(names::USER_MAP);

  if (user_id.empty() && password.empty()) {
    if (secured) {
      logger.error("[security] store is secured, credentials required");
      return false;
    }
    return true;
  }

  if (user_id.empty() || password.empty()) {
    logger.error("[security] user id and password must both be provided");
    return false;
  }

  if (!secured) {
    logger.error("[security] store has no stored credentials");
    return false;
  }

  auto map = store.open_map(names::USER_MAP);
  if (map.is_error()) {
    logger.error("[security] cannot read credentials: {}",
                 map.error().message);
    return false;
  }

  std::string data;
  if (!map.value()->get(user_id, data)) {
    logger.error("[security] user id or password is invalid");
    return false;
  }

  auto credential = decode(data);
  if (!credential.has_value()) {
    logger.error("[security] stored credential for '{}' is corrupt", user_id);
    return false;
  }

  if (!matches(*credential, password)) {
    logger.error("[security] user id or password is invalid");
    return false;
  }
  return true;
}

} // namespace tome::security
