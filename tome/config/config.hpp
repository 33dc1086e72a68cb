#pragma once

#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace tome::config {
using nlohmann::json;

constexpr bool DEFAULT_READ_ONLY = false;
constexpr bool DEFAULT_AUTO_COMPACT = true;
constexpr bool DEFAULT_AUTO_COMMIT = true;
constexpr uint64_t DEFAULT_AUTO_COMMIT_BUFFER_SIZE = 1024;

/*
  {
    "store": {
      "path": "/var/lib/app/db",
      "read_only": false,
      "auto_compact": true,
      "auto_commit": true,
      "auto_commit_buffer_size": 1024
    },
    "log": { "level": "info" }
  }
*/
class config_c {

public:
  std::optional<std::string> get_store_path() const;
  bool get_read_only() const;
  bool get_auto_compact() const;
  bool get_auto_commit() const;
  uint64_t get_auto_commit_buffer_size() const;
  spdlog::level::level_enum get_log_level() const;
  friend bool load_config(const std::string &path, config_c &config);
  friend bool parse_config(const std::string &source, config_c &config);

private:
  const json *store_section() const;
  bool get_store_flag(const char *name, bool fallback) const;

  json config_;
};

inline bool load_config(const std::string &path, config_c &config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return false;
  }
  try {
    file >> config.config_;
  } catch (const std::exception &) {
    return false;
  }
  return config.config_.is_object();
}

inline bool parse_config(const std::string &source, config_c &config) {
  try {
    config.config_ = json::parse(source);
  } catch (const std::exception &) {
    return false;
  }
  return config.config_.is_object();
}

inline const json *config_c::store_section() const {
  auto it_store = config_.find("store");
  if (it_store == config_.end() || !it_store->is_object()) {
    return nullptr;
  }
  return &(*it_store);
}

inline bool config_c::get_store_flag(const char *name, bool fallback) const {
  const json *store = store_section();
  if (!store) {
    return fallback;
  }
  auto it = store->find(name);
  if (it == store->end() || !it->is_boolean()) {
    return fallback;
  }
  return it->get<bool>();
}

inline std::optional<std::string> config_c::get_store_path() const {
  const json *store = store_section();
  if (!store) {
    return std::nullopt;
  }
  auto it = store->find("path");
  if (it == store->end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

inline bool config_c::get_read_only() const {
  return get_store_flag("read_only", DEFAULT_READ_ONLY);
}

inline bool config_c::get_auto_compact() const {
  return get_store_flag("auto_compact", DEFAULT_AUTO_COMPACT);
}

inline bool config_c::get_auto_commit() const {
  return get_store_flag("auto_commit", DEFAULT_AUTO_COMMIT);
}

inline uint64_t config_c::get_auto_commit_buffer_size() const {
  const json *store = store_section();
  if (!store) {
    return DEFAULT_AUTO_COMMIT_BUFFER_SIZE;
  }
  auto it = store->find("auto_commit_buffer_size");
  if (it == store->end() ||
      !(it->is_number_unsigned() || it->is_number_integer())) {
    return DEFAULT_AUTO_COMMIT_BUFFER_SIZE;
  }
  if (it->is_number_unsigned()) {
    auto v = it->get<uint64_t>();
    return v == 0 ? DEFAULT_AUTO_COMMIT_BUFFER_SIZE : v;
  }
  auto v = it->get<int64_t>();
  if (v <= 0) {
    return DEFAULT_AUTO_COMMIT_BUFFER_SIZE;
  }
  return static_cast<uint64_t>(v);
}

inline spdlog::level::level_enum config_c::get_log_level() const {
  auto it_log = config_.find("log");
  if (it_log == config_.end() || !it_log->is_object()) {
    return spdlog::level::info;
  }
  auto it = it_log->find("level");
  if (it == it_log->end() || !it->is_string()) {
    return spdlog::level::info;
  }
  auto level = spdlog::level::from_str(it->get<std::string>());
  if (level == spdlog::level::off && it->get<std::string>() != "off") {
    return spdlog::level::info;
  }
  return level;
}

} // namespace tome::config
