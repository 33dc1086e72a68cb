#include "names/names.hpp"
#include <fmt/core.h>
#include <type_traits>

namespace tome::names {

namespace {

bool contains(const std::string &haystack, const char *needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string prefixed(const char *prefix) {
  return std::string(prefix) + INTERNAL_NAME_SEPARATOR;
}

bool is_index_owner(const std::string &name) {
  return is_valid_collection_name(name) || is_repository_store(name);
}

} // namespace

std::string encode(const map_entry_t &entry) {
  return std::visit(
      [](const auto &e) -> std::string {
        using entry_t = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<entry_t, plain_collection_s>) {
          return e.name;
        } else if constexpr (std::is_same_v<entry_t, repository_store_s>) {
          return repository_store_name(e.type_name);
        } else if constexpr (std::is_same_v<entry_t, index_meta_s>) {
          return prefixed(INDEX_META_PREFIX) + e.collection;
        } else if constexpr (std::is_same_v<entry_t, index_store_s>) {
          return prefixed(INDEX_PREFIX) + e.collection +
                 INTERNAL_NAME_SEPARATOR + e.field;
        } else {
          return std::string(USER_MAP);
        }
      },
      entry);
}

std::optional<map_entry_t> decode(const std::string &map_name) {
  if (map_name == USER_MAP) {
    return user_map_s{};
  }

  const std::string meta_prefix = prefixed(INDEX_META_PREFIX);
  if (map_name.starts_with(meta_prefix)) {
    std::string owner = map_name.substr(meta_prefix.size());
    if (!is_index_owner(owner)) {
      return std::nullopt;
    }
    return index_meta_s{owner};
  }

  const std::string index_prefix = prefixed(INDEX_PREFIX);
  if (map_name.starts_with(index_prefix)) {
    std::string remainder = map_name.substr(index_prefix.size());
    auto split = remainder.find(INTERNAL_NAME_SEPARATOR);
    if (split == std::string::npos) {
      return std::nullopt;
    }
    std::string owner = remainder.substr(0, split);
    std::string field = remainder.substr(split + 1);
    if (!is_index_owner(owner) || field.empty() ||
        contains(field, INTERNAL_NAME_SEPARATOR)) {
      return std::nullopt;
    }
    return index_store_s{owner, field};
  }

  if (auto type_name = repository_type_name(map_name)) {
    return repository_store_s{*type_name};
  }

  if (is_valid_collection_name(map_name)) {
    return plain_collection_s{map_name};
  }

  return std::nullopt;
}

status_c validate_collection_name(const std::string &name) {
  if (name.empty()) {
    return status_c::fail(error_e::INVALID_NAME,
                          "collection name cannot be empty");
  }
  if (contains(name, INTERNAL_NAME_SEPARATOR)) {
    return status_c::fail(
        error_e::INVALID_NAME,
        fmt::format("collection name '{}' cannot contain '{}'", name,
                    INTERNAL_NAME_SEPARATOR));
  }
  if (contains(name, USER_MAP)) {
    return status_c::fail(error_e::INVALID_NAME,
                          fmt::format("collection name '{}' cannot contain "
                                      "the reserved name '{}'",
                                      name, USER_MAP));
  }
  if (contains(name, INDEX_META_PREFIX) || contains(name, INDEX_PREFIX)) {
    return status_c::fail(error_e::INVALID_NAME,
                          fmt::format("collection name '{}' cannot contain "
                                      "the reserved index prefix '{}'",
                                      name, INDEX_PREFIX));
  }
  if (contains(name, OBJECT_STORE_NAME_SEPARATOR)) {
    return status_c::fail(
        error_e::INVALID_NAME,
        fmt::format("collection name '{}' cannot contain '{}'", name,
                    OBJECT_STORE_NAME_SEPARATOR));
  }
  return status_c::ok();
}

bool is_valid_collection_name(const std::string &name) {
  return validate_collection_name(name).is_success();
}

status_c validate_type_name(const std::string &type_name) {
  if (type_name.empty()) {
    return status_c::fail(error_e::INVALID_NAME, "type name cannot be empty");
  }
  if (contains(type_name, INTERNAL_NAME_SEPARATOR) ||
      contains(type_name, USER_MAP) || contains(type_name, INDEX_PREFIX)) {
    return status_c::fail(
        error_e::INVALID_NAME,
        fmt::format("type name '{}' contains a reserved token", type_name));
  }
  if (type_name.ends_with(OBJECT_STORE_NAME_SEPARATOR)) {
    return status_c::fail(
        error_e::INVALID_NAME,
        fmt::format("type name '{}' cannot end with '{}'", type_name,
                    OBJECT_STORE_NAME_SEPARATOR));
  }
  return status_c::ok();
}

std::string repository_store_name(const std::string &type_name) {
  return type_name + OBJECT_STORE_NAME_SEPARATOR;
}

bool is_repository_store(const std::string &map_name) {
  return repository_type_name(map_name).has_value();
}

std::optional<std::string>
repository_type_name(const std::string &map_name) {
  if (!map_name.ends_with(OBJECT_STORE_NAME_SEPARATOR)) {
    return std::nullopt;
  }
  std::string type_name = map_name.substr(
      0, map_name.size() - std::char_traits<char>::length(
                               OBJECT_STORE_NAME_SEPARATOR));
  if (validate_type_name(type_name).is_error()) {
    return std::nullopt;
  }
  return type_name;
}

} // namespace tome::names
