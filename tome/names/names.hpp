/*

  Layout of the backing store namespace. Every named map in a store belongs
  to exactly one region:

  - plain collection    : <name>
  - repository store    : <type_name>:
  - index metadata      : $tome_index_meta|<collection>
  - index storage       : $tome_index|<collection>|<field>
  - user credentials    : $tome_users

  The token values are persisted in existing stores and must not change.
*/

#pragma once

#include <errors/errors.hpp>
#include <optional>
#include <string>
#include <variant>

namespace tome::names {

constexpr const char *INTERNAL_NAME_SEPARATOR = "|";
constexpr const char *USER_MAP = "$tome_users";
constexpr const char *INDEX_META_PREFIX = "$tome_index_meta";
constexpr const char *INDEX_PREFIX = "$tome_index";
constexpr const char *OBJECT_STORE_NAME_SEPARATOR = ":";

struct plain_collection_s {
  std::string name;
};

struct repository_store_s {
  std::string type_name;
};

struct index_meta_s {
  std::string collection;
};

struct index_store_s {
  std::string collection;
  std::string field;
};

struct user_map_s {};

using map_entry_t = std::variant<plain_collection_s, repository_store_s,
                                 index_meta_s, index_store_s, user_map_s>;

//! \brief Map name for an entry. Callers are expected to hold valid
//!        component names (see validate_*)
extern std::string encode(const map_entry_t &entry);

//! \brief Region a map name belongs to, nothing when the name is not
//!        part of any region
extern std::optional<map_entry_t> decode(const std::string &map_name);

extern status_c validate_collection_name(const std::string &name);
extern bool is_valid_collection_name(const std::string &name);

extern status_c validate_type_name(const std::string &type_name);

extern std::string repository_store_name(const std::string &type_name);
extern bool is_repository_store(const std::string &map_name);

//! \brief Type name embedded in a repository store name
extern std::optional<std::string>
repository_type_name(const std::string &map_name);

} // namespace tome::names
