#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace tome::doc {

using json = nlohmann::json;
using doc_id_t = std::uint64_t;

//! \brief Field holding a document's id inside the stored document
constexpr const char *DOC_ID_FIELD = "_id";

//! \brief Process wide, strictly increasing and seeded from the wall clock
//!        so that ids keep increasing across restarts
extern doc_id_t next_doc_id();

//! \brief Map key for an id. Fixed width so key order matches id order
extern std::string to_key(doc_id_t id);
extern std::optional<doc_id_t> from_key(const std::string &key);

extern std::optional<doc_id_t> id_of(const json &document);

} // namespace tome::doc
