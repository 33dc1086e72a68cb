#include "doc/collection.hpp"
#include <fmt/core.h>
#include <utility>

namespace tome::doc {

collection_c::collection_c(const std::string &name, kvds::kv_t map,
                           std::shared_ptr<spdlog::logger> logger)
    : name_(name), map_(std::move(map)), logger_(std::move(logger)) {}

const std::string &collection_c::get_name() const { return name_; }

status_c collection_c::check_writable(const char *operation) const {
  if (is_closed()) {
    return status_c::fail(
        error_e::COLLECTION_CLOSED,
        fmt::format("cannot {} on closed collection '{}'", operation, name_));
  }
  if (map_->is_read_only()) {
    return status_c::fail(
        error_e::WRITE_CAPABILITY,
        fmt::format("cannot {} on read-only collection '{}'", operation,
                    name_));
  }
  return status_c::ok();
}

std::optional<json> collection_c::decode(const std::string &key,
                                         const std::string &value) const {
  try {
    return json::parse(value);
  } catch (const json::exception &e) {
    logger_->error("[{}] document {} is unreadable: {}", name_, key,
                   e.what());
  }
  return std::nullopt;
}

result_c<doc_id_t> collection_c::insert(json document) {
  auto writable = check_writable("insert");
  if (writable.is_error()) {
    return result_c<doc_id_t>(writable);
  }
  if (!document.is_object()) {
    return result_c<doc_id_t>::fail(
        error_e::VALIDATION,
        fmt::format("collection '{}' only accepts JSON objects", name_));
  }

  doc_id_t id = next_doc_id();
  document[DOC_ID_FIELD] = id;

  if (!map_->set_nx(to_key(id), document.dump())) {
    return result_c<doc_id_t>::fail(
        error_e::STORE_FAILURE,
        fmt::format("failed to insert into collection '{}'", name_));
  }
  return id;
}

status_c collection_c::update(doc_id_t id, json document) {
  auto writable = check_writable("update");
  if (writable.is_error()) {
    return writable;
  }
  if (!document.is_object()) {
    return status_c::fail(
        error_e::VALIDATION,
        fmt::format("collection '{}' only accepts JSON objects", name_));
  }

  std::string key = to_key(id);
  if (!map_->exists(key)) {
    return status_c::fail(
        error_e::NOT_FOUND,
        fmt::format("document {} not found in '{}'", id, name_));
  }

  document[DOC_ID_FIELD] = id;
  if (!map_->set(key, document.dump())) {
    return status_c::fail(
        error_e::STORE_FAILURE,
        fmt::format("failed to update document {} in '{}'", id, name_));
  }
  return status_c::ok();
}

status_c collection_c::remove(doc_id_t id) {
  auto writable = check_writable("remove");
  if (writable.is_error()) {
    return writable;
  }

  std::string key = to_key(id);
  if (!map_->exists(key)) {
    return status_c::fail(
        error_e::NOT_FOUND,
        fmt::format("document {} not found in '{}'", id, name_));
  }
  if (!map_->del(key)) {
    return status_c::fail(
        error_e::STORE_FAILURE,
        fmt::format("failed to remove document {} from '{}'", id, name_));
  }
  return status_c::ok();
}

std::optional<json> collection_c::get_by_id(doc_id_t id) const {
  if (is_closed()) {
    return std::nullopt;
  }

  std::string key = to_key(id);
  std::string value;
  if (!map_->get(key, value)) {
    return std::nullopt;
  }
  return decode(key, value);
}

void collection_c::for_each(
    std::function<bool(doc_id_t id, const json &document)> callback) const {
  if (is_closed()) {
    return;
  }

  // callbacks run after the map lock is released
  std::vector<std::pair<std::string, std::string>> entries;
  map_->iterate("", [&entries](const std::string &key,
                               const std::string &value) {
    entries.emplace_back(key, value);
    return true;
  });

  for (const auto &[key, value] : entries) {
    auto id = from_key(key);
    if (!id.has_value()) {
      logger_->warn("[{}] skipping foreign key '{}'", name_, key);
      continue;
    }
    auto document = decode(key, value);
    if (!document.has_value()) {
      continue;
    }
    if (!callback(*id, *document)) {
      break;
    }
  }
}

std::vector<json> collection_c::find_all() const {
  std::vector<json> documents;
  for_each([&documents](doc_id_t, const json &document) {
    documents.push_back(document);
    return true;
  });
  return documents;
}

std::size_t collection_c::size() const {
  if (is_closed()) {
    return 0;
  }
  return map_->size();
}

status_c collection_c::drop() {
  auto writable = check_writable("drop");
  if (writable.is_error()) {
    return writable;
  }

  if (!map_->drop()) {
    return status_c::fail(
        error_e::STORE_FAILURE,
        fmt::format("failed to drop collection '{}'", name_));
  }
  dropped_ = true;
  closed_ = true;
  logger_->debug("[{}] dropped", name_);
  return status_c::ok();
}

status_c collection_c::close() {
  if (closed_.exchange(true)) {
    return status_c::fail(
        error_e::COLLECTION_CLOSED,
        fmt::format("collection '{}' is already closed", name_));
  }
  return status_c::ok();
}

bool collection_c::is_closed() const { return closed_ || !map_->is_open(); }

bool collection_c::is_dropped() const { return dropped_; }

} // namespace tome::doc
