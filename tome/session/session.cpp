#include "session/session.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <security/security.hpp>

namespace tome::session {

namespace {

void append_unique(std::vector<std::string> &names, const std::string &name) {
  if (std::find(names.begin(), names.end(), name) == names.end()) {
    names.push_back(name);
  }
}

//! \brief Runs one close step, turning anything it throws into a failure
template <typename Step> status_c guarded(const char *step, Step &&run) {
  try {
    return run();
  } catch (const std::exception &e) {
    return status_c::fail(error_e::STORE_FAILURE,
                          fmt::format("{} threw: {}", step, e.what()));
  } catch (...) {
    return status_c::fail(error_e::STORE_FAILURE,
                          fmt::format("{} threw an unknown exception", step));
  }
}

} // namespace

session_c::session_c(std::unique_ptr<kvds::store_if> store,
                     std::unique_ptr<context::context_c> context)
    : store_(std::move(store)), context_(std::move(context)),
      logger_(context_->get_logger()),
      policy_(context_->get_logger(), context_->is_read_only()) {}

session_c::~session_c() {
  if (is_closed()) {
    return;
  }
  auto status = close();
  if (status.is_error()) {
    logger_->error("[{}] close on destruction failed: {}", name_,
                   status.error().message);
  }
}

result_c<doc::collection_t>
session_c::get_collection(const std::string &name) {
  auto valid = names::validate_collection_name(name);
  if (valid.is_error()) {
    return valid;
  }
  if (is_closed()) {
    return policy_.report_closed("get_collection");
  }

  auto map = store_->open_map(name);
  if (map.is_error()) {
    return map.status();
  }
  return doc::open_collection(map.take(), *context_);
}

result_c<doc::collection_t>
session_c::repository_collection(const std::string &type_name) {
  auto existing = context_->find_repository(type_name);
  if (existing) {
    return existing->document_collection();
  }

  const std::string store_name = names::repository_store_name(type_name);
  auto map = store_->open_map(store_name);
  if (map.is_error()) {
    return map.status();
  }
  return std::make_shared<doc::collection_c>(store_name, map.take(), logger_);
}

std::vector<std::string> session_c::list_collection_names() const {
  std::vector<std::string> collection_names;
  if (is_closed()) {
    policy_.report_closed("list_collection_names");
    return collection_names;
  }

  for (const auto &map_name : store_->get_map_names()) {
    auto entry = names::decode(map_name);
    if (!entry.has_value()) {
      continue;
    }
    if (auto *plain = std::get_if<names::plain_collection_s>(&*entry)) {
      append_unique(collection_names, plain->name);
    }
  }
  return collection_names;
}

std::vector<std::string> session_c::list_repositories() const {
  std::vector<std::string> type_names;
  if (is_closed()) {
    policy_.report_closed("list_repositories");
    return type_names;
  }

  for (const auto &map_name : store_->get_map_names()) {
    if (map_name == names::USER_MAP ||
        map_name.find(names::INTERNAL_NAME_SEPARATOR) != std::string::npos) {
      continue;
    }
    auto entry = names::decode(map_name);
    if (!entry.has_value()) {
      continue;
    }
    if (auto *store = std::get_if<names::repository_store_s>(&*entry)) {
      append_unique(type_names, store->type_name);
    }
  }
  return type_names;
}

bool session_c::has_collection(const std::string &name) const {
  auto collection_names = list_collection_names();
  return std::find(collection_names.begin(), collection_names.end(), name) !=
         collection_names.end();
}

bool session_c::has_repository(const std::string &type_name) const {
  auto type_names = list_repositories();
  return std::find(type_names.begin(), type_names.end(), type_name) !=
         type_names.end();
}

bool session_c::has_unsaved_changes() const {
  if (is_closed()) {
    return false;
  }
  return store_->has_unsaved_changes();
}

status_c session_c::compact() {
  if (is_closed()) {
    return policy_.report_closed("compact");
  }
  if (context_->is_read_only()) {
    return policy_.skip("compact", "session is read-only");
  }
  return store_->compact_move_chunks();
}

status_c session_c::commit() {
  if (is_closed()) {
    return policy_.report_closed("commit");
  }
  if (context_->is_read_only()) {
    return policy_.skip("commit", "session is read-only");
  }
  return store_->commit();
}

void session_c::close_registered() {
  for (const auto &repository : context_->registered_repositories()) {
    const std::string item =
        fmt::format("repository '{}'", repository->get_type_name());
    try {
      if (!repository->is_closed()) {
        policy_.isolate(item, repository->close());
      }
    } catch (const std::exception &e) {
      policy_.isolate(item, e);
    } catch (...) {
      policy_.isolate(item, status_c::fail(error_e::STORE_FAILURE,
                                           "unknown exception"));
    }
  }

  for (const auto &collection : context_->registered_collections()) {
    const std::string item =
        fmt::format("collection '{}'", collection->get_name());
    try {
      if (!collection->is_closed()) {
        policy_.isolate(item, collection->close());
      }
    } catch (const std::exception &e) {
      policy_.isolate(item, e);
    } catch (...) {
      policy_.isolate(item, status_c::fail(error_e::STORE_FAILURE,
                                           "unknown exception"));
    }
  }
}

status_c session_c::close() {
  if (is_closed() || closing_.exchange(true)) {
    return policy_.report_closed("close");
  }
  logger_->info("[{}] closing session", name_);

  status_c result = status_c::ok();
  auto keep = [&](const status_c &status) {
    auto resolved = policy_.resolve_close(status);
    if (resolved.is_error() && result.is_success()) {
      result = resolved;
    }
  };

  keep(guarded("commit", [this] {
    return store_->has_unsaved_changes() ? store_->commit() : status_c::ok();
  }));

  if (!context_->is_auto_compact_enabled()) {
    policy_.skip("compact on close", "auto compact is disabled");
  } else if (context_->is_read_only()) {
    policy_.skip("compact on close", "session is read-only");
  } else {
    keep(guarded("compact", [this] { return store_->compact_move_chunks(); }));
  }

  keep(guarded("context shutdown", [this] {
    close_registered();
    context_->clear_registry();
    context_->shutdown();
    return status_c::ok();
  }));

  // every earlier step is guarded, the store is always released
  keep(guarded("store close", [this] { return store_->close(); }));
  store_.reset();

  if (result.is_success()) {
    logger_->info("[{}] session closed", name_);
  }
  return result;
}

status_c session_c::close_immediately() {
  if (is_closed() || closing_.exchange(true)) {
    return policy_.report_closed("close_immediately");
  }
  logger_->warn("[{}] closing session without committing", name_);

  auto shutdown = guarded("context shutdown", [this] {
    context_->shutdown();
    return status_c::ok();
  });
  if (shutdown.is_error()) {
    logger_->error("[{}] {}", name_, shutdown.error().message);
  }
  auto status = guarded("store close",
                        [this] { return store_->close_immediately(); });
  store_.reset();
  return policy_.resolve_abort(status);
}

bool session_c::is_closed() const { return !store_ || store_->is_closed(); }

bool session_c::validate_user(const std::string &user_id,
                              const std::string &password) const {
  if (is_closed()) {
    policy_.report_closed("validate_user");
    return false;
  }
  return security::validate_user_password(*store_, user_id, password,
                                          *logger_);
}

context::context_c &session_c::get_context() const { return *context_; }

} // namespace tome::session
