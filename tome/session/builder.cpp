#include "session/builder.hpp"
#include <kvds/datastore.hpp>
#include <kvds/memstore.hpp>
#include <security/security.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tome::session {

namespace {

constexpr const char *DEFAULT_LOGGER_NAME = "tome";

//! \brief Releases a store that failed to become a session
status_c abandon(kvds::store_if &store, const status_c &reason,
                 spdlog::logger &logger) {
  auto closed = store.close();
  if (closed.is_error() && !closed.is(error_e::WRITE_CAPABILITY)) {
    logger.error("[session_builder_c] error while closing store: {}",
                 closed.error().message);
  }
  logger.error("[session_builder_c] cannot open session: {}",
               reason.error().message);
  return reason;
}

} // namespace

session_builder_c &session_builder_c::file_path(const std::string &path) {
  file_path_ = path;
  return *this;
}

session_builder_c &session_builder_c::read_only(bool value) {
  read_only_ = value;
  return *this;
}

session_builder_c &session_builder_c::auto_compact(bool value) {
  auto_compact_ = value;
  return *this;
}

session_builder_c &session_builder_c::auto_commit(bool value) {
  auto_commit_ = value;
  return *this;
}

session_builder_c &session_builder_c::auto_commit_buffer_size(std::size_t size) {
  auto_commit_buffer_size_ =
      size == 0 ? config::DEFAULT_AUTO_COMMIT_BUFFER_SIZE : size;
  return *this;
}

session_builder_c &
session_builder_c::logger(std::shared_ptr<spdlog::logger> logger) {
  logger_ = std::move(logger);
  return *this;
}

session_builder_c &
session_builder_c::with_config(const config::config_c &config) {
  auto path = config.get_store_path();
  if (path.has_value()) {
    file_path_ = *path;
  }
  read_only_ = config.get_read_only();
  auto_compact_ = config.get_auto_compact();
  auto_commit_ = config.get_auto_commit();
  auto_commit_buffer_size_ = config.get_auto_commit_buffer_size();
  return *this;
}

std::shared_ptr<spdlog::logger> session_builder_c::resolve_logger() {
  if (logger_) {
    return logger_;
  }
  auto logger = spdlog::get(DEFAULT_LOGGER_NAME);
  if (!logger) {
    logger = spdlog::stdout_color_mt(DEFAULT_LOGGER_NAME);
  }
  return logger;
}

result_c<std::unique_ptr<kvds::store_if>>
session_builder_c::open_store(std::shared_ptr<spdlog::logger> logger) {
  if (!file_path_.has_value() || file_path_->empty()) {
    logger->info("[session_builder_c] opening in-memory store");
    return std::unique_ptr<kvds::store_if>(
        std::make_unique<kvds::memstore_c>(read_only_));
  }

  auto store = std::make_unique<kvds::datastore_c>(logger);
  kvds::datastore_c::options_s options;
  options.read_only = read_only_;
  options.auto_commit = auto_commit_;
  options.auto_commit_buffer_size = auto_commit_buffer_size_;

  auto opened = store->open(*file_path_, options);
  if (opened.is_error()) {
    logger->error("[session_builder_c] cannot open store '{}': {}",
                  *file_path_, opened.error().message);
    return opened;
  }
  logger->info("[session_builder_c] opened store '{}'{}", *file_path_,
               read_only_ ? " (read-only)" : "");
  return std::unique_ptr<kvds::store_if>(std::move(store));
}

result_c<session_ptr> session_builder_c::open_or_create() {
  return open_or_create("", "");
}

result_c<session_ptr>
session_builder_c::open_or_create(const std::string &user_id,
                                  const std::string &password) {
  auto logger = resolve_logger();

  auto opened = open_store(logger);
  if (opened.is_error()) {
    return opened.status();
  }
  auto store = opened.take();

  const bool secured = store->has_map(names::USER_MAP);
  const bool anonymous = user_id.empty() && password.empty();

  if (anonymous && secured) {
    return abandon(*store,
                   status_c::fail(error_e::SECURITY,
                                  "store is secured, credentials required"),
                   *logger);
  }

  if (!anonymous) {
    if (user_id.empty() || password.empty()) {
      return abandon(
          *store,
          status_c::fail(error_e::SECURITY,
                         "user id and password must both be provided"),
          *logger);
    }

    if (secured) {
      if (!security::validate_user_password(*store, user_id, password,
                                            *logger)) {
        return abandon(*store,
                       status_c::fail(error_e::SECURITY,
                                      "user id or password is invalid"),
                       *logger);
      }
    } else {
      if (read_only_) {
        return abandon(
            *store,
            status_c::fail(error_e::WRITE_CAPABILITY,
                           "cannot store credentials in a read-only store"),
            *logger);
      }
      auto created =
          security::create_credentials(*store, user_id, password, *logger);
      if (created.is_error()) {
        return abandon(*store, created, *logger);
      }
    }
  }

  auto context = std::make_unique<context::context_c>(read_only_,
                                                       auto_compact_, logger);
  return std::make_unique<session_c>(std::move(store), std::move(context));
}

} // namespace tome::session
