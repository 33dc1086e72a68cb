#include "session/policy.hpp"
#include <fmt/core.h>

namespace tome::session {

policy_c::policy_c(std::shared_ptr<spdlog::logger> logger, bool read_only)
    : logger_(std::move(logger)), read_only_(read_only) {}

status_c policy_c::report_closed(const char *operation) const {
  logger_->error("[{}] {}: underlying store is closed", name_, operation);
  return status_c::fail(error_e::SESSION_CLOSED,
                        fmt::format("{}: session is closed", operation));
}

status_c policy_c::skip(const char *operation, const char *reason) const {
  logger_->debug("[{}] {} skipped: {}", name_, operation, reason);
  return status_c::ok();
}

void policy_c::isolate(const std::string &item, const status_c &status) const {
  if (status.is_success()) {
    return;
  }
  logger_->error("[{}] error while closing {}: {}", name_, item,
                 status.error().message);
}

void policy_c::isolate(const std::string &item,
                       const std::exception &error) const {
  logger_->error("[{}] error while closing {}: {}", name_, item,
                 error.what());
}

status_c policy_c::resolve_close(const status_c &status) const {
  if (status.is_success()) {
    return status;
  }
  if (status.is(error_e::WRITE_CAPABILITY) && read_only_) {
    logger_->debug("[{}] ignoring write failure on read-only close: {}",
                   name_, status.error().message);
    return status_c::ok();
  }
  logger_->error("[{}] close failed: {}", name_, status.error().message);
  return status;
}

status_c policy_c::resolve_abort(const status_c &status) const {
  if (status.is_success()) {
    return status;
  }
  logger_->error("[{}] error while closing store: {}", name_,
                 status.error().message);
  if (status.is(error_e::WRITE_CAPABILITY) && !read_only_) {
    return status;
  }
  return status_c::ok();
}

} // namespace tome::session
