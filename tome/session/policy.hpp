#pragma once

#include <errors/errors.hpp>
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace tome::session {

/*
  Decides, in one place, which failures of the session facade are logged
  and swallowed and which are handed back to the caller.

  - closed session          : logged, reported as SESSION_CLOSED
  - skipped operation       : logged at debug, success
  - per-item close failure  : logged, never stops the close walk
  - graceful close failure  : WRITE_CAPABILITY swallowed on read-only
                              sessions, everything else returned
  - forced close failure    : logged; only WRITE_CAPABILITY on a writable
                              session is returned
*/
class policy_c {
public:
  policy_c(std::shared_ptr<spdlog::logger> logger, bool read_only);

  status_c report_closed(const char *operation) const;
  status_c skip(const char *operation, const char *reason) const;

  void isolate(const std::string &item, const status_c &status) const;
  void isolate(const std::string &item, const std::exception &error) const;

  status_c resolve_close(const status_c &status) const;
  status_c resolve_abort(const status_c &status) const;

private:
  const char *name_{"session_c"};
  std::shared_ptr<spdlog::logger> logger_;
  const bool read_only_;
};

} // namespace tome::session
