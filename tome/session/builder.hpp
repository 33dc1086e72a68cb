#pragma once

#include "session/session.hpp"
#include <config/config.hpp>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace tome::session {

using session_ptr = std::unique_ptr<session_c>;

/*
  Collects the options of a session and opens it.

  Without a file path the session runs on a volatile in-memory store.
  Credentials given to open_or_create are stored on first use and checked
  on every later open; a store holding credentials refuses to open without
  them.
*/
class session_builder_c {
public:
  session_builder_c() = default;

  session_builder_c &file_path(const std::string &path);
  session_builder_c &read_only(bool value = true);
  session_builder_c &auto_compact(bool value);
  session_builder_c &auto_commit(bool value);
  session_builder_c &auto_commit_buffer_size(std::size_t size);
  session_builder_c &logger(std::shared_ptr<spdlog::logger> logger);

  //! \brief Takes every store option the configuration carries. The file
  //!        path is only replaced when the configuration names one
  session_builder_c &with_config(const config::config_c &config);

  result_c<session_ptr> open_or_create();
  result_c<session_ptr> open_or_create(const std::string &user_id,
                                       const std::string &password);

private:
  std::shared_ptr<spdlog::logger> resolve_logger();
  result_c<std::unique_ptr<kvds::store_if>>
  open_store(std::shared_ptr<spdlog::logger> logger);

  std::optional<std::string> file_path_;
  bool read_only_{config::DEFAULT_READ_ONLY};
  bool auto_compact_{config::DEFAULT_AUTO_COMPACT};
  bool auto_commit_{config::DEFAULT_AUTO_COMMIT};
  std::size_t auto_commit_buffer_size_{
      config::DEFAULT_AUTO_COMMIT_BUFFER_SIZE};
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tome::session
