#pragma once

#include <doc/collection.hpp>
#include <doc/repository.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace tome::context {

/*
  Per-session state shared with the collection and repository factories.

  - flags fixed when the session is opened
  - the registry of every collection and repository opened during the
    session, in opening order; a name stays registered until shutdown
  - shutdown hooks, run once by shutdown()
*/
class context_c {
public:
  context_c(const context_c &) = delete;
  context_c(context_c &&) = delete;
  context_c &operator=(const context_c &) = delete;
  context_c &operator=(context_c &&) = delete;

  context_c(bool read_only, bool auto_compact,
            std::shared_ptr<spdlog::logger> logger);
  ~context_c() = default;

  bool is_read_only() const;
  bool is_auto_compact_enabled() const;
  std::shared_ptr<spdlog::logger> get_logger() const;

  //! \brief Live collection registered under name, nullptr otherwise
  doc::collection_t find_collection(const std::string &name) const;

  //! \brief Registers the collection unless a live one already holds its
  //!        name, in which case that one is returned. Returns nullptr once
  //!        the context is shut down
  doc::collection_t register_collection(doc::collection_t collection);

  doc::repository_t find_repository(const std::string &type_name) const;
  doc::repository_t register_repository(doc::repository_t repository);

  std::vector<std::string> collection_registry() const;
  std::vector<std::string> repository_registry() const;
  std::vector<doc::collection_t> registered_collections() const;
  std::vector<doc::repository_t> registered_repositories() const;

  void clear_registry();

  void add_shutdown_hook(std::function<void()> hook);
  void shutdown();
  bool is_shutdown() const;

private:
  const char *name_{"context_c"};
  const bool read_only_;
  const bool auto_compact_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  bool shutdown_{false};
  std::vector<std::string> collection_order_;
  std::map<std::string, doc::collection_t> collections_;
  std::vector<std::string> repository_order_;
  std::map<std::string, doc::repository_t> repositories_;
  std::vector<std::function<void()>> shutdown_hooks_;
};

} // namespace tome::context
