#pragma once

#include "session/policy.hpp"
#include <atomic>
#include <context/context.hpp>
#include <doc/collection.hpp>
#include <doc/factory.hpp>
#include <doc/repository.hpp>
#include <kvds/kvds.hpp>
#include <memory>
#include <names/names.hpp>
#include <string>
#include <vector>

namespace tome::session {

/*
  Entry point to an open store. Owns the backing store and the session
  context; every collection and repository handed out shares the store.

  Open -> Closing -> Closed. Once closed every operation reports
  SESSION_CLOSED (or an empty / false answer for the queries) and the
  store is released.

  compact() and close() must not race writers; everything else may be
  called from any thread.
*/
class session_c {
public:
  session_c(const session_c &) = delete;
  session_c(session_c &&) = delete;
  session_c &operator=(const session_c &) = delete;
  session_c &operator=(session_c &&) = delete;

  session_c(std::unique_ptr<kvds::store_if> store,
            std::unique_ptr<context::context_c> context);

  //! \brief A session still open at destruction is closed without
  //!        committing
  ~session_c();

  //! \brief Opens the named collection, creating it when absent
  result_c<doc::collection_t> get_collection(const std::string &name);

  //! \brief Opens the repository bound to T, creating its store when absent
  template <doc::storable T>
  result_c<doc::repository_ptr<T>> get_repository() {
    const std::string type_name = doc::describe<T>().name;

    auto valid = names::validate_type_name(type_name);
    if (valid.is_error()) {
      return valid;
    }
    if (is_closed()) {
      return policy_.report_closed("get_repository");
    }

    auto collection = repository_collection(type_name);
    if (collection.is_error()) {
      return collection.status();
    }
    return doc::open_repository<T>(collection.take(), *context_);
  }

  std::vector<std::string> list_collection_names() const;
  std::vector<std::string> list_repositories() const;

  bool has_collection(const std::string &name) const;
  bool has_repository(const std::string &type_name) const;

  template <doc::described T> bool has_repository() const {
    return has_repository(doc::describe<T>().name);
  }

  bool has_unsaved_changes() const;

  status_c compact();
  status_c commit();

  status_c close();
  status_c close_immediately();
  bool is_closed() const;

  bool validate_user(const std::string &user_id,
                     const std::string &password) const;

  context::context_c &get_context() const;

private:
  result_c<doc::collection_t>
  repository_collection(const std::string &type_name);
  void close_registered();

  const char *name_{"session_c"};
  std::unique_ptr<kvds::store_if> store_;
  std::unique_ptr<context::context_c> context_;
  std::shared_ptr<spdlog::logger> logger_;
  policy_c policy_;
  std::atomic<bool> closing_{false};
};

} // namespace tome::session
