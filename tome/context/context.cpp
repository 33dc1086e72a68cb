#include "context/context.hpp"

namespace tome::context {

context_c::context_c(bool read_only, bool auto_compact,
                     std::shared_ptr<spdlog::logger> logger)
    : read_only_(read_only), auto_compact_(auto_compact),
      logger_(std::move(logger)) {}

bool context_c::is_read_only() const { return read_only_; }

bool context_c::is_auto_compact_enabled() const { return auto_compact_; }

std::shared_ptr<spdlog::logger> context_c::get_logger() const {
  return logger_;
}

doc::collection_t context_c::find_collection(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = collections_.find(name);
  if (it == collections_.end() || it->second->is_closed()) {
    return nullptr;
  }
  return it->second;
}

doc::collection_t
context_c::register_collection(doc::collection_t collection) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shutdown_) {
    logger_->error("[{}] cannot register collection '{}' after shutdown",
                   name_, collection->get_name());
    return nullptr;
  }

  const std::string &name = collection->get_name();
  auto it = collections_.find(name);
  if (it != collections_.end()) {
    if (!it->second->is_closed()) {
      return it->second;
    }
    it->second = collection;
    return collection;
  }

  collections_[name] = collection;
  collection_order_.push_back(name);
  logger_->debug("[{}] registered collection '{}'", name_, name);
  return collection;
}

doc::repository_t
context_c::find_repository(const std::string &type_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = repositories_.find(type_name);
  if (it == repositories_.end() || it->second->is_closed()) {
    return nullptr;
  }
  return it->second;
}

doc::repository_t
context_c::register_repository(doc::repository_t repository) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shutdown_) {
    logger_->error("[{}] cannot register repository '{}' after shutdown",
                   name_, repository->get_type_name());
    return nullptr;
  }

  const std::string &type_name = repository->get_type_name();
  auto it = repositories_.find(type_name);
  if (it != repositories_.end()) {
    if (!it->second->is_closed()) {
      return it->second;
    }
    it->second = repository;
    return repository;
  }

  repositories_[type_name] = repository;
  repository_order_.push_back(type_name);
  logger_->debug("[{}] registered repository '{}'", name_, type_name);
  return repository;
}

std::vector<std::string> context_c::collection_registry() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return collection_order_;
}

std::vector<std::string> context_c::repository_registry() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return repository_order_;
}

std::vector<doc::collection_t> context_c::registered_collections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<doc::collection_t> result;
  for (const auto &name : collection_order_) {
    result.push_back(collections_.at(name));
  }
  return result;
}

std::vector<doc::repository_t> context_c::registered_repositories() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<doc::repository_t> result;
  for (const auto &type_name : repository_order_) {
    result.push_back(repositories_.at(type_name));
  }
  return result;
}

void context_c::clear_registry() {
  std::lock_guard<std::mutex> lock(mutex_);
  collections_.clear();
  collection_order_.clear();
  repositories_.clear();
  repository_order_.clear();
}

void context_c::add_shutdown_hook(std::function<void()> hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  shutdown_hooks_.push_back(std::move(hook));
}

void context_c::shutdown() {
  std::vector<std::function<void()>> hooks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      return;
    }
    shutdown_ = true;
    hooks.swap(shutdown_hooks_);
  }

  for (auto &hook : hooks) {
    try {
      hook();
    } catch (const std::exception &e) {
      logger_->error("[{}] shutdown hook failed: {}", name_, e.what());
    } catch (...) {
      logger_->error("[{}] shutdown hook failed with an unknown exception",
                     name_);
    }
  }
  logger_->debug("[{}] shut down", name_);
}

bool context_c::is_shutdown() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return shutdown_;
}

} // namespace tome::context
