#include "kvds/memstore.hpp"
#include <algorithm>
#include <atomic>
#include <fmt/core.h>
#include <map>
#include <mutex>

namespace tome::kvds {

struct memstore_c::state_s {
  explicit state_s(bool ro) : read_only(ro) {}

  bool remove(const std::string &name);

  const bool read_only;
  std::atomic<bool> open{true};
  std::atomic<std::size_t> pending_writes{0};

  mutable std::mutex mutex;
  std::vector<std::string> order;
  std::map<std::string, std::shared_ptr<map_c>> maps;
};

class memstore_c::map_c : public kv_c {
public:
  map_c(const std::string &name, std::shared_ptr<state_s> state)
      : name_(name), state_(std::move(state)) {}

  void mark_dropped() { dropped_ = true; }

  std::string get_name() const override { return name_; }

  bool is_open() const override { return state_->open && !dropped_; }

  bool is_read_only() const override { return state_->read_only; }

  bool get(const std::string &key, std::string &value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open()) {
      return false;
    }

    auto it = data_.find(key);
    if (it != data_.end()) {
      value = it->second;
      return true;
    }
    return false;
  }

  bool exists(const std::string &key) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open()) {
      return false;
    }
    return data_.find(key) != data_.end();
  }

  std::size_t size() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open()) {
      return 0;
    }
    return data_.size();
  }

  void
  iterate(const std::string &prefix,
          std::function<bool(const std::string &key, const std::string &value)>
              callback) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open()) {
      return;
    }

    auto it = data_.lower_bound(prefix);
    while (it != data_.end() && it->first.starts_with(prefix)) {
      if (!callback(it->first, it->second)) {
        break;
      }
      ++it;
    }
  }

  bool set(const std::string &key, const std::string &value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!writable()) {
      return false;
    }

    data_[key] = value;
    state_->pending_writes++;
    return true;
  }

  bool del(const std::string &key) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!writable()) {
      return false;
    }

    if (data_.erase(key) == 0) {
      return false;
    }
    state_->pending_writes++;
    return true;
  }

  bool set_batch(const std::map<std::string, std::string> &kv_pairs) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!writable()) {
      return false;
    }

    for (const auto &pair : kv_pairs) {
      data_[pair.first] = pair.second;
    }
    state_->pending_writes += kv_pairs.size();
    return true;
  }

  bool delete_batch(const std::vector<std::string> &keys) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!writable()) {
      return false;
    }

    for (const auto &key : keys) {
      data_.erase(key);
    }
    state_->pending_writes += keys.size();
    return true;
  }

  bool set_nx(const std::string &key, const std::string &value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!writable()) {
      return false;
    }

    if (data_.find(key) != data_.end()) {
      return false;
    }

    data_[key] = value;
    state_->pending_writes++;
    return true;
  }

  bool clear() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!writable()) {
      return false;
    }

    state_->pending_writes += data_.size();
    data_.clear();
    return true;
  }

  bool drop() override {
    if (!is_open() || state_->read_only) {
      return false;
    }
    return state_->remove(name_);
  }

private:
  bool writable() const { return is_open() && !state_->read_only; }

  const std::string name_;
  std::shared_ptr<state_s> state_;
  std::atomic<bool> dropped_{false};

  mutable std::mutex mutex_;
  std::map<std::string, std::string> data_;
};

bool memstore_c::state_s::remove(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex);
  auto it = maps.find(name);
  if (it == maps.end()) {
    return false;
  }

  it->second->mark_dropped();
  maps.erase(it);
  order.erase(std::remove(order.begin(), order.end(), name), order.end());
  pending_writes++;
  return true;
}

memstore_c::memstore_c(bool read_only)
    : state_(std::make_shared<state_s>(read_only)) {}

memstore_c::~memstore_c() {
  if (state_->open) {
    close_immediately();
  }
}

result_c<kv_t> memstore_c::open_map(const std::string &name) {
  if (!state_->open) {
    return result_c<kv_t>::fail(error_e::STORE_FAILURE,
                                "memory store is closed");
  }

  std::lock_guard<std::mutex> lock(state_->mutex);

  auto it = state_->maps.find(name);
  if (it != state_->maps.end()) {
    return kv_t(it->second);
  }

  if (state_->read_only) {
    return result_c<kv_t>::fail(
        error_e::WRITE_CAPABILITY,
        fmt::format("cannot create map '{}' in a read-only store", name));
  }

  auto map = std::make_shared<map_c>(name, state_);
  state_->maps[name] = map;
  state_->order.push_back(name);
  return kv_t(map);
}

bool memstore_c::has_map(const std::string &name) const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->open && state_->maps.count(name) > 0;
}

status_c memstore_c::remove_map(const std::string &name) {
  if (!state_->open) {
    return status_c::fail(error_e::STORE_FAILURE, "memory store is closed");
  }
  if (state_->read_only) {
    return status_c::fail(
        error_e::WRITE_CAPABILITY,
        fmt::format("cannot remove map '{}' from a read-only store", name));
  }
  if (!state_->remove(name)) {
    return status_c::fail(error_e::NOT_FOUND,
                          fmt::format("map '{}' does not exist", name));
  }
  return status_c::ok();
}

std::vector<std::string> memstore_c::get_map_names() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (!state_->open) {
    return {};
  }
  return state_->order;
}

bool memstore_c::has_unsaved_changes() const {
  return state_->open && state_->pending_writes > 0;
}

status_c memstore_c::commit() {
  if (!state_->open) {
    return status_c::fail(error_e::STORE_FAILURE, "memory store is closed");
  }
  if (state_->read_only) {
    return status_c::fail(error_e::WRITE_CAPABILITY,
                          "cannot commit a read-only store");
  }
  state_->pending_writes = 0;
  return status_c::ok();
}

status_c memstore_c::compact_move_chunks() {
  if (!state_->open) {
    return status_c::fail(error_e::STORE_FAILURE, "memory store is closed");
  }
  if (state_->read_only) {
    return status_c::fail(error_e::WRITE_CAPABILITY,
                          "cannot compact a read-only store");
  }
  return status_c::ok();
}

status_c memstore_c::close() {
  if (!state_->open.exchange(false)) {
    return status_c::fail(error_e::STORE_FAILURE,
                          "memory store is already closed");
  }

  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->maps.clear();
  state_->order.clear();
  state_->pending_writes = 0;
  return status_c::ok();
}

status_c memstore_c::close_immediately() { return close(); }

bool memstore_c::is_closed() const { return !state_->open; }

bool memstore_c::is_read_only() const { return state_->read_only; }

} // namespace tome::kvds
