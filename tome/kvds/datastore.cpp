#include "kvds/datastore.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fmt/core.h>
#include <map>
#include <mutex>
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <shared_mutex>

namespace tome::kvds {

namespace {
constexpr const char *MAP_FAMILY_PREFIX = "map:";

status_c from_rocksdb(const rocksdb::Status &status, const std::string &what) {
  if (status.ok()) {
    return status_c::ok();
  }
  if (status.IsNotSupported()) {
    return status_c::fail(error_e::WRITE_CAPABILITY,
                          fmt::format("{}: {}", what, status.ToString()));
  }
  return status_c::fail(error_e::STORE_FAILURE,
                        fmt::format("{}: {}", what, status.ToString()));
}
} // namespace

/*
  Everything the column maps need to outlive the datastore object. Map
  operations hold the lock shared; open/close/drop of families hold it
  exclusively.
*/
struct datastore_c::engine_s {
  engine_s(std::shared_ptr<spdlog::logger> log, const options_s &opts,
           const std::string &db_path)
      : logger(std::move(log)), options(opts), path(db_path) {}

  rocksdb::WriteOptions write_options() const {
    rocksdb::WriteOptions wo;
    wo.disableWAL = true;
    return wo;
  }

  std::vector<rocksdb::ColumnFamilyHandle *> all_families() const {
    std::vector<rocksdb::ColumnFamilyHandle *> handles;
    handles.push_back(default_family);
    for (const auto &pair : families) {
      handles.push_back(pair.second);
    }
    return handles;
  }

  status_c flush_locked() {
    // writers keep counting under the shared lock while the flush runs
    const std::size_t flushed = pending_writes.load();
    rocksdb::FlushOptions flush_options;
    flush_options.wait = true;
    auto status = from_rocksdb(db->Flush(flush_options, all_families()),
                               "flush failed");
    if (status.is_success()) {
      std::size_t current = pending_writes.load();
      while (!pending_writes.compare_exchange_weak(
          current, current > flushed ? current - flushed : 0)) {
      }
    }
    return status;
  }

  void note_writes_locked(std::size_t count) {
    pending_writes += count;
    if (!options.auto_commit ||
        pending_writes < options.auto_commit_buffer_size) {
      return;
    }
    auto status = flush_locked();
    if (status.is_error()) {
      logger->error("[datastore_c] auto-commit of '{}' failed: {}", path,
                    status.error().message);
    }
  }

  bool remove_family(const std::string &name);

  std::shared_ptr<spdlog::logger> logger;
  const options_s options;
  const std::string path;

  mutable std::shared_mutex lock;
  std::unique_ptr<rocksdb::DB> db;
  bool open{false};
  std::atomic<std::size_t> pending_writes{0};

  rocksdb::ColumnFamilyHandle *default_family{nullptr};
  std::map<std::string, rocksdb::ColumnFamilyHandle *> families;
  std::vector<std::string> order;
  std::map<std::string, std::shared_ptr<column_map_c>> maps;
};

class datastore_c::column_map_c : public kv_c {
public:
  column_map_c(const std::string &name, rocksdb::ColumnFamilyHandle *handle,
               std::shared_ptr<engine_s> engine)
      : name_(name), handle_(handle), engine_(std::move(engine)) {}

  void mark_dropped() { dropped_ = true; }

  std::string get_name() const override { return name_; }

  bool is_open() const override {
    std::shared_lock<std::shared_mutex> lock(engine_->lock);
    return readable_locked();
  }

  bool is_read_only() const override { return engine_->options.read_only; }

  bool get(const std::string &key, std::string &value) override {
    std::shared_lock<std::shared_mutex> lock(engine_->lock);
    if (!readable_locked()) {
      return false;
    }

    auto status =
        engine_->db->Get(rocksdb::ReadOptions(), handle_, key, &value);
    return status.ok();
  }

  bool exists(const std::string &key) const override {
    std::shared_lock<std::shared_mutex> lock(engine_->lock);
    if (!readable_locked()) {
      return false;
    }

    std::string value;
    auto status =
        engine_->db->Get(rocksdb::ReadOptions(), handle_, key, &value);
    return status.ok();
  }

  std::size_t size() const override {
    std::size_t count = 0;
    iterate("", [&count](const std::string &, const std::string &) {
      count++;
      return true;
    });
    return count;
  }

  void
  iterate(const std::string &prefix,
          std::function<bool(const std::string &key, const std::string &value)>
              callback) const override {
    std::shared_lock<std::shared_mutex> lock(engine_->lock);
    if (!readable_locked()) {
      return;
    }

    std::unique_ptr<rocksdb::Iterator> it(
        engine_->db->NewIterator(rocksdb::ReadOptions(), handle_));

    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix);
         it->Next()) {
      std::string key = it->key().ToString();
      std::string value = it->value().ToString();

      if (!callback(key, value)) {
        break;
      }
    }
  }

  bool set(const std::string &key, const std::string &value) override {
    std::shared_lock<std::shared_mutex> lock(engine_->lock);
    if (!writable_locked()) {
      return false;
    }

    auto status =
        engine_->db->Put(engine_->write_options(), handle_, key, value);
    if (!status.ok()) {
      report("put", status);
      return false;
    }
    engine_->note_writes_locked(1);
    return true;
  }

  bool del(const std::string &key) override {
    std::shared_lock<std::shared_mutex> lock(engine_->lock);
    if (!writable_locked()) {
      return false;
    }

    auto status = engine_->db->Delete(engine_->write_options(), handle_, key);
    if (!status.ok()) {
      report("delete", status);
      return false;
    }
    engine_->note_writes_locked(1);
    return true;
  }

  bool set_batch(const std::map<std::string, std::string> &kv_pairs) override {
    std::shared_lock<std::shared_mutex> lock(engine_->lock);
    if (!writable_locked()) {
      return false;
    }

    rocksdb::WriteBatch batch;
    for (const auto &pair : kv_pairs) {
      batch.Put(handle_, pair.first, pair.second);
    }

    auto status = engine_->db->Write(engine_->write_options(), &batch);
    if (!status.ok()) {
      report("batch put", status);
      return false;
    }
    engine_->note_writes_locked(kv_pairs.size());
    return true;
  }

  bool delete_batch(const std::vector<std::string> &keys) override {
    std::shared_lock<std::shared_mutex> lock(engine_->lock);
    if (!writable_locked()) {
      return false;
    }

    rocksdb::WriteBatch batch;
    for (const auto &key : keys) {
      batch.Delete(handle_, key);
    }

    auto status = engine_->db->Write(engine_->write_options(), &batch);
    if (!status.ok()) {
      report("batch delete", status);
      return false;
    }
    engine_->note_writes_locked(keys.size());
    return true;
  }

  bool set_nx(const std::string &key, const std::string &value) override {
    std::shared_lock<std::shared_mutex> lock(engine_->lock);
    if (!writable_locked()) {
      return false;
    }

    std::string existing_value;
    auto status = engine_->db->Get(rocksdb::ReadOptions(), handle_, key,
                                   &existing_value);
    if (status.ok()) {
      return false;
    }

    status = engine_->db->Put(engine_->write_options(), handle_, key, value);
    if (!status.ok()) {
      report("put", status);
      return false;
    }
    engine_->note_writes_locked(1);
    return true;
  }

  bool clear() override {
    std::shared_lock<std::shared_mutex> lock(engine_->lock);
    if (!writable_locked()) {
      return false;
    }

    rocksdb::WriteBatch batch;
    std::size_t count = 0;
    std::unique_ptr<rocksdb::Iterator> it(
        engine_->db->NewIterator(rocksdb::ReadOptions(), handle_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      batch.Delete(handle_, it->key());
      count++;
    }

    auto status = engine_->db->Write(engine_->write_options(), &batch);
    if (!status.ok()) {
      report("clear", status);
      return false;
    }
    engine_->note_writes_locked(count);
    return true;
  }

  bool drop() override {
    if (engine_->options.read_only) {
      return false;
    }
    return engine_->remove_family(name_);
  }

private:
  bool readable_locked() const { return engine_->open && !dropped_; }

  bool writable_locked() const {
    return readable_locked() && !engine_->options.read_only;
  }

  void report(const char *operation, const rocksdb::Status &status) const {
    engine_->logger->error("[datastore_c] {} on map '{}' failed: {}",
                           operation, name_, status.ToString());
  }

  const std::string name_;
  rocksdb::ColumnFamilyHandle *handle_;
  std::shared_ptr<engine_s> engine_;
  std::atomic<bool> dropped_{false};
};

bool datastore_c::engine_s::remove_family(const std::string &name) {
  std::unique_lock<std::shared_mutex> guard(lock);
  if (!open) {
    return false;
  }

  auto it = families.find(name);
  if (it == families.end()) {
    return false;
  }

  auto status = db->DropColumnFamily(it->second);
  if (!status.ok()) {
    logger->error("[datastore_c] dropping map '{}' failed: {}", name,
                  status.ToString());
    return false;
  }
  db->DestroyColumnFamilyHandle(it->second);
  families.erase(it);

  auto map_it = maps.find(name);
  if (map_it != maps.end()) {
    map_it->second->mark_dropped();
    maps.erase(map_it);
  }
  order.erase(std::remove(order.begin(), order.end(), name), order.end());
  return true;
}

datastore_c::datastore_c(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

datastore_c::~datastore_c() {
  if (!is_closed()) {
    auto status = close();
    if (status.is_error()) {
      logger_->error("[datastore_c] close on destruction failed: {}",
                     status.error().message);
    }
  }
}

status_c datastore_c::open(const std::string &path, const options_s &options) {
  if (!is_closed()) {
    return status_c::fail(error_e::STORE_FAILURE,
                          fmt::format("store '{}' is already open", path));
  }

  auto engine = std::make_shared<engine_s>(logger_, options, path);

  rocksdb::DBOptions db_options;
  db_options.create_if_missing = !options.read_only;
  db_options.create_missing_column_families = !options.read_only;

  std::vector<std::string> family_names;
  auto listed =
      rocksdb::DB::ListColumnFamilies(db_options, path, &family_names);
  if (!listed.ok()) {
    if (options.read_only) {
      return status_c::fail(
          error_e::STORE_FAILURE,
          fmt::format("cannot open '{}' read-only: {}", path,
                      listed.ToString()));
    }
    family_names = {rocksdb::kDefaultColumnFamilyName};
  }

  std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
  for (const auto &name : family_names) {
    descriptors.emplace_back(name, rocksdb::ColumnFamilyOptions());
  }

  std::vector<rocksdb::ColumnFamilyHandle *> handles;
  rocksdb::DB *raw_db = nullptr;
  rocksdb::Status status;

  if (options.read_only) {
    status = rocksdb::DB::OpenForReadOnly(db_options, path, descriptors,
                                          &handles, &raw_db);
  } else {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
      return status_c::fail(error_e::STORE_FAILURE,
                            fmt::format("cannot create '{}': {}", path,
                                        ec.message()));
    }
    status =
        rocksdb::DB::Open(db_options, path, descriptors, &handles, &raw_db);
  }

  if (!status.ok()) {
    return from_rocksdb(status, fmt::format("cannot open '{}'", path));
  }

  engine->db.reset(raw_db);
  for (std::size_t i = 0; i < family_names.size(); ++i) {
    const std::string &family = family_names[i];
    if (family.starts_with(MAP_FAMILY_PREFIX)) {
      std::string name =
          family.substr(std::char_traits<char>::length(MAP_FAMILY_PREFIX));
      engine->families[name] = handles[i];
      engine->order.push_back(name);
    } else if (family == rocksdb::kDefaultColumnFamilyName) {
      engine->default_family = handles[i];
    } else {
      logger_->warn("[datastore_c] ignoring unknown column family '{}'",
                    family);
      engine->db->DestroyColumnFamilyHandle(handles[i]);
    }
  }
  engine->open = true;
  engine_ = engine;

  logger_->debug("[datastore_c] opened '{}' with {} map(s){}", path,
                 engine_->order.size(),
                 options.read_only ? " (read-only)" : "");
  return status_c::ok();
}

result_c<kv_t> datastore_c::open_map(const std::string &name) {
  if (is_closed()) {
    return result_c<kv_t>::fail(error_e::STORE_FAILURE, "store is closed");
  }

  std::unique_lock<std::shared_mutex> lock(engine_->lock);

  auto it = engine_->maps.find(name);
  if (it != engine_->maps.end()) {
    return kv_t(it->second);
  }

  rocksdb::ColumnFamilyHandle *handle = nullptr;
  auto family_it = engine_->families.find(name);
  if (family_it != engine_->families.end()) {
    handle = family_it->second;
  } else {
    if (engine_->options.read_only) {
      return result_c<kv_t>::fail(
          error_e::WRITE_CAPABILITY,
          fmt::format("cannot create map '{}' in a read-only store", name));
    }

    auto status = engine_->db->CreateColumnFamily(
        rocksdb::ColumnFamilyOptions(), MAP_FAMILY_PREFIX + name, &handle);
    if (!status.ok()) {
      return result_c<kv_t>(from_rocksdb(
          status, fmt::format("cannot create map '{}'", name)));
    }
    engine_->families[name] = handle;
    engine_->order.push_back(name);
    logger_->debug("[datastore_c] created map '{}'", name);
  }

  auto map = std::make_shared<column_map_c>(name, handle, engine_);
  engine_->maps[name] = map;
  return kv_t(map);
}

bool datastore_c::has_map(const std::string &name) const {
  if (is_closed()) {
    return false;
  }
  std::shared_lock<std::shared_mutex> lock(engine_->lock);
  return engine_->families.count(name) > 0;
}

status_c datastore_c::remove_map(const std::string &name) {
  if (is_closed()) {
    return status_c::fail(error_e::STORE_FAILURE, "store is closed");
  }
  if (engine_->options.read_only) {
    return status_c::fail(
        error_e::WRITE_CAPABILITY,
        fmt::format("cannot remove map '{}' from a read-only store", name));
  }
  if (!has_map(name)) {
    return status_c::fail(error_e::NOT_FOUND,
                          fmt::format("map '{}' does not exist", name));
  }
  if (!engine_->remove_family(name)) {
    return status_c::fail(error_e::STORE_FAILURE,
                          fmt::format("cannot remove map '{}'", name));
  }
  return status_c::ok();
}

std::vector<std::string> datastore_c::get_map_names() const {
  if (is_closed()) {
    return {};
  }
  std::shared_lock<std::shared_mutex> lock(engine_->lock);
  return engine_->order;
}

bool datastore_c::has_unsaved_changes() const {
  return !is_closed() && engine_->pending_writes > 0;
}

status_c datastore_c::commit() {
  if (is_closed()) {
    return status_c::fail(error_e::STORE_FAILURE, "store is closed");
  }
  if (engine_->options.read_only) {
    return status_c::fail(error_e::WRITE_CAPABILITY,
                          "cannot commit a read-only store");
  }

  std::shared_lock<std::shared_mutex> lock(engine_->lock);
  return engine_->flush_locked();
}

status_c datastore_c::compact_move_chunks() {
  if (is_closed()) {
    return status_c::fail(error_e::STORE_FAILURE, "store is closed");
  }
  if (engine_->options.read_only) {
    return status_c::fail(error_e::WRITE_CAPABILITY,
                          "cannot compact a read-only store");
  }

  std::shared_lock<std::shared_mutex> lock(engine_->lock);
  for (auto *handle : engine_->all_families()) {
    auto status = from_rocksdb(
        engine_->db->CompactRange(rocksdb::CompactRangeOptions(), handle,
                                  nullptr, nullptr),
        "compaction failed");
    if (status.is_error()) {
      return status;
    }
  }
  return status_c::ok();
}

status_c datastore_c::close() { return shutdown(true); }

status_c datastore_c::close_immediately() { return shutdown(false); }

status_c datastore_c::shutdown(bool flush) {
  if (!engine_) {
    return status_c::fail(error_e::STORE_FAILURE, "store was never opened");
  }

  std::unique_lock<std::shared_mutex> lock(engine_->lock);
  if (!engine_->open) {
    return status_c::fail(error_e::STORE_FAILURE, "store is already closed");
  }

  status_c result;
  if (!engine_->options.read_only) {
    if (flush) {
      if (engine_->pending_writes > 0) {
        result = engine_->flush_locked();
      }
    } else {
      auto status = engine_->db->SetDBOptions(
          {{"avoid_flush_during_shutdown", "true"}});
      if (!status.ok()) {
        logger_->warn("[datastore_c] cannot skip flush on shutdown: {}",
                      status.ToString());
      }
    }
  }

  for (auto &pair : engine_->maps) {
    pair.second->mark_dropped();
  }
  engine_->maps.clear();

  for (auto &pair : engine_->families) {
    engine_->db->DestroyColumnFamilyHandle(pair.second);
  }
  engine_->families.clear();
  engine_->order.clear();
  if (engine_->default_family) {
    engine_->db->DestroyColumnFamilyHandle(engine_->default_family);
    engine_->default_family = nullptr;
  }

  auto closed = from_rocksdb(engine_->db->Close(),
                             fmt::format("closing '{}' failed", engine_->path));
  if (closed.is_error() && result.is_success()) {
    result = closed;
  }

  engine_->db.reset();
  engine_->open = false;
  engine_->pending_writes = 0;
  return result;
}

bool datastore_c::is_closed() const {
  if (!engine_) {
    return true;
  }
  std::shared_lock<std::shared_mutex> lock(engine_->lock);
  return !engine_->open;
}

bool datastore_c::is_read_only() const {
  return engine_ && engine_->options.read_only;
}

} // namespace tome::kvds
