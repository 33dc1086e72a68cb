#pragma once

#include "kvds/kvds.hpp"
#include <memory>
#include <spdlog/spdlog.h>

namespace tome::kvds {

/*
  RocksDB backed store. Each named map is a column family, the default
  family is kept for the store itself. Writes skip the WAL so that
  commit() is the point at which data becomes durable; close() commits,
  close_immediately() does not.
*/
class datastore_c : public store_if {
public:
  struct options_s {
    bool read_only{false};
    bool auto_commit{true};
    std::size_t auto_commit_buffer_size{1024};
  };

  datastore_c(const datastore_c &) = delete;
  datastore_c(datastore_c &&) = delete;
  datastore_c &operator=(const datastore_c &) = delete;
  datastore_c &operator=(datastore_c &&) = delete;

  explicit datastore_c(std::shared_ptr<spdlog::logger> logger);
  ~datastore_c();

  status_c open(const std::string &path, const options_s &options);

  result_c<kv_t> open_map(const std::string &name) override;
  bool has_map(const std::string &name) const override;
  status_c remove_map(const std::string &name) override;
  std::vector<std::string> get_map_names() const override;

  bool has_unsaved_changes() const override;
  status_c commit() override;
  status_c compact_move_chunks() override;

  status_c close() override;
  status_c close_immediately() override;
  bool is_closed() const override;
  bool is_read_only() const override;

private:
  struct engine_s;
  class column_map_c;

  status_c shutdown(bool flush);

  std::shared_ptr<spdlog::logger> logger_;
  std::shared_ptr<engine_s> engine_;
};

} // namespace tome::kvds
