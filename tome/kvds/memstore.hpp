#pragma once

#include "kvds/kvds.hpp"
#include <memory>
#include <string>

namespace tome::kvds {

//! \brief Volatile backing store. Data lives as long as the store is open
class memstore_c : public store_if {
public:
  memstore_c(const memstore_c &) = delete;
  memstore_c(memstore_c &&) = delete;
  memstore_c &operator=(const memstore_c &) = delete;
  memstore_c &operator=(memstore_c &&) = delete;

  explicit memstore_c(bool read_only = false);
  ~memstore_c();

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
  struct state_s;
  class map_c;

  std::shared_ptr<state_s> state_;
};

} // namespace tome::kvds
