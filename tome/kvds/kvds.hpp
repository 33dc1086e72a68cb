#pragma once

#include <errors/errors.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tome::kvds {

class kv_stat {
public:
  virtual ~kv_stat() = default;
  virtual bool is_open() const = 0;
  virtual bool is_read_only() const = 0;
  virtual std::string get_name() const = 0;
};

class kv_reader_c {
public:
  virtual ~kv_reader_c() = default;
  virtual bool get(const std::string &key, std::string &value) = 0;
  virtual bool exists(const std::string &key) const = 0;
  virtual std::size_t size() const = 0;
  virtual void
  iterate(const std::string &prefix,
          std::function<bool(const std::string &key, const std::string &value)>
              callback) const = 0;
};

class kv_writer_c {
public:
  virtual ~kv_writer_c() = default;
  virtual bool set(const std::string &key, const std::string &value) = 0;
  virtual bool del(const std::string &key) = 0;
  virtual bool
  set_batch(const std::map<std::string, std::string> &kv_pairs) = 0;
  virtual bool delete_batch(const std::vector<std::string> &keys) = 0;
  virtual bool set_nx(const std::string &key, const std::string &value) = 0;
  virtual bool clear() = 0;

  //! \brief Removes the map from its store. The handle is closed afterwards
  virtual bool drop() = 0;
};

//! \brief One named map of a backing store
class kv_c : public kv_reader_c, public kv_writer_c, public kv_stat {
public:
  virtual ~kv_c() = default;
};

using kv_t = std::shared_ptr<kv_c>;

/*
  A backing store multiplexes named maps. Map handles share ownership of the
  store engine; once the store is closed every outstanding handle reports
  closed and refuses reads and writes.
*/
class store_if {
public:
  virtual ~store_if() = default;

  //! \brief Opens the named map, creating it when absent. Opening the
  //!        same name twice yields the same handle
  virtual result_c<kv_t> open_map(const std::string &name) = 0;
  virtual bool has_map(const std::string &name) const = 0;
  virtual status_c remove_map(const std::string &name) = 0;
  virtual std::vector<std::string> get_map_names() const = 0;

  virtual bool has_unsaved_changes() const = 0;
  virtual status_c commit() = 0;
  virtual status_c compact_move_chunks() = 0;

  virtual status_c close() = 0;
  virtual status_c close_immediately() = 0;
  virtual bool is_closed() const = 0;
  virtual bool is_read_only() const = 0;
};

} // namespace tome::kvds
