#pragma once

#include "doc/document.hpp"
#include <atomic>
#include <errors/errors.hpp>
#include <functional>
#include <kvds/kvds.hpp>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace tome::doc {

/*
  Document view over one named map. Documents are JSON objects stored under
  their id; the id is also written into the document as "_id".
  Thread safety comes from the underlying map.
*/
class collection_c {
public:
  collection_c(const collection_c &) = delete;
  collection_c(collection_c &&) = delete;
  collection_c &operator=(const collection_c &) = delete;
  collection_c &operator=(collection_c &&) = delete;

  collection_c(const std::string &name, kvds::kv_t map,
               std::shared_ptr<spdlog::logger> logger);
  ~collection_c() = default;

  const std::string &get_name() const;

  result_c<doc_id_t> insert(json document);
  status_c update(doc_id_t id, json document);
  status_c remove(doc_id_t id);

  std::optional<json> get_by_id(doc_id_t id) const;
  std::vector<json> find_all() const;
  void for_each(std::function<bool(doc_id_t id, const json &document)>
                    callback) const;
  std::size_t size() const;

  //! \brief Removes every document and the named map itself
  status_c drop();
  status_c close();
  bool is_closed() const;
  bool is_dropped() const;

private:
  status_c check_writable(const char *operation) const;
  std::optional<json> decode(const std::string &key,
                             const std::string &value) const;

  const std::string name_;
  kvds::kv_t map_;
  std::shared_ptr<spdlog::logger> logger_;
  std::atomic<bool> closed_{false};
  std::atomic<bool> dropped_{false};
};

using collection_t = std::shared_ptr<collection_c>;

} // namespace tome::doc
