#pragma once

#include "doc/collection.hpp"
#include <concepts>
#include <string_view>

namespace tome::doc {

//! \brief A type that names itself with a stable, fully qualified name
template <typename T>
concept described = requires {
  { T::type_name } -> std::convertible_to<std::string_view>;
};

//! \brief A described type that maps to and from a JSON document
template <typename T>
concept storable = described<T> && requires(const json &document,
                                            const T &object) {
  document.template get<T>();
  json(object);
};

struct type_descriptor_s {
  std::string name;
};

template <described T> type_descriptor_s describe() {
  return type_descriptor_s{std::string(T::type_name)};
}

class repository_if {
public:
  virtual ~repository_if() = default;
  virtual const std::string &get_type_name() const = 0;
  virtual collection_t document_collection() const = 0;
  virtual status_c close() = 0;
  virtual bool is_closed() const = 0;
};

using repository_t = std::shared_ptr<repository_if>;

/*
  Typed view over a collection. Objects go through nlohmann's
  to_json/from_json; documents that do not map back to T are logged and
  skipped on reads.
*/
template <storable T> class repository_c : public repository_if {
public:
  repository_c(const repository_c &) = delete;
  repository_c &operator=(const repository_c &) = delete;

  repository_c(collection_t collection, std::shared_ptr<spdlog::logger> logger)
      : type_name_(describe<T>().name), collection_(std::move(collection)),
        logger_(std::move(logger)) {}

  const std::string &get_type_name() const override { return type_name_; }

  collection_t document_collection() const override { return collection_; }

  result_c<doc_id_t> insert(const T &object) {
    return collection_->insert(json(object));
  }

  status_c update(doc_id_t id, const T &object) {
    return collection_->update(id, json(object));
  }

  status_c remove(doc_id_t id) { return collection_->remove(id); }

  std::optional<T> get_by_id(doc_id_t id) const {
    auto document = collection_->get_by_id(id);
    if (!document.has_value()) {
      return std::nullopt;
    }
    return to_object(*document);
  }

  std::vector<T> find_all() const {
    std::vector<T> objects;
    collection_->for_each([&](doc_id_t, const json &document) {
      auto object = to_object(document);
      if (object.has_value()) {
        objects.push_back(std::move(*object));
      }
      return true;
    });
    return objects;
  }

  std::size_t size() const { return collection_->size(); }

  status_c close() override { return collection_->close(); }

  bool is_closed() const override { return collection_->is_closed(); }

private:
  std::optional<T> to_object(const json &document) const {
    try {
      return document.get<T>();
    } catch (const json::exception &e) {
      logger_->error("[{}] document does not map to {}: {}",
                     collection_->get_name(), type_name_, e.what());
    }
    return std::nullopt;
  }

  const std::string type_name_;
  collection_t collection_;
  std::shared_ptr<spdlog::logger> logger_;
};

template <storable T> using repository_ptr = std::shared_ptr<repository_c<T>>;

} // namespace tome::doc
