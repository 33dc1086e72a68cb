#pragma once

#include "doc/collection.hpp"
#include "doc/repository.hpp"
#include <context/context.hpp>
#include <fmt/core.h>

namespace tome::doc {

//! \brief Wraps the map as a collection, or returns the live collection
//!        already registered under the map's name
extern result_c<collection_t> open_collection(kvds::kv_t map,
                                              context::context_c &context);

//! \brief Binds T to the collection, or returns the live repository
//!        already registered for T
template <storable T>
result_c<repository_ptr<T>> open_repository(collection_t collection,
                                            context::context_c &context) {
  const std::string type_name = describe<T>().name;

  auto existing = context.find_repository(type_name);
  if (!existing) {
    existing = context.register_repository(
        std::make_shared<repository_c<T>>(collection, context.get_logger()));
  }
  if (!existing) {
    return result_c<repository_ptr<T>>::fail(
        error_e::SESSION_CLOSED,
        fmt::format("cannot open repository '{}': context is shut down",
                    type_name));
  }

  auto typed = std::dynamic_pointer_cast<repository_c<T>>(existing);
  if (!typed) {
    return result_c<repository_ptr<T>>::fail(
        error_e::VALIDATION,
        fmt::format("repository '{}' is bound to a different type",
                    type_name));
  }
  return typed;
}

} // namespace tome::doc
