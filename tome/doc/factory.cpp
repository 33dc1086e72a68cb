#include "doc/factory.hpp"

namespace tome::doc {

result_c<collection_t> open_collection(kvds::kv_t map,
                                       context::context_c &context) {
  const std::string name = map->get_name();

  auto collection = context.find_collection(name);
  if (!collection) {
    collection = context.register_collection(
        std::make_shared<collection_c>(name, map, context.get_logger()));
  }
  if (!collection) {
    return result_c<collection_t>::fail(
        error_e::SESSION_CLOSED,
        fmt::format("cannot open collection '{}': context is shut down",
                    name));
  }
  return collection;
}

} // namespace tome::doc
