#include "errors/errors.hpp"

namespace tome {

const char *error_name(error_e code) {
  switch (code) {
  case error_e::INVALID_NAME:
    return "invalid name";
  case error_e::SESSION_CLOSED:
    return "session closed";
  case error_e::WRITE_CAPABILITY:
    return "write capability";
  case error_e::STORE_FAILURE:
    return "store failure";
  case error_e::COLLECTION_CLOSED:
    return "collection closed";
  case error_e::VALIDATION:
    return "validation";
  case error_e::SECURITY:
    return "security";
  case error_e::NOT_FOUND:
    return "not found";
  }
  return "unknown";
}

} // namespace tome
