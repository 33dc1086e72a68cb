#include "doc/document.hpp"
#include <atomic>
#include <chrono>
#include <charconv>
#include <fmt/core.h>

namespace tome::doc {

namespace {
constexpr std::size_t KEY_WIDTH = 20;
}

doc_id_t next_doc_id() {
  static std::atomic<doc_id_t> last{0};

  auto now = std::chrono::system_clock::now().time_since_epoch();
  auto candidate = static_cast<doc_id_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());

  doc_id_t previous = last.load();
  doc_id_t next = 0;
  do {
    next = candidate > previous ? candidate : previous + 1;
  } while (!last.compare_exchange_weak(previous, next));
  return next;
}

std::string to_key(doc_id_t id) { return fmt::format("{:020}", id); }

std::optional<doc_id_t> from_key(const std::string &key) {
  if (key.size() != KEY_WIDTH) {
    return std::nullopt;
  }
  doc_id_t id = 0;
  auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), id);
  if (ec != std::errc() || ptr != key.data() + key.size()) {
    return std::nullopt;
  }
  return id;
}

std::optional<doc_id_t> id_of(const json &document) {
  if (!document.is_object()) {
    return std::nullopt;
  }
  auto it = document.find(DOC_ID_FIELD);
  if (it == document.end() || !it->is_number_unsigned()) {
    return std::nullopt;
  }
  return it->get<doc_id_t>();
}

} // namespace tome::doc
