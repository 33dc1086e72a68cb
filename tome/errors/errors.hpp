#pragma once

#include <optional>
#include <string>
#include <utility>

namespace tome {

enum class error_e {
  INVALID_NAME = 1,
  SESSION_CLOSED = 2,
  WRITE_CAPABILITY = 3,
  STORE_FAILURE = 4,
  COLLECTION_CLOSED = 5,
  VALIDATION = 6,
  SECURITY = 7,
  NOT_FOUND = 8,
};

struct error_s {
  error_e error_code;
  std::string message;
};

extern const char *error_name(error_e code);

//! \brief Outcome of an operation that produces no value
class status_c {
public:
  status_c() = default;

  static status_c ok() { return status_c(); }
  static status_c fail(error_e code, std::string message) {
    status_c status;
    status.error_ = error_s{code, std::move(message)};
    return status;
  }

  bool is_error() const { return error_.has_value(); }
  bool is_success() const { return !error_.has_value(); }
  const error_s &error() const { return error_.value(); }

  bool is(error_e code) const {
    return error_.has_value() && error_->error_code == code;
  }

private:
  std::optional<error_s> error_;
};

//! \brief Outcome of an operation that produces a T on success
template <typename T> class result_c {
public:
  result_c(T value) : value_(std::move(value)) {}
  result_c(const status_c &status) {
    if (status.is_error()) {
      error_ = status.error();
    }
  }

  static result_c fail(error_e code, std::string message) {
    return result_c(status_c::fail(code, std::move(message)));
  }

  bool is_error() const { return error_.has_value(); }
  bool is_success() const { return !error_.has_value(); }
  const error_s &error() const { return error_.value(); }
  const T &value() const { return value_.value(); }
  T take() { return std::move(value_).value(); }

  bool is(error_e code) const {
    return error_.has_value() && error_->error_code == code;
  }

  status_c status() const {
    if (error_.has_value()) {
      return status_c::fail(error_->error_code, error_->message);
    }
    return status_c::ok();
  }

private:
  std::optional<error_s> error_;
  std::optional<T> value_;
};

} // namespace tome
