#pragma once

#include <leasegate/schema/error_code.hpp>
#include <leasegate/schema/primitives.hpp>
#include <optional>
#include <string>
#include <variant>

namespace leasegate::execution {

/// Who is calling and when. `now` is the block time in seconds.
struct call_context final {
  leasegate::schema::account_id_t caller{};
  leasegate::schema::timestamp_seconds_t now{};
};

/// Outcome of a state transition: a named failure or a value.
template <typename T>
struct operation_result final {
  leasegate::schema::error_code code{leasegate::schema::error_code::ok};
  std::string message;
  std::optional<T> value;

  bool ok() const { return code == leasegate::schema::error_code::ok; }

  leasegate::schema::error_category category() const {
    return leasegate::schema::category_of(code);
  }
};

using empty_result_t = operation_result<std::monostate>;

template <typename T>
operation_result<T> make_success(T value) {
  return operation_result<T>{.code = leasegate::schema::error_code::ok,
                             .message = {},
                             .value = std::move(value)};
}

inline empty_result_t make_success() {
  return make_success(std::monostate{});
}

template <typename T = std::monostate>
operation_result<T> make_failure(const leasegate::schema::error_code code,
                                 std::string message) {
  return operation_result<T>{
      .code = code, .message = std::move(message), .value = std::nullopt};
}

/// Re-label a failure for a different value type.
template <typename T, typename U>
operation_result<T> forward_failure(const operation_result<U>& failure) {
  return make_failure<T>(failure.code, failure.message);
}

}  // namespace leasegate::execution
