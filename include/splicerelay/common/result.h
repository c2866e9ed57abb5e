#pragma once

#include "splicerelay/common/status.h"
#include <absl/status/statusor.h>
#include <string>
#include <type_traits>
#include <utility>

namespace splicerelay::common {

// Result type alias for fallible operations returning a value
template <typename T>
using Result = absl::StatusOr<T>;

// Helper to create successful results
template <typename T>
Result<std::decay_t<T>> Ok(T&& value) {
  return Result<std::decay_t<T>>(std::forward<T>(value));
}

// Helper to create error results
template <typename T>
Result<T> Error(absl::Status status) {
  return Result<T>(std::move(status));
}

// Helper to create error results from a relay error code
template <typename T>
Result<T> Error(RelayErrorCode code, const std::string& message) {
  return Result<T>(MakeStatus(code, message));
}

// Helper to unwrap Result with default value
template <typename T>
T UnwrapOr(const Result<T>& result, T&& default_value) {
  return result.ok() ? result.value() : std::forward<T>(default_value);
}

}
