#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace convgen::engine {

enum class ErrorCode {
  Invalid,
  /// No model exists for a requested package.
  NotFound,
};

struct GenError {
  ErrorCode code = ErrorCode::Invalid;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, GenError>;

inline auto make_error(std::string message) -> GenError {
  return GenError{ErrorCode::Invalid, std::move(message)};
}

inline auto make_error(ErrorCode code, std::string message) -> GenError {
  return GenError{code, std::move(message)};
}

/// Prefixes `error` with `context`, keeping its code.
inline auto with_context(std::string_view context, GenError error) -> GenError {
  error.message = std::string(context) + ": " + error.message;
  return error;
}

}  // namespace convgen::engine
