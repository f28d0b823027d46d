#pragma once

#include <string>
#include <string_view>

#include "engine/types.hpp"

namespace convgen::engine {

inline constexpr std::string_view kConversionFunctionPrefix = "Convert_";
inline constexpr std::string_view kPrivateFunctionPrefix = "auto";

/// Last path segment with every non-alphanumeric character replaced by '_'.
auto package_tag(std::string_view package_path) -> std::string;

/// `Convert_<pkg>_<In>_To_<pkg>_<Out>`
auto public_conversion_name(const Type& in, const Type& out) -> std::string;

/// `autoConvert_<pkg>_<In>_To_<pkg>_<Out>`
auto private_conversion_name(const Type& in, const Type& out) -> std::string;

/// C++ namespace spelling of a package path: `example/v1` -> `example::v1`.
auto package_namespace(std::string_view package_path) -> std::string;

}  // namespace convgen::engine
