// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ap_path_token.hpp
 * @brief Name classification and extension helpers.
 *
 * Decides whether a reference string is a literal path or a symbolic
 * (namespace-like) name, and provides the extension helpers used while
 * probing for module files.
 */

#pragma once
#include <string>
#include <string_view>

namespace asmprobe {

// Characters that cannot appear in a symbolic name but can in a path.
inline constexpr std::string_view kReservedPathChars = ":*?<>|\"";

// True when `name` contains a reserved character, i.e. it is being used
// as a literal path. Pure function of the characters; no file-system access.
bool IsPathToken(std::string_view name);

// Last path component. Both '/' and '\\' are separators.
std::string GetFileName(std::string_view path);

// Extension of the last component including the dot (".dll").
// Empty when the component has no dot or ends with one.
std::string GetExtension(std::string_view name);

// Strips a trailing ".dll" / ".exe" (case-insensitive).
std::string RemoveAssemblyExtension(std::string_view name);

} // namespace asmprobe
