// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ap_path_token.cpp
 * @brief Name classification and extension helpers implementation.
 */

#include "pch.h"
#include "ap_path_token.hpp"

namespace asmprobe {

static bool IsSeparator(char ch) {
    return ch == '/' || ch == '\\';
}

static bool EndsWithNoCase(std::string_view s, std::string_view suffix) {
    if (s.size() < suffix.size()) return false;
    auto tail = s.substr(s.size() - suffix.size());
    for (size_t i = 0; i < suffix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(tail[i])) !=
            std::tolower(static_cast<unsigned char>(suffix[i]))) {
            return false;
        }
    }
    return true;
}

bool IsPathToken(std::string_view name) {
    return name.find_first_of(kReservedPathChars) != std::string_view::npos;
}

std::string GetFileName(std::string_view path) {
    for (size_t i = path.size(); i > 0; --i) {
        if (IsSeparator(path[i - 1])) {
            return std::string(path.substr(i));
        }
    }
    return std::string(path);
}

std::string GetExtension(std::string_view name) {
    for (size_t i = name.size(); i > 0; --i) {
        const char ch = name[i - 1];
        if (ch == '.') {
            // "Foo." has no extension
            if (i == name.size()) return {};
            return std::string(name.substr(i - 1));
        }
        if (IsSeparator(ch)) break;
    }
    return {};
}

std::string RemoveAssemblyExtension(std::string_view name) {
    if (EndsWithNoCase(name, ".dll") || EndsWithNoCase(name, ".exe")) {
        return std::string(name.substr(0, name.size() - 4));
    }
    return std::string(name);
}

} // namespace asmprobe
