// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ap_resolver.cpp
 * @brief Resolver implementation.
 */

#include "pch.h"
#include "ap_resolver.hpp"
#include "ap_path_token.hpp"

namespace fs = std::filesystem;

namespace asmprobe {

Resolver::Resolver(ResolverConfig config)
    : config_(std::move(config)) {
}

std::vector<std::string> Resolver::Resolve(const std::string& name,
                                           const std::vector<std::string>& search_dirs) const
{
    if (algorithm_) {
        return algorithm_(name, search_dirs);
    }
    return DefaultResolve(name, search_dirs);
}

std::vector<std::string> Resolver::FindLiteralPath(const std::string& path) const {
    const fs::path p(path);
    if (!p.is_absolute()) return {};

    std::error_code ec;
    auto st = fs::status(p, ec);
    if (ec || !fs::exists(st) || fs::is_directory(st)) return {};

    if (config_.probe.trace) config_.probe.trace("literal path: " + path);
    return { path };
}

std::vector<std::string> Resolver::DefaultResolve(const std::string& name,
                                                  const std::vector<std::string>& search_dirs) const
{
    if (name.empty()) return {};

    if (IsPathToken(name)) {
        return FindLiteralPath(name);
    }

    for (const auto& dir : search_dirs) {
        auto found = FindLocalAssembly(name, dir, config_.probe);
        if (!found.empty()) {
            return found;
        }
    }

    return FindGlobalAssembly(RemoveAssemblyExtension(name), config_.probe);
}

} // namespace asmprobe
