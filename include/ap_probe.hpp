// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ap_probe.hpp
 * @brief Directory probing for module files.
 *
 * FindLocalAssembly() applies the extension-priority search to a single
 * directory. FindGlobalAssembly() runs the same search against the shared
 * location (the directory of the hosting module, or a configured override).
 */

#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace asmprobe {

// Receives one line per probing decision.
using TraceFunc = std::function<void(const std::string& message)>;

struct ProbeOptions {
    // File name (not a path) never accepted as a result. Empty = none.
    std::string ignore_file_name;

    // Replaces the hosting module's directory as the shared location.
    std::optional<std::filesystem::path> shared_dir;

    TraceFunc trace;

    bool IsIgnored(const std::string& file_name) const {
        return !ignore_file_name.empty() && file_name == ignore_file_name;
    }
};

// Returns at most one path: the first existing candidate for `name` in `dir`.
//   extensionless name: name.dll, name.exe, name
//   name with extension: name, name.dll, name.exe
// Never throws for missing directories or malformed names; those yield {}.
std::vector<std::string> FindLocalAssembly(const std::string& name,
                                           const std::string& dir,
                                           const ProbeOptions& options);

// FindLocalAssembly() against the shared location.
std::vector<std::string> FindGlobalAssembly(const std::string& name,
                                            const ProbeOptions& options);

// Directory containing the module (shared library or executable) this code
// was linked into. nullopt when the platform cannot tell.
std::optional<std::filesystem::path> HostModuleDirectory();

} // namespace asmprobe
