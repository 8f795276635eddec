// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ap_config.hpp
 * @brief Probe file (*.approbe.json) loader.
 *
 * A probe file configures a Resolver: search directories, the file name
 * to ignore, and an optional shared-location override. Relative paths are
 * taken relative to the probe file's directory.
 *
 *   {
 *     "searchDirs": ["lib", "/opt/app/modules"],
 *     "ignoreFile": "host.dll",
 *     "sharedDir": "/usr/lib/app"
 *   }
 */

#pragma once
#include "ap_resolver.hpp"

#include <filesystem>
#include <string>

namespace asmprobe {

inline constexpr const char* kProbeFileSuffix = ".approbe.json";

bool LoadResolverConfig(const std::filesystem::path& probe_file, ResolverConfig& out, std::string& err);

// Parses probe file text; `base_dir` anchors relative paths.
bool ParseResolverConfig(const std::string& text,
                         const std::filesystem::path& base_dir,
                         ResolverConfig& out,
                         std::string& err);

// First *.approbe.json below `root_dir` (recursive).
bool FindProbeFile(const std::filesystem::path& root_dir, std::filesystem::path& out_probe_file);

} // namespace asmprobe
