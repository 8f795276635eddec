// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ap_resolver.hpp
 * @brief Assembly / namespace resolver.
 *
 * Resolver turns a namespace or assembly file name into the paths of
 * existing module files. The probing algorithm is a replaceable function
 * value; the default one searches the given directories in order and then
 * the shared location.
 */

#pragma once
#include "ap_probe.hpp"

#include <functional>
#include <string>
#include <vector>

namespace asmprobe {

// (name, search dirs) -> resolved file paths. An empty result means not found.
using ResolveAssemblyHandler =
    std::function<std::vector<std::string>(const std::string& name,
                                           const std::vector<std::string>& search_dirs)>;

struct ResolverConfig {
    std::vector<std::string> search_dirs;  // used by Resolve(name)
    ProbeOptions probe;
};

class Resolver {
public:
    Resolver() : Resolver(ResolverConfig{}) {}
    explicit Resolver(ResolverConfig config);

    // Resolves through the current algorithm.
    std::vector<std::string> Resolve(const std::string& name,
                                     const std::vector<std::string>& search_dirs) const;

    // Same, using the configured search directories.
    std::vector<std::string> Resolve(const std::string& name) const {
        return Resolve(name, config_.search_dirs);
    }

    // The built-in algorithm, regardless of SetAlgorithm().
    //  1. literal path (reserved chars): returned only if rooted and existing
    //  2. first search dir with a local match wins
    //  3. otherwise the shared location, with .dll/.exe stripped from the name
    std::vector<std::string> DefaultResolve(const std::string& name,
                                            const std::vector<std::string>& search_dirs) const;

    // Replaces the whole algorithm. An empty handler restores the default.
    void SetAlgorithm(ResolveAssemblyHandler handler) { algorithm_ = std::move(handler); }
    void ResetAlgorithm() { algorithm_ = nullptr; }
    bool HasCustomAlgorithm() const { return static_cast<bool>(algorithm_); }

    const ResolverConfig& config() const { return config_; }
    void SetConfig(ResolverConfig config) { config_ = std::move(config); }

    // Not synchronized; set before resolving.
    void SetIgnoreFileName(std::string file_name) { config_.probe.ignore_file_name = std::move(file_name); }
    void SetSharedDirectory(std::filesystem::path dir) { config_.probe.shared_dir = std::move(dir); }
    void SetSearchDirs(std::vector<std::string> dirs) { config_.search_dirs = std::move(dirs); }
    void AddSearchDir(std::string dir) { config_.search_dirs.push_back(std::move(dir)); }
    void SetTrace(TraceFunc trace) { config_.probe.trace = std::move(trace); }

private:
    ResolverConfig config_;
    ResolveAssemblyHandler algorithm_;

    std::vector<std::string> FindLiteralPath(const std::string& path) const;
};

} // namespace asmprobe
