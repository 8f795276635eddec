// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ap_probe.cpp
 * @brief Directory probing implementation.
 *
 * Each file-system query uses the std::error_code overloads; an error at
 * any step is reported through the trace callback and counts as "no match"
 * for that directory only.
 */

#include "pch.h"
#include "ap_probe.hpp"
#include "ap_path_token.hpp"

namespace fs = std::filesystem;

namespace asmprobe {

static void Trace(const ProbeOptions& options, const std::string& message) {
    if (options.trace) options.trace(message);
}

static bool IsDirectory(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

// Matches "file exists" semantics: anything present that is not a directory.
static bool IsFile(const fs::path& p) {
    std::error_code ec;
    auto st = fs::status(p, ec);
    if (ec) return false;
    return fs::exists(st) && !fs::is_directory(st);
}

static std::optional<std::string> ToAbsolute(const fs::path& p) {
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    if (ec) return std::nullopt;
    return abs.string();
}

static std::vector<std::string> Match(const fs::path& file, const ProbeOptions& options) {
    auto abs = ToAbsolute(file);
    if (!abs) {
        Trace(options, "cannot make absolute: " + file.string());
        return {};
    }
    Trace(options, "matched: " + *abs);
    return { *abs };
}

std::vector<std::string> FindLocalAssembly(const std::string& name,
                                           const std::string& dir,
                                           const ProbeOptions& options)
{
    if (name.empty()) return {};

    const fs::path asm_file = fs::path(dir) / fs::path(name);

    // `name` may carry subdirectory parts, so check the joined path's parent
    // rather than `dir` itself.
    if (!IsDirectory(asm_file.parent_path())) {
        Trace(options, "directory missing: " + asm_file.parent_path().string());
        return {};
    }

    // Both lists end up trying the joined path itself, which also covers
    // names with subdirectory parts such as "plugins/Foo".
    static const char* const kBareFirst[] = { "", ".dll", ".exe" };
    static const char* const kModuleFirst[] = { ".dll", ".exe", "" };
    const auto& extensions = GetExtension(name).empty() ? kModuleFirst : kBareFirst;

    for (const char* ext : extensions) {
        fs::path file = asm_file;
        file += ext;

        const std::string file_name = GetFileName(file.string());
        if (options.IsIgnored(file_name)) {
            Trace(options, "ignored: " + file.string());
            continue;
        }
        if (IsFile(file)) {
            return Match(file, options);
        }
    }

    return {};
}

std::vector<std::string> FindGlobalAssembly(const std::string& name, const ProbeOptions& options) {
    std::optional<fs::path> shared_dir = options.shared_dir;
    if (!shared_dir) shared_dir = HostModuleDirectory();

    if (!shared_dir || shared_dir->empty()) {
        Trace(options, "no shared location for: " + name);
        return {};
    }

    Trace(options, "shared location: " + shared_dir->string());
    return FindLocalAssembly(name, shared_dir->string(), options);
}

} // namespace asmprobe
