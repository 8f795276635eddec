// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ap_config.cpp
 * @brief Probe file loader implementation.
 */

#include "pch.h"
#include "ap_config.hpp"

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace asmprobe {

using json = nlohmann::json;

static bool ReadAllText(const fs::path& p, std::string& out, std::string& err) {
    std::ifstream f(p, std::ios::binary);
    if (!f.is_open()) { err = "cannot open: " + p.string(); return false; }
    out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return true;
}

static std::string Anchor(const fs::path& base_dir, const std::string& p) {
    fs::path path(p);
    if (path.is_absolute() || base_dir.empty()) return path.string();
    return (base_dir / path).lexically_normal().string();
}

bool ParseResolverConfig(const std::string& text,
                         const fs::path& base_dir,
                         ResolverConfig& out,
                         std::string& err)
{
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        err = "malformed JSON";
        return false;
    }
    if (!doc.is_object()) {
        err = "probe file must contain a JSON object";
        return false;
    }

    ResolverConfig cfg;
    cfg.probe.trace = out.probe.trace;

    if (auto it = doc.find("searchDirs"); it != doc.end()) {
        if (!it->is_array()) {
            err = "\"searchDirs\" must be an array of strings";
            return false;
        }
        for (const auto& dir : *it) {
            if (!dir.is_string()) {
                err = "\"searchDirs\" must be an array of strings";
                return false;
            }
            cfg.search_dirs.push_back(Anchor(base_dir, dir.get<std::string>()));
        }
    }

    if (auto it = doc.find("ignoreFile"); it != doc.end()) {
        if (!it->is_string()) {
            err = "\"ignoreFile\" must be a string";
            return false;
        }
        cfg.probe.ignore_file_name = it->get<std::string>();
    }

    if (auto it = doc.find("sharedDir"); it != doc.end()) {
        if (!it->is_string()) {
            err = "\"sharedDir\" must be a string";
            return false;
        }
        cfg.probe.shared_dir = fs::path(Anchor(base_dir, it->get<std::string>()));
    }

    out = std::move(cfg);
    return true;
}

bool LoadResolverConfig(const fs::path& probe_file, ResolverConfig& out, std::string& err) {
    std::string text;
    if (!ReadAllText(probe_file, text, err)) return false;

    if (!ParseResolverConfig(text, probe_file.parent_path(), out, err)) {
        err = probe_file.string() + ": " + err;
        return false;
    }
    return true;
}

static bool HasProbeSuffix(const fs::path& p) {
    const std::string name = p.filename().string();
    const std::string suffix = kProbeFileSuffix;
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool FindProbeFile(const fs::path& root_dir, fs::path& out_probe_file) {
    std::error_code ec;
    if (!fs::is_directory(root_dir, ec)) return false;

    fs::recursive_directory_iterator it(root_dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code file_ec;
        if (!it->is_regular_file(file_ec)) continue;
        if (HasProbeSuffix(it->path())) {
            out_probe_file = it->path();
            return true;
        }
    }
    return false;
}

} // namespace asmprobe
