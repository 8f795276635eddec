// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file asmprobe_cli.cpp
 * @brief asmprobe command-line interface.
 *
 * Resolves namespace / assembly names against search directories and
 * prints the resulting paths. Entry point for the asmprobe executable.
 */

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ap_config.hpp"
#include "ap_embed.h"
#include "ap_path_token.hpp"
#include "ap_resolver.hpp"

using namespace asmprobe;

namespace {

// Exit codes
constexpr int kExitResolved = 0;
constexpr int kExitError = 1;
constexpr int kExitNotFound = 2;

void print_usage() {
    std::cerr << R"(
asmprobe - assembly / namespace resolver v)" << ap_version() << R"(

Usage: asmprobe <command> [options]

Commands:
  resolve <name>              Resolve a name into existing module files
      -d, --dir <dir>         Search directory (repeatable, probed in order)
      --ignore <file>         File name never accepted as a match
      --shared <dir>          Shared fallback directory [default: this binary's dir]
      --config <file>         Load a probe file (*.approbe.json); -d adds to it
      --json                  Print the result as JSON
      --verbose               Trace probing decisions to stderr

  check <name>                Tell whether <name> is a literal path or a symbolic name

  version                     Show version information
  help                        Show this help message

Exit codes:
  0  resolved   2  nothing found   1  usage or configuration error

Examples:
  asmprobe resolve System.Xml -d ./lib -d /opt/app/modules
  asmprobe resolve MyPlugin --config app.approbe.json --json
)";
}

void print_version() {
    std::cout << "asmprobe version " << ap_version() << "\n";
}

// ============== Resolve ==============
int cmd_resolve(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Error: Missing name\n";
        std::cerr << "Usage: asmprobe resolve <name> [options]\n";
        return kExitError;
    }

    const std::string name = argv[0];
    std::vector<std::string> dirs;
    std::string ignore;
    bool has_ignore = false;
    std::filesystem::path shared;
    std::filesystem::path config_path;
    bool as_json = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-d" || arg == "--dir") && i + 1 < argc) {
            dirs.push_back(argv[++i]);
        } else if (arg == "--ignore" && i + 1 < argc) {
            ignore = argv[++i];
            has_ignore = true;
        } else if (arg == "--shared" && i + 1 < argc) {
            shared = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--json") {
            as_json = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return kExitError;
        }
    }

    ResolverConfig config;
    if (!config_path.empty()) {
        std::string err;
        if (!LoadResolverConfig(config_path, config, err)) {
            std::cerr << "Error: Failed to load probe file: " << err << "\n";
            return kExitError;
        }
    }

    config.search_dirs.insert(config.search_dirs.end(), dirs.begin(), dirs.end());
    if (has_ignore) config.probe.ignore_file_name = ignore;
    if (!shared.empty()) config.probe.shared_dir = shared;
    if (verbose) {
        config.probe.trace = [](const std::string& message) {
            std::cerr << "[probe] " << message << "\n";
        };
    }

    Resolver resolver(std::move(config));
    const auto paths = resolver.Resolve(name);

    if (as_json) {
        nlohmann::json out;
        out["name"] = name;
        out["searchDirs"] = resolver.config().search_dirs;
        out["paths"] = paths;
        std::cout << out.dump(2) << "\n";
    } else {
        for (const auto& p : paths) {
            std::cout << p << "\n";
        }
    }

    if (paths.empty()) {
        if (!as_json) std::cerr << "Error: '" << name << "' not found\n";
        return kExitNotFound;
    }
    return kExitResolved;
}

// ============== Check ==============
int cmd_check(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Error: Missing name\n";
        std::cerr << "Usage: asmprobe check <name>\n";
        return kExitError;
    }

    const std::string name = argv[0];
    if (IsPathToken(name)) {
        std::cout << "path\n";
    } else {
        std::cout << "name";
        const std::string ext = GetExtension(name);
        if (!ext.empty()) std::cout << " (extension " << ext << ")";
        std::cout << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return kExitError;
    }

    std::string command = argv[1];

    if (command == "resolve") {
        return cmd_resolve(argc - 2, argv + 2);
    } else if (command == "check") {
        return cmd_check(argc - 2, argv + 2);
    } else if (command == "version" || command == "-v" || command == "--version") {
        print_version();
        return 0;
    } else if (command == "help" || command == "-h" || command == "--help") {
        print_usage();
        return 0;
    } else {
        std::cerr << "Error: Unknown command '" << command << "'\n";
        print_usage();
        return kExitError;
    }
}
