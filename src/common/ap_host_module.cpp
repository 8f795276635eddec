// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ap_host_module.cpp
 * @brief Locates the directory of the hosting module.
 *
 * The shared location is the directory of the binary the resolver lives
 * in: the shared library when built as one, otherwise the executable.
 */

#include "pch.h"
#include "ap_probe.hpp"

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace fs = std::filesystem;

namespace asmprobe {

namespace {

// Any symbol inside this module works as an address to query.
const char kModuleAnchor = 0;

#ifdef _WIN32
std::optional<fs::path> ModuleFileOf(const void* address) {
    HMODULE module = nullptr;
    if (!GetModuleHandleExW(GET_MODULE_HANDLE_EX_FLAG_FROM_ADDRESS |
                            GET_MODULE_HANDLE_EX_FLAG_UNCHANGED_REFCOUNT,
                            static_cast<LPCWSTR>(address), &module)) {
        return std::nullopt;
    }
    wchar_t buf[MAX_PATH];
    DWORD len = GetModuleFileNameW(module, buf, MAX_PATH);
    if (len == 0 || len == MAX_PATH) return std::nullopt;
    return fs::path(std::wstring(buf, len));
}
#else
// For the main program glibc reports argv[0] as dli_fname, which is a bare
// name when started through PATH. Only an absolute name is trusted here.
std::optional<fs::path> ModuleFileOf(const void* address) {
    Dl_info info{};
    if (dladdr(address, &info) == 0 || !info.dli_fname || !*info.dli_fname) {
        return std::nullopt;
    }
    fs::path file(info.dli_fname);
    if (!file.is_absolute()) return std::nullopt;
    return file;
}
#endif

std::optional<fs::path> ExecutableFile() {
#if defined(__linux__)
    std::error_code ec;
    auto p = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return std::nullopt;
    return p;
#else
    return std::nullopt;
#endif
}

} // anonymous namespace

std::optional<fs::path> HostModuleDirectory() {
    auto file = ModuleFileOf(&kModuleAnchor);
    if (!file) file = ExecutableFile();
    if (!file) return std::nullopt;

    if (!file->is_absolute()) return std::nullopt;

    auto dir = file->parent_path();
    if (dir.empty()) return std::nullopt;
    return dir;
}

} // namespace asmprobe
