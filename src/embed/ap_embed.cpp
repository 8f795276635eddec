// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ap_embed.cpp
 * @brief asmprobe Embedding API implementation.
 */

#include "pch.h"
#include "ap_embed.h"

#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

#include "ap_config.hpp"
#include "ap_path_token.hpp"
#include "ap_resolver.hpp"

using namespace asmprobe;

/* ============================================================================
 * Version
 * ============================================================================ */

// AP_VERSION_MAJOR / MINOR / PATCH come from the project() version in CMake.
#define AP_STRINGIFY_(x) #x
#define AP_STRINGIFY(x) AP_STRINGIFY_(x)

static const char* AP_VERSION_STRING =
    AP_STRINGIFY(AP_VERSION_MAJOR) "." AP_STRINGIFY(AP_VERSION_MINOR) "." AP_STRINGIFY(AP_VERSION_PATCH);

/* ============================================================================
 * Internal Structures
 * ============================================================================ */

struct APResolveResult_ {
    std::vector<std::string> paths;
};

namespace {

// Error state lives per thread, like errno, so concurrent calls on one
// context never share a buffer. It remembers which context failed.
struct LastError {
    const APContext_* context{ nullptr };
    std::string message;
};

thread_local LastError t_last_error;

} // anonymous namespace

struct APContext_ {
    Resolver resolver;

    APTraceFunc trace_callback{ nullptr };
    void* trace_user_data{ nullptr };

    APErrorFunc error_callback{ nullptr };
    void* error_user_data{ nullptr };

    void set_error(APResult code, const std::string& msg) {
        t_last_error.context = this;
        t_last_error.message = msg;
        if (error_callback) {
            error_callback(this, code, msg.c_str(), error_user_data);
        }
    }

    void clear_error() const {
        if (t_last_error.context == this) {
            t_last_error.context = nullptr;
            t_last_error.message.clear();
        }
    }
};

namespace {

// Raised when an APResolveFunc returns a non-OK code.
class CallbackError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Bridges an APResolveFunc into a ResolveAssemblyHandler so the C callback
 * replaces the whole algorithm, exactly like a C++ SetAlgorithm() caller.
 */
ResolveAssemblyHandler make_bridge(APContext ctx, APResolveFunc func, void* user_data) {
    return [ctx, func, user_data](const std::string& name,
                                  const std::vector<std::string>& search_dirs) {
        std::vector<const char*> dirs;
        dirs.reserve(search_dirs.size());
        for (const auto& d : search_dirs) {
            dirs.push_back(d.c_str());
        }

        APResolveResult_ result;
        APResult res = func(ctx,
                            name.c_str(),
                            dirs.data(),
                            static_cast<int>(dirs.size()),
                            &result,
                            user_data);

        if (res != AP_OK) {
            throw CallbackError("resolve callback for '" + name +
                                "' returned error code " + std::to_string(res));
        }
        return std::move(result.paths);
    };
}

void install_trace(APContext ctx) {
    if (!ctx->trace_callback) {
        ctx->resolver.SetTrace(nullptr);
        return;
    }
    ctx->resolver.SetTrace([ctx](const std::string& message) {
        ctx->trace_callback(ctx, message.c_str(), ctx->trace_user_data);
    });
}

APResult resolve_into(APContext context,
                      const char* name,
                      const std::vector<std::string>* search_dirs,
                      APResolveResult* out_result) {
    try {
        auto result = std::make_unique<APResolveResult_>();
        result->paths = search_dirs
            ? context->resolver.Resolve(name, *search_dirs)
            : context->resolver.Resolve(name);
        *out_result = result.release();
        return AP_OK;
    }
    catch (const CallbackError& e) {
        context->set_error(AP_ERROR_CALLBACK, e.what());
        return AP_ERROR_CALLBACK;
    }
    catch (const std::bad_alloc&) {
        context->set_error(AP_ERROR_OUT_OF_MEMORY, "out of memory while resolving");
        return AP_ERROR_OUT_OF_MEMORY;
    }
    catch (const std::exception& e) {
        // thrown by a user callback through its own code paths
        context->set_error(AP_ERROR_CALLBACK, e.what());
        return AP_ERROR_CALLBACK;
    }
}

} // anonymous namespace

/* ============================================================================
 * Context Lifecycle Implementation
 * ============================================================================ */

AP_API APContext ap_create_context(void) {
    return new (std::nothrow) APContext_();
}

AP_API void ap_destroy_context(APContext context) {
    if (!context) return;
    context->clear_error();
    delete context;
}

/* ============================================================================
 * Configuration Implementation
 * ============================================================================ */

AP_API APResult ap_add_search_dir(APContext context, const char* dir) {
    if (!context || !dir) return AP_ERROR_INVALID_ARG;
    context->clear_error();
    context->resolver.AddSearchDir(dir);
    return AP_OK;
}

AP_API void ap_clear_search_dirs(APContext context) {
    if (!context) return;
    context->resolver.SetSearchDirs({});
}

AP_API void ap_set_ignore_file(APContext context, const char* file_name) {
    if (!context) return;
    context->resolver.SetIgnoreFileName(file_name ? file_name : "");
}

AP_API void ap_set_shared_directory(APContext context, const char* dir) {
    if (!context) return;
    ResolverConfig cfg = context->resolver.config();
    if (dir && *dir) {
        cfg.probe.shared_dir = std::filesystem::path(dir);
    } else {
        cfg.probe.shared_dir.reset();
    }
    context->resolver.SetConfig(std::move(cfg));
}

AP_API APResult ap_load_config(APContext context, const char* probe_file) {
    if (!context || !probe_file) return AP_ERROR_INVALID_ARG;
    context->clear_error();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(probe_file, ec)) {
        context->set_error(AP_ERROR_IO, std::string("cannot open: ") + probe_file);
        return AP_ERROR_IO;
    }

    ResolverConfig cfg;
    std::string err;
    if (!LoadResolverConfig(probe_file, cfg, err)) {
        context->set_error(AP_ERROR_CONFIG, err);
        return AP_ERROR_CONFIG;
    }

    context->resolver.SetConfig(std::move(cfg));
    install_trace(context);
    return AP_OK;
}

AP_API APResult ap_discover_config(APContext context, const char* root_dir) {
    if (!context || !root_dir) return AP_ERROR_INVALID_ARG;
    context->clear_error();

    std::filesystem::path probe_file;
    if (!FindProbeFile(root_dir, probe_file)) {
        context->set_error(AP_ERROR_NOT_FOUND,
                           std::string("no *") + kProbeFileSuffix + " under " + root_dir);
        return AP_ERROR_NOT_FOUND;
    }
    return ap_load_config(context, probe_file.string().c_str());
}

/* ============================================================================
 * Resolution Implementation
 * ============================================================================ */

AP_API APResult ap_resolve(APContext context,
                           const char* name,
                           APResolveResult* out_result) {
    if (!context || !name || !out_result) return AP_ERROR_INVALID_ARG;
    context->clear_error();
    return resolve_into(context, name, nullptr, out_result);
}

AP_API APResult ap_resolve_in(APContext context,
                              const char* name,
                              const char* const* search_dirs,
                              int dir_count,
                              APResolveResult* out_result) {
    if (!context || !name || !out_result || dir_count < 0) return AP_ERROR_INVALID_ARG;
    if (dir_count > 0 && !search_dirs) return AP_ERROR_INVALID_ARG;
    context->clear_error();

    std::vector<std::string> dirs;
    for (int i = 0; i < dir_count; ++i) {
        if (!search_dirs[i]) return AP_ERROR_INVALID_ARG;
        dirs.emplace_back(search_dirs[i]);
    }
    return resolve_into(context, name, &dirs, out_result);
}

AP_API int ap_result_count(APResolveResult result) {
    if (!result) return 0;
    return static_cast<int>(result->paths.size());
}

AP_API const char* ap_result_path(APResolveResult result, int index) {
    if (!result || index < 0 || index >= static_cast<int>(result->paths.size())) return nullptr;
    return result->paths[static_cast<size_t>(index)].c_str();
}

AP_API APResult ap_result_add_path(APResolveResult result, const char* path) {
    if (!result || !path) return AP_ERROR_INVALID_ARG;
    result->paths.emplace_back(path);
    return AP_OK;
}

AP_API void ap_destroy_result(APResolveResult result) {
    delete result;
}

AP_API void ap_set_resolve_callback(APContext context,
                                    APResolveFunc func,
                                    void* user_data) {
    if (!context) return;
    if (func) {
        context->resolver.SetAlgorithm(make_bridge(context, func, user_data));
    } else {
        context->resolver.ResetAlgorithm();
    }
}

AP_API int ap_is_path_token(const char* name) {
    if (!name) return 0;
    return IsPathToken(name) ? 1 : 0;
}

/* ============================================================================
 * Callbacks & Error Information Implementation
 * ============================================================================ */

AP_API void ap_set_trace_callback(APContext context,
                                  APTraceFunc func,
                                  void* user_data) {
    if (!context) return;
    context->trace_callback = func;
    context->trace_user_data = user_data;
    install_trace(context);
}

AP_API void ap_set_error_callback(APContext context,
                                  APErrorFunc func,
                                  void* user_data) {
    if (!context) return;
    context->error_callback = func;
    context->error_user_data = user_data;
}

AP_API const char* ap_get_last_error(APContext context) {
    if (!context || t_last_error.context != context) return "";
    return t_last_error.message.c_str();
}

/* ============================================================================
 * Version Implementation
 * ============================================================================ */

AP_API const char* ap_version(void) {
    return AP_VERSION_STRING;
}

AP_API void ap_version_numbers(int* major, int* minor, int* patch) {
    if (major) *major = AP_VERSION_MAJOR;
    if (minor) *minor = AP_VERSION_MINOR;
    if (patch) *patch = AP_VERSION_PATCH;
}
