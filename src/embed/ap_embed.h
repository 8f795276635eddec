// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ap_embed.h
 * @brief asmprobe Embedding API.
 *
 * C API for resolving namespace / assembly references from a host
 * application (script engines, plugin loaders, any language with a C FFI).
 *
 * Usage:
 *   1. ap_create_context()      - Create a resolver context
 *   2. ap_add_search_dir()      - Add directories to probe, in order
 *      ap_set_ignore_file()     - Optional: file name never returned
 *      ap_load_config()         - Or load all of the above from a probe file
 *   3. ap_resolve()             - Resolve a name into existing file paths
 *   4. ap_result_count() / ap_result_path() - Read the paths
 *   5. ap_destroy_result(), ap_destroy_context() - Clean up
 */

#ifndef AP_EMBED_H
#define AP_EMBED_H

#include <stdint.h>
#include <stddef.h>

/* ============================================================================
 * Platform / Export Macros
 * ============================================================================ */

#ifdef __cplusplus
#define AP_EXTERN_C extern "C"
#else
#define AP_EXTERN_C
#endif

#if defined(_WIN32) || defined(_WIN64)
    #ifdef AP_BUILD_DLL
        #define AP_API AP_EXTERN_C __declspec(dllexport)
    #elif defined(AP_IMPORT_DLL)
        #define AP_API AP_EXTERN_C __declspec(dllimport)
    #else
        #define AP_API AP_EXTERN_C
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #define AP_API AP_EXTERN_C __attribute__((visibility("default")))
#else
    #define AP_API AP_EXTERN_C
#endif

/* ============================================================================
 * Opaque Handle Types
 * ============================================================================ */

/** Opaque handle to a resolver context (configuration + strategy) */
typedef struct APContext_* APContext;

/** Opaque handle to a list of resolved paths */
typedef struct APResolveResult_* APResolveResult;

/* ============================================================================
 * Error Codes
 * ============================================================================ */

typedef enum APResult {
    AP_OK                  = 0,
    AP_ERROR_INVALID_ARG   = 1,   /* Invalid argument passed */
    AP_ERROR_NOT_FOUND     = 2,   /* No probe file found */
    AP_ERROR_IO            = 3,   /* File I/O error */
    AP_ERROR_CONFIG        = 4,   /* Malformed probe file */
    AP_ERROR_OUT_OF_MEMORY = 5,   /* Memory allocation failed */
    AP_ERROR_CALLBACK      = 6    /* Custom resolve callback failed */
} APResult;

/* ============================================================================
 * Callback Types
 * ============================================================================ */

/**
 * Replacement resolution strategy.
 *
 * Receives the name and the search directories and reports matches with
 * ap_result_add_path(). Reporting nothing means "not found".
 *
 * @param context     The calling context
 * @param name        Namespace or assembly file name
 * @param search_dirs Search directories, in order
 * @param dir_count   Number of search directories
 * @param out_result  Result list to fill
 * @param user_data   User-provided data pointer
 * @return AP_OK on success; any other code fails ap_resolve()
 */
typedef APResult (*APResolveFunc)(APContext context,
                                  const char* name,
                                  const char* const* search_dirs,
                                  int dir_count,
                                  APResolveResult out_result,
                                  void* user_data);

/**
 * Trace callback: one line per probing decision
 * (directory missing, candidate ignored, match, shared fallback).
 */
typedef void (*APTraceFunc)(APContext context,
                            const char* message,
                            void* user_data);

/**
 * Error callback type.
 *
 * @param context    The calling context
 * @param error_code The error code
 * @param message    Human-readable error description
 * @param user_data  User-provided data pointer
 */
typedef void (*APErrorFunc)(APContext context,
                            APResult error_code,
                            const char* message,
                            void* user_data);

/* ============================================================================
 * Context Lifecycle
 * ============================================================================ */

/**
 * Create a new resolver context with no search directories,
 * no ignored file and the hosting module's directory as shared location.
 *
 * @return New context handle, or NULL on failure
 */
AP_API APContext ap_create_context(void);

/**
 * Destroy a context. Results obtained from it stay valid.
 */
AP_API void ap_destroy_context(APContext context);

/* ============================================================================
 * Configuration
 * ============================================================================ */

/**
 * Append a search directory. Directories are probed in insertion order.
 */
AP_API APResult ap_add_search_dir(APContext context, const char* dir);

/** Remove all search directories. */
AP_API void ap_clear_search_dirs(APContext context);

/**
 * Set the file name (not a path) that is never returned as a match.
 * NULL or "" clears it. Not synchronized: set before resolving.
 */
AP_API void ap_set_ignore_file(APContext context, const char* file_name);

/**
 * Override the shared fallback location.
 * NULL or "" restores the hosting module's directory.
 */
AP_API void ap_set_shared_directory(APContext context, const char* dir);

/**
 * Replace the context configuration with a probe file (*.approbe.json).
 *
 * @return AP_OK, AP_ERROR_IO if unreadable, AP_ERROR_CONFIG if malformed
 */
AP_API APResult ap_load_config(APContext context, const char* probe_file);

/**
 * Find the first probe file below root_dir and load it.
 *
 * @return AP_OK, AP_ERROR_NOT_FOUND if there is none, or an ap_load_config() error
 */
AP_API APResult ap_discover_config(APContext context, const char* root_dir);

/* ============================================================================
 * Resolution
 * ============================================================================ */

/**
 * Resolve a namespace / assembly name using the context's search directories.
 * "Not found" is not an error: the call succeeds with an empty result.
 *
 * @param context    The context
 * @param name       Namespace or assembly file name, or an absolute path
 * @param out_result Receives the result list; free with ap_destroy_result()
 * @return AP_OK, or AP_ERROR_CALLBACK if a custom strategy failed
 */
AP_API APResult ap_resolve(APContext context,
                           const char* name,
                           APResolveResult* out_result);

/**
 * Resolve with an explicit list of search directories.
 */
AP_API APResult ap_resolve_in(APContext context,
                              const char* name,
                              const char* const* search_dirs,
                              int dir_count,
                              APResolveResult* out_result);

/** Number of paths in a result. */
AP_API int ap_result_count(APResolveResult result);

/**
 * Path at index, or NULL when out of range.
 * Valid until ap_destroy_result().
 */
AP_API const char* ap_result_path(APResolveResult result, int index);

/** Append a path; for use inside an APResolveFunc. */
AP_API APResult ap_result_add_path(APResolveResult result, const char* path);

AP_API void ap_destroy_result(APResolveResult result);

/**
 * Install a replacement resolution strategy. NULL restores the default.
 */
AP_API void ap_set_resolve_callback(APContext context,
                                    APResolveFunc func,
                                    void* user_data);

/**
 * Returns 1 when name contains a reserved character (: * ? < > | ")
 * and is therefore treated as a literal path, 0 otherwise.
 */
AP_API int ap_is_path_token(const char* name);

/* ============================================================================
 * Callbacks & Error Information
 * ============================================================================ */

AP_API void ap_set_trace_callback(APContext context,
                                  APTraceFunc func,
                                  void* user_data);

AP_API void ap_set_error_callback(APContext context,
                                  APErrorFunc func,
                                  void* user_data);

/**
 * Get the last error message the calling thread saw on this context.
 * Error state is kept per thread, so ap_resolve() and ap_resolve_in() may run
 * concurrently on one context. The string is valid until the calling thread's
 * next API call.
 */
AP_API const char* ap_get_last_error(APContext context);

/* ============================================================================
 * Version Information
 * ============================================================================ */

/** Get asmprobe version string (e.g., "1.0.0") */
AP_API const char* ap_version(void);

/** Get asmprobe version components */
AP_API void ap_version_numbers(int* major, int* minor, int* patch);

#endif /* AP_EMBED_H */
