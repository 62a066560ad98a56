#pragma once

/**
 * @file engine_abi.h
 * @brief C calling contract implemented by every Huginn tier binary
 *
 * Each accelerator build (CUDA, OpenVINO, CoreML, CPU) is a separate shared
 * library exporting the same four functions. The controller binds them by
 * name with dlopen/LoadLibrary, so nothing here may change layout without
 * bumping HUGINN_ENGINE_ABI_VERSION.
 *
 * Rules for implementers:
 * - huginn_engine_infer() blocks until the audio is processed, aborted, or
 *   an error occurs.
 * - progress and abort_check may be called from the thread running infer()
 *   only, at whatever cadence the engine chooses.
 * - A non-zero return from abort_check means "stop now": return
 *   HUGINN_ENGINE_ABORTED as soon as practical.
 * - C++ exceptions must not leave any of these functions.
 */

#include "export.h"
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

#define HUGINN_ENGINE_ABI_VERSION 1

/* Status codes returned by huginn_engine_infer() */
#define HUGINN_ENGINE_OK 0
#define HUGINN_ENGINE_ABORTED 1
#define HUGINN_ENGINE_ERROR 2

/* percent is 0-100; the return value carries no meaning */
typedef void (*huginn_progress_fn)(void* user_data, int percent);

/* non-zero = stop */
typedef int (*huginn_abort_check_fn)(void* user_data);

typedef struct huginn_engine_params {
    const char* model_path;   /* engine-specific model location */
    const char* language;     /* "auto" or ISO 639-1 code */
    int translate;            /* non-zero: translate to English */
    int n_threads;            /* 0 = engine default */
    int sample_rate;          /* always 16000 for now */
} huginn_engine_params;

typedef struct huginn_segment {
    float start;              /* seconds */
    float end;                /* seconds */
    char* text;               /* UTF-8, owned by the engine */
} huginn_segment;

typedef struct huginn_engine_result {
    huginn_segment* segments; /* owned by the engine */
    size_t n_segments;
    char* language;           /* detected language, may be NULL */
    int error_code;           /* engine specific, valid with HUGINN_ENGINE_ERROR */
    char* error_message;      /* may be NULL */
} huginn_engine_result;

typedef int (*huginn_engine_abi_version_fn)(void);
typedef const char* (*huginn_engine_describe_fn)(void);
typedef int (*huginn_engine_infer_fn)(const float* samples,
                                      size_t n_samples,
                                      const huginn_engine_params* params,
                                      huginn_progress_fn progress,
                                      huginn_abort_check_fn abort_check,
                                      void* user_data,
                                      huginn_engine_result* out);
typedef void (*huginn_engine_release_result_fn)(huginn_engine_result* result);

/* Entry points, exported by each tier binary */
HUGINN_ENGINE_EXPORT int huginn_engine_abi_version(void);
HUGINN_ENGINE_EXPORT const char* huginn_engine_describe(void);
HUGINN_ENGINE_EXPORT int huginn_engine_infer(const float* samples,
                                             size_t n_samples,
                                             const huginn_engine_params* params,
                                             huginn_progress_fn progress,
                                             huginn_abort_check_fn abort_check,
                                             void* user_data,
                                             huginn_engine_result* out);
HUGINN_ENGINE_EXPORT void huginn_engine_release_result(huginn_engine_result* result);

#ifdef __cplusplus
}
#endif
