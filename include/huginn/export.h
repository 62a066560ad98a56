#pragma once

/**
 * @file export.h
 * @brief Symbol visibility macros for the Huginn library
 *
 * NOTE: With WINDOWS_EXPORT_ALL_SYMBOLS, CMake auto-generates exports.
 *       HUGINN_API stays an empty macro on the library side.
 *
 * HUGINN_ENGINE_EXPORT is different: tier binaries are looked up by symbol
 * name at runtime, so their C entry points must be exported explicitly.
 */

#define HUGINN_API

#if defined(_WIN32)
#define HUGINN_ENGINE_EXPORT __declspec(dllexport)
#else
#define HUGINN_ENGINE_EXPORT __attribute__((visibility("default")))
#endif
