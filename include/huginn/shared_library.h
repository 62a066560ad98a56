#pragma once

#include "huginn/export.h"
#include <string>

namespace huginn {

/**
 * @brief Owned handle to a dynamically loaded shared library
 *
 * Thin RAII wrapper over dlopen/dlsym (POSIX) and LoadLibrary/GetProcAddress
 * (Windows). Libraries are opened with RTLD_NOW | RTLD_LOCAL so that two tier
 * binaries built against different CTranslate2/CUDA runtimes never see each other's
 * symbols.
 */
class HUGINN_API SharedLibrary {
public:
    SharedLibrary() = default;
    ~SharedLibrary();

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;
    SharedLibrary(SharedLibrary&& other) noexcept;
    SharedLibrary& operator=(SharedLibrary&& other) noexcept;

    /**
     * @brief Load a library
     * @param path File path or soname (resolved by the platform loader)
     * @return True if successful; see get_last_error() otherwise
     */
    bool open(const std::string& path);

    /**
     * @brief Unload the library (no-op if not open)
     */
    void close();

    bool is_open() const { return handle_ != nullptr; }

    /**
     * @brief Look up an exported symbol
     * @return Symbol address, or nullptr (get_last_error() says why)
     */
    void* symbol(const char* name);

    const std::string& path() const { return path_; }
    std::string get_last_error() const { return last_error_; }

private:
    void* handle_ = nullptr;
    std::string path_;
    std::string last_error_;
};

/**
 * @brief Platform shared-object suffix (".so", ".dll", ".dylib")
 */
HUGINN_API const char* shared_library_suffix();

} // namespace huginn
