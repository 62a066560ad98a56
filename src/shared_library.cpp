#include "huginn/shared_library.h"
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace huginn {

namespace {

#ifdef _WIN32
std::string last_windows_error() {
    DWORD code = GetLastError();
    if (code == 0) return "unknown error";

    LPSTR buffer = nullptr;
    DWORD size = FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, code, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
        reinterpret_cast<LPSTR>(&buffer), 0, nullptr);

    std::string message = (size && buffer) ? std::string(buffer, size) : "error " + std::to_string(code);
    if (buffer) LocalFree(buffer);

    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return message;
}
#endif

} // anonymous namespace

SharedLibrary::~SharedLibrary() {
    close();
}

SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept
    : handle_(std::exchange(other.handle_, nullptr))
    , path_(std::move(other.path_))
    , last_error_(std::move(other.last_error_))
{
}

SharedLibrary& SharedLibrary::operator=(SharedLibrary&& other) noexcept {
    if (this != &other) {
        close();
        handle_ = std::exchange(other.handle_, nullptr);
        path_ = std::move(other.path_);
        last_error_ = std::move(other.last_error_);
    }
    return *this;
}

bool SharedLibrary::open(const std::string& path) {
    close();
    last_error_.clear();

#ifdef _WIN32
    HMODULE module = LoadLibraryA(path.c_str());
    if (!module) {
        last_error_ = last_windows_error();
        return false;
    }
    handle_ = reinterpret_cast<void*>(module);
#else
    handle_ = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle_) {
        const char* err = dlerror();
        last_error_ = err ? err : "dlopen failed";
        return false;
    }
#endif

    path_ = path;
    return true;
}

void SharedLibrary::close() {
    if (!handle_) return;

#ifdef _WIN32
    FreeLibrary(reinterpret_cast<HMODULE>(handle_));
#else
    dlclose(handle_);
#endif

    handle_ = nullptr;
    path_.clear();
}

void* SharedLibrary::symbol(const char* name) {
    if (!handle_) {
        last_error_ = "Library is not open";
        return nullptr;
    }

#ifdef _WIN32
    FARPROC proc = GetProcAddress(reinterpret_cast<HMODULE>(handle_), name);
    if (!proc) {
        last_error_ = std::string("Missing symbol ") + name + ": " + last_windows_error();
        return nullptr;
    }
    return reinterpret_cast<void*>(proc);
#else
    dlerror();  // Clear any existing error
    void* sym = dlsym(handle_, name);
    const char* err = dlerror();
    if (err || !sym) {
        last_error_ = std::string("Missing symbol ") + name + ": " + (err ? err : "null address");
        return nullptr;
    }
    return sym;
#endif
}

const char* shared_library_suffix() {
#if defined(_WIN32)
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

} // namespace huginn
