#include "huginn/engine_loader.h"
#include <filesystem>
#include <iostream>

namespace huginn {

namespace {

template <typename Fn>
bool bind_symbol(SharedLibrary& library, const char* name, Fn& out, std::string& error) {
    void* sym = library.symbol(name);
    if (!sym) {
        error = library.get_last_error();
        return false;
    }
    out = reinterpret_cast<Fn>(sym);
    return true;
}

} // anonymous namespace

bool DynamicEngineLoader::exists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::shared_ptr<EngineHandle> DynamicEngineLoader::load(const std::string& path,
                                                        const BinaryCandidate& candidate,
                                                        std::string& error)
{
    SharedLibrary library;
    if (!library.open(path)) {
        error = library.get_last_error();
        return nullptr;
    }

    EngineEntryPoints entry_points;
    if (!bind_symbol(library, "huginn_engine_abi_version", entry_points.abi_version, error) ||
        !bind_symbol(library, "huginn_engine_describe", entry_points.describe, error) ||
        !bind_symbol(library, "huginn_engine_infer", entry_points.infer, error) ||
        !bind_symbol(library, "huginn_engine_release_result", entry_points.release_result, error)) {
        return nullptr;
    }

    int version = entry_points.abi_version();
    if (version != HUGINN_ENGINE_ABI_VERSION) {
        error = "ABI version " + std::to_string(version) + ", expected " +
                std::to_string(HUGINN_ENGINE_ABI_VERSION);
        return nullptr;
    }

    auto handle = std::make_shared<EngineHandle>(candidate.identifier, entry_points, std::move(library));
    std::cout << "[Engine] Loaded " << handle->describe() << " from " << path << "\n";
    return handle;
}

} // namespace huginn
