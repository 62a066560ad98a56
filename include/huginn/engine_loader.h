#pragma once

#include "huginn/engine_handle.h"
#include "huginn/export.h"
#include "huginn/types.h"
#include <memory>
#include <string>

namespace huginn {

/**
 * @brief Finds and loads tier binaries for the resolver
 *
 * Split from BinaryResolver so the fallback walk can be driven by a
 * scripted loader without touching the filesystem.
 */
class HUGINN_API EngineLoader {
public:
    virtual ~EngineLoader() = default;

    /**
     * @brief Whether a tier binary is present at path
     */
    virtual bool exists(const std::string& path) const = 0;

    /**
     * @brief Load a tier binary
     * @param path Full path to the binary
     * @param candidate Candidate being attempted
     * @param error Filled with the reason on failure
     * @return Loaded handle, or nullptr on failure
     */
    virtual std::shared_ptr<EngineHandle> load(const std::string& path,
                                               const BinaryCandidate& candidate,
                                               std::string& error) = 0;
};

/**
 * @brief Loader over the platform dynamic linker
 *
 * Opens the library, binds the four huginn_engine_* symbols and checks the
 * ABI version. Any missing symbol or version mismatch counts as a load
 * failure.
 */
class HUGINN_API DynamicEngineLoader : public EngineLoader {
public:
    bool exists(const std::string& path) const override;

    std::shared_ptr<EngineHandle> load(const std::string& path,
                                       const BinaryCandidate& candidate,
                                       std::string& error) override;
};

} // namespace huginn
