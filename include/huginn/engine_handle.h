#pragma once

#include "huginn/engine_abi.h"
#include "huginn/export.h"
#include "huginn/shared_library.h"
#include "huginn/types.h"
#include <memory>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Entry points of one tier binary
 *
 * Filled by DynamicEngineLoader from a loaded library, or directly with
 * in-process functions (tests, statically linked engines).
 */
struct EngineEntryPoints {
    huginn_engine_abi_version_fn abi_version = nullptr;
    huginn_engine_describe_fn describe = nullptr;
    huginn_engine_infer_fn infer = nullptr;
    huginn_engine_release_result_fn release_result = nullptr;

    bool complete() const {
        return abi_version && describe && infer && release_result;
    }
};

/**
 * @brief How a native inference call ended
 */
enum class EngineStatus {
    Ok,
    Aborted,
    Error,
    Unknown     // Status code outside the ABI
};

struct InferOutcome {
    EngineStatus status = EngineStatus::Unknown;
    TranscriptResult transcript;        // Ok only
    int error_code = 0;
    std::string message;
    int raw_status = 0;                 // As returned by the binary
};

/**
 * @brief Owned wrapper around one loaded tier binary
 *
 * Keeps the library mapped for as long as the handle lives. Non-copyable;
 * shared between tasks through std::shared_ptr.
 */
class HUGINN_API EngineHandle {
public:
    /**
     * @param identifier Candidate identifier ("engine-linux-cuda")
     * @param entry_points Complete entry-point table
     * @param library Library the entry points live in (empty for in-process tables)
     * @throws std::invalid_argument if entry_points is incomplete
     */
    EngineHandle(std::string identifier, EngineEntryPoints entry_points,
                 SharedLibrary library = SharedLibrary());
    ~EngineHandle();

    EngineHandle(const EngineHandle&) = delete;
    EngineHandle& operator=(const EngineHandle&) = delete;

    /**
     * @brief Run inference on a mono PCM buffer
     *
     * Blocks until the binary returns. The result buffers are converted and
     * released before this returns, whatever the status. Exceptions are not
     * caught here; the caller owns that boundary.
     */
    InferOutcome infer(const std::vector<float>& samples,
                       const TaskConfig& config,
                       huginn_progress_fn on_progress,
                       huginn_abort_check_fn on_abort_check,
                       void* user_data) const;

    /**
     * @brief Engine self-description ("ctranslate2 whisper (cuda)")
     */
    std::string describe() const;

    const std::string& identifier() const { return identifier_; }
    const std::string& library_path() const { return library_.path(); }

private:
    std::string identifier_;
    EngineEntryPoints entry_points_;
    SharedLibrary library_;
};

} // namespace huginn
