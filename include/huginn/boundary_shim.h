#pragma once

#include "huginn/export.h"
#include <atomic>
#include <cstdint>
#include <functional>

namespace huginn {

/**
 * @brief Control flags of one task, polled from the native worker
 */
struct TaskFlags {
    std::atomic<bool> cancel_requested{false};    // Monotonic: never cleared once set
    std::atomic<bool> pause_requested{false};
};

/**
 * @brief The only code native engines call back into
 *
 * Pass progress_trampoline/abort_trampoline as the engine callbacks and
 * the shim itself as user_data. Neither trampoline lets an exception out:
 * a throwing progress sink is caught, logged and counted (a "callback
 * fault") and the engine sees a normal return.
 *
 * Example:
 * @code
 *   huginn::BoundaryShim shim(flags, [](int pct) { update_ui(pct); });
 *   engine.infer(audio, config,
 *                &huginn::BoundaryShim::progress_trampoline,
 *                &huginn::BoundaryShim::abort_trampoline,
 *                &shim);
 * @endcode
 */
class HUGINN_API BoundaryShim {
public:
    using ProgressSink = std::function<void(int percent)>;

    BoundaryShim(const TaskFlags& flags, ProgressSink sink);

    BoundaryShim(const BoundaryShim&) = delete;
    BoundaryShim& operator=(const BoundaryShim&) = delete;

    static void progress_trampoline(void* user_data, int percent) noexcept;
    static int abort_trampoline(void* user_data) noexcept;

    /**
     * @brief Forward progress (clamped to 0-100) to the sink
     */
    void on_progress(int percent) noexcept;

    /**
     * @brief Exactly the task's cancel_requested flag
     */
    bool on_abort_check() const noexcept;

    /**
     * @brief Number of sink exceptions swallowed so far
     */
    uint64_t fault_count() const noexcept { return faults_.load(); }

private:
    const TaskFlags& flags_;
    ProgressSink sink_;
    std::atomic<uint64_t> faults_{0};
};

} // namespace huginn
