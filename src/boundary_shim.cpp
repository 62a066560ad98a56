#include "huginn/boundary_shim.h"
#include <algorithm>
#include <exception>
#include <iostream>

namespace huginn {

BoundaryShim::BoundaryShim(const TaskFlags& flags, ProgressSink sink)
    : flags_(flags)
    , sink_(std::move(sink))
{
}

void BoundaryShim::progress_trampoline(void* user_data, int percent) noexcept {
    if (!user_data) return;
    static_cast<BoundaryShim*>(user_data)->on_progress(percent);
}

int BoundaryShim::abort_trampoline(void* user_data) noexcept {
    if (!user_data) return 0;
    return static_cast<const BoundaryShim*>(user_data)->on_abort_check() ? 1 : 0;
}

void BoundaryShim::on_progress(int percent) noexcept {
    if (!sink_) return;

    percent = std::clamp(percent, 0, 100);

    // Nothing may unwind into the engine's stack frames
    try {
        sink_(percent);
    } catch (const std::exception& e) {
        ++faults_;
        std::cerr << "[Boundary] Progress consumer threw (swallowed): " << e.what() << "\n";
    } catch (...) {
        ++faults_;
        std::cerr << "[Boundary] Progress consumer threw a non-standard exception (swallowed)\n";
    }
}

bool BoundaryShim::on_abort_check() const noexcept {
    return flags_.cancel_requested.load();
}

} // namespace huginn
