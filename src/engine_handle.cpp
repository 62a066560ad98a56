#include "huginn/engine_handle.h"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace huginn {

namespace {

// Hands the result back to the binary that allocated it
class ResultGuard {
public:
    ResultGuard(huginn_engine_release_result_fn release, huginn_engine_result* result)
        : release_(release), result_(result) {}
    ~ResultGuard() { release_(result_); }

    ResultGuard(const ResultGuard&) = delete;
    ResultGuard& operator=(const ResultGuard&) = delete;

private:
    huginn_engine_release_result_fn release_;
    huginn_engine_result* result_;
};

EngineStatus status_from_code(int code) {
    switch (code) {
        case HUGINN_ENGINE_OK: return EngineStatus::Ok;
        case HUGINN_ENGINE_ABORTED: return EngineStatus::Aborted;
        case HUGINN_ENGINE_ERROR: return EngineStatus::Error;
        default: return EngineStatus::Unknown;
    }
}

} // anonymous namespace

EngineHandle::EngineHandle(std::string identifier, EngineEntryPoints entry_points,
                           SharedLibrary library)
    : identifier_(std::move(identifier))
    , entry_points_(entry_points)
    , library_(std::move(library))
{
    if (!entry_points_.complete()) {
        throw std::invalid_argument("Incomplete entry-point table for engine '" + identifier_ + "'");
    }
}

EngineHandle::~EngineHandle() = default;

InferOutcome EngineHandle::infer(const std::vector<float>& samples,
                                 const TaskConfig& config,
                                 huginn_progress_fn on_progress,
                                 huginn_abort_check_fn on_abort_check,
                                 void* user_data) const
{
    huginn_engine_params params{};
    params.model_path = config.model_path.c_str();
    params.language = config.language.c_str();
    params.translate = config.translate ? 1 : 0;
    params.n_threads = config.threads;
    params.sample_rate = config.sample_rate;

    huginn_engine_result result{};

    int code = entry_points_.infer(samples.data(), samples.size(), &params,
                                   on_progress, on_abort_check, user_data, &result);
    ResultGuard guard(entry_points_.release_result, &result);

    InferOutcome outcome;
    outcome.raw_status = code;
    outcome.status = status_from_code(code);

    switch (outcome.status) {
        case EngineStatus::Ok:
            outcome.transcript.engine = identifier_;
            if (result.language) {
                outcome.transcript.language = result.language;
            }
            outcome.transcript.segments.reserve(result.n_segments);
            for (size_t i = 0; i < result.n_segments; ++i) {
                const huginn_segment& seg = result.segments[i];
                TranscriptSegment segment;
                segment.start = seg.start;
                segment.end = seg.end;
                segment.text = seg.text ? seg.text : "";
                outcome.transcript.segments.push_back(std::move(segment));
            }
            break;

        case EngineStatus::Error:
            outcome.error_code = result.error_code;
            outcome.message = result.error_message ? result.error_message
                                                   : "Engine reported an error";
            break;

        case EngineStatus::Aborted:
            outcome.message = "Engine stopped at abort check";
            break;

        case EngineStatus::Unknown:
            outcome.message = "Engine returned unknown status " + std::to_string(code);
            std::cerr << "[Engine] " << identifier_ << ": " << outcome.message << "\n";
            break;
    }

    return outcome;
}

std::string EngineHandle::describe() const {
    const char* text = entry_points_.describe();
    return text ? text : identifier_;
}

} // namespace huginn
