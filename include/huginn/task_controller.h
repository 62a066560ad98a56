#pragma once

#include "huginn/binary_resolver.h"
#include "huginn/export.h"
#include "huginn/types.h"
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>

namespace huginn {

/**
 * @brief start() called while a task is still active
 */
class HUGINN_API TaskRejectedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Event consumer for the application
 *
 * Called on the controller's worker thread for progress and terminal
 * events, and on the calling thread for state changes caused by
 * start/pause/resume/cancel. Deliveries are serialized; the consumer may
 * call pause()/resume()/cancel()/start() from inside the callback.
 *
 * Every delivery runs under the controller's delivery lock, which
 * pause()/resume()/cancel() also take. A consumer must therefore not block
 * waiting on another thread that is itself calling into the controller
 * (e.g. a synchronous hand-off to a UI thread that may call cancel());
 * post the event and return instead.
 */
using TaskEventCallback = std::function<void(const TaskEvent& event)>;

/**
 * @brief Supervises one native inference call at a time
 *
 * Resolves the tier binary once (through the owned BinaryResolver), runs
 * each task on a worker thread and maps the engine's outcome plus the
 * task's cancel flag onto a single terminal event.
 *
 * Pause is notification-only: the engine keeps computing while paused and
 * the task can still complete. Cancel is cooperative and takes effect at
 * the engine's next abort check.
 *
 * Example:
 * @code
 *   huginn::TaskController controller(std::move(resolver),
 *       [](const huginn::TaskEvent& ev) {
 *           if (ev.type == huginn::TaskEvent::Type::Progress)
 *               std::cout << ev.percent << "%\n";
 *       });
 *
 *   auto id = controller.start(std::move(samples), config);
 *   controller.wait(std::chrono::minutes(10));
 * @endcode
 */
class HUGINN_API TaskController {
public:
    /**
     * @param resolver Engine resolver (owned for the controller's lifetime)
     * @param callback Event consumer, may be empty
     * @throws std::invalid_argument if resolver is null
     */
    explicit TaskController(std::unique_ptr<BinaryResolver> resolver,
                            TaskEventCallback callback = nullptr);

    /**
     * @brief Cancels any active task and joins its worker
     *
     * Blocks until the engine reaches its next abort check. Must not run
     * from the event callback.
     */
    ~TaskController();

    TaskController(const TaskController&) = delete;
    TaskController& operator=(const TaskController&) = delete;

    /**
     * @brief Start a task on a worker thread and return immediately
     *
     * Valid from Idle or a terminal state. The engine is resolved (or the
     * memo reused) before any task exists.
     *
     * @param audio Mono float PCM at config.sample_rate
     * @param config Task configuration
     * @return Id of the new task
     *
     * @throws TaskRejectedError if a task is active (it is left untouched)
     * @throws ResolutionError if no tier binary could be loaded
     */
    TaskId start(std::vector<float> audio, const TaskConfig& config);

    /**
     * @brief Running -> Paused (suppresses progress events only)
     * @return false if not Running
     */
    bool pause();

    /**
     * @brief Paused -> Running
     * @return false if not Paused
     */
    bool resume();

    /**
     * @brief Running/Paused -> Cancelling
     *
     * Once the native call has returned the outcome is fixed, and pause(),
     * resume() and cancel() all return false until the terminal event.
     *
     * @return false if there is nothing to cancel
     */
    bool cancel();

    /**
     * @brief State of the current (or most recent) task; Idle before the first
     */
    TaskState state() const;

    /**
     * @brief Id of the active task, 0 if none is active
     */
    TaskId active_task() const;

    /**
     * @brief Whether cancel was requested for the current task
     */
    bool cancel_requested() const;

    /**
     * @brief Block until the current task's terminal event was delivered
     *
     * Must not be called from the event callback.
     *
     * @return true if delivered (or no task was started), false on timeout
     */
    bool wait(std::chrono::milliseconds timeout);

    /**
     * @brief Drop the resolved engine so the next start() resolves again
     * @return false while a task is active
     */
    bool reload_engine();

    /**
     * @brief The memoized engine, or nullptr before the first resolution
     */
    std::shared_ptr<const ResolvedEngine> resolved_engine() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace huginn
