#include "huginn/task_controller.h"
#include "huginn/boundary_shim.h"
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>

namespace huginn {

namespace {

struct Task {
    TaskId id = 0;
    TaskState state = TaskState::Idle;          // Guarded by state_mutex
    bool native_returned = false;               // Guarded by state_mutex; no more transitions
    bool terminal_delivered = false;            // Guarded by state_mutex
    std::vector<float> audio;
    TaskConfig config;
    std::chrono::steady_clock::time_point created_at;
    std::shared_ptr<EngineHandle> engine;
    TaskFlags flags;
};

TaskEvent state_event(const Task& task, TaskState state) {
    TaskEvent event;
    event.type = TaskEvent::Type::StateChanged;
    event.task_id = task.id;
    event.state = state;
    return event;
}

} // anonymous namespace

// =======================
// TaskController::Impl
// =======================

class TaskController::Impl {
public:
    std::unique_ptr<BinaryResolver> resolver;
    TaskEventCallback callback;

    // Lock order: delivery_mutex, then state_mutex
    std::recursive_mutex delivery_mutex;
    mutable std::mutex state_mutex;
    std::condition_variable terminal_cv;

    std::shared_ptr<Task> current;
    std::thread worker;
    std::vector<std::thread> retired_workers;   // Workers that started their successor
    TaskId next_id = 1;
    std::vector<Vendor> resolved_preference;

    Impl(std::unique_ptr<BinaryResolver> r, TaskEventCallback cb)
        : resolver(std::move(r)), callback(std::move(cb)) {}

    void run(std::shared_ptr<Task> task);
    void deliver_progress(Task& task, int percent);
    void finish(Task& task, const InferOutcome& outcome, bool cancelled,
                bool faulted, const std::string& fault);
    void dispatch(const TaskEvent& event);
    bool transition(TaskState from_a, TaskState from_b, TaskState to, bool set_pause,
                    bool clear_pause, bool set_cancel);
    void shutdown();
};

void TaskController::Impl::dispatch(const TaskEvent& event) {
    if (!callback) return;

    try {
        callback(event);
    } catch (const std::exception& e) {
        std::cerr << "[TaskController] Event consumer threw: " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[TaskController] Event consumer threw a non-standard exception\n";
    }
}

void TaskController::Impl::deliver_progress(Task& task, int percent) {
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex);
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (task.state != TaskState::Running || task.flags.pause_requested.load()) {
            return;
        }
    }

    if (!callback) return;

    TaskEvent event;
    event.type = TaskEvent::Type::Progress;
    event.task_id = task.id;
    event.state = TaskState::Running;
    event.percent = percent;

    // Consumer exceptions go to the shim, which counts and swallows them
    callback(event);
}

void TaskController::Impl::run(std::shared_ptr<Task> task) {
    BoundaryShim shim(task->flags, [this, &task](int percent) {
        deliver_progress(*task, percent);
    });

    InferOutcome outcome;
    bool faulted = false;
    std::string fault;

    try {
        outcome = task->engine->infer(task->audio, task->config,
                                      &BoundaryShim::progress_trampoline,
                                      &BoundaryShim::abort_trampoline,
                                      &shim);
    } catch (const std::exception& e) {
        faulted = true;
        fault = e.what();
    } catch (...) {
        faulted = true;
        fault = "non-standard exception from native call";
    }

    if (shim.fault_count() > 0) {
        std::cerr << "[TaskController] Task " << task->id << ": " << shim.fault_count()
                  << " progress callback fault(s) contained\n";
    }

    // The outcome is judged against the cancel flag as it stood when the call returned
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        task->native_returned = true;
        cancelled = task->flags.cancel_requested.load();
    }

    finish(*task, outcome, cancelled, faulted, fault);
    // Nothing below may touch the controller: start() may already be joining us
}

void TaskController::Impl::finish(Task& task, const InferOutcome& outcome, bool cancelled,
                                  bool faulted, const std::string& fault)
{
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex);

    TaskEvent event;
    event.task_id = task.id;

    {
        std::lock_guard<std::mutex> lock(state_mutex);

        if (faulted) {
            event.type = TaskEvent::Type::Failed;
            event.error_kind = ErrorKind::NativeCallFault;
            event.message = "Native call faulted: " + fault;
        } else {
            switch (outcome.status) {
                case EngineStatus::Ok:
                    if (cancelled) {
                        // Cancel honoured even though the engine finished first
                        event.type = TaskEvent::Type::Cancelled;
                        event.message = "Cancelled by user";
                    } else {
                        event.type = TaskEvent::Type::Completed;
                        event.transcript = outcome.transcript;
                    }
                    break;

                case EngineStatus::Aborted:
                    if (cancelled) {
                        event.type = TaskEvent::Type::Cancelled;
                        event.message = "Cancelled by user";
                    } else {
                        event.type = TaskEvent::Type::Failed;
                        event.error_kind = ErrorKind::UnexpectedTermination;
                        event.message = "Engine aborted without a cancel request";
                    }
                    break;

                case EngineStatus::Error:
                    event.type = TaskEvent::Type::Failed;
                    event.error_kind = ErrorKind::EngineError;
                    event.error_code = outcome.error_code;
                    event.message = outcome.message;
                    break;

                case EngineStatus::Unknown:
                    event.type = TaskEvent::Type::Failed;
                    event.error_kind = ErrorKind::UnexpectedTermination;
                    event.message = outcome.message;
                    break;
            }
        }

        switch (event.type) {
            case TaskEvent::Type::Completed: task.state = TaskState::Completed; break;
            case TaskEvent::Type::Cancelled: task.state = TaskState::Cancelled; break;
            default: task.state = TaskState::Failed; break;
        }
        event.state = task.state;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - task.created_at).count();

    if (event.type == TaskEvent::Type::Failed) {
        std::cerr << "[TaskController] Task " << task.id << " failed ("
                  << to_string(event.error_kind) << "): " << event.message << "\n";
    } else {
        std::cout << "[TaskController] Task " << task.id << " " << to_string(event.state)
                  << " after " << elapsed << " ms\n";
    }

    dispatch(event);

    {
        std::lock_guard<std::mutex> lock(state_mutex);
        task.terminal_delivered = true;
    }
    terminal_cv.notify_all();
}

bool TaskController::Impl::transition(TaskState from_a, TaskState from_b, TaskState to,
                                      bool set_pause, bool clear_pause, bool set_cancel)
{
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex);

    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (!current || current->native_returned ||
            (current->state != from_a && current->state != from_b)) {
            return false;
        }
        task = current;

        if (set_cancel) task->flags.cancel_requested.store(true);
        if (set_pause) task->flags.pause_requested.store(true);
        if (clear_pause) task->flags.pause_requested.store(false);
        task->state = to;
    }

    std::cout << "[TaskController] Task " << task->id << " -> " << to_string(to) << "\n";
    dispatch(state_event(*task, to));
    return true;
}

void TaskController::Impl::shutdown() {
    transition(TaskState::Running, TaskState::Paused, TaskState::Cancelling, false, false, true);

    std::thread last;
    std::vector<std::thread> retired;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        last = std::move(worker);
        retired = std::move(retired_workers);
    }

    retired.push_back(std::move(last));
    for (auto& thread : retired) {
        if (!thread.joinable()) continue;
        if (thread.get_id() == std::this_thread::get_id()) {
            std::cerr << "[TaskController] Destroyed from its own worker thread; detaching\n";
            thread.detach();
        } else {
            thread.join();
        }
    }
}

// =======================
// TaskController
// =======================

TaskController::TaskController(std::unique_ptr<BinaryResolver> resolver, TaskEventCallback callback)
{
    if (!resolver) {
        throw std::invalid_argument("TaskController requires a resolver");
    }
    pimpl_ = std::make_unique<Impl>(std::move(resolver), std::move(callback));
}

TaskController::~TaskController() {
    if (pimpl_) {
        pimpl_->shutdown();
    }
}

TaskId TaskController::start(std::vector<float> audio, const TaskConfig& config) {
    Impl& impl = *pimpl_;
    std::lock_guard<std::recursive_mutex> delivery(impl.delivery_mutex);

    {
        std::lock_guard<std::mutex> lock(impl.state_mutex);
        if (impl.current && !is_terminal(impl.current->state)) {
            throw TaskRejectedError("Task " + std::to_string(impl.current->id) +
                                    " is still " + to_string(impl.current->state) +
                                    "; cancel it before starting another");
        }
    }

    auto memo = impl.resolver->resolved();
    if (memo && config.device_preference != impl.resolved_preference) {
        std::cout << "[TaskController] Reusing " << memo->candidate.identifier
                  << "; device preference changes apply after reload_engine()\n";
    }

    // Throws ResolutionError before any task exists
    ResolvedEngine engine = impl.resolver->resolve(config.device_preference);
    if (!memo) {
        impl.resolved_preference = config.device_preference;
    }

    // The previous worker has delivered its terminal event and is exiting
    if (impl.worker.joinable()) {
        if (impl.worker.get_id() == std::this_thread::get_id()) {
            impl.retired_workers.push_back(std::move(impl.worker));
        } else {
            impl.worker.join();
        }
    }
    for (auto it = impl.retired_workers.begin(); it != impl.retired_workers.end();) {
        if (it->get_id() != std::this_thread::get_id()) {
            it->join();
            it = impl.retired_workers.erase(it);
        } else {
            ++it;
        }
    }

    auto task = std::make_shared<Task>();
    task->audio = std::move(audio);
    task->config = config;
    task->created_at = std::chrono::steady_clock::now();
    task->engine = engine.handle;
    task->state = TaskState::Running;

    {
        std::lock_guard<std::mutex> lock(impl.state_mutex);
        task->id = impl.next_id++;
        impl.current = task;
        impl.worker = std::thread(&Impl::run, &impl, task);
    }

    std::cout << "[TaskController] Task " << task->id << " started on "
              << engine.candidate.identifier << " (" << task->audio.size() << " samples)\n";
    impl.dispatch(state_event(*task, TaskState::Running));
    return task->id;
}

bool TaskController::pause() {
    return pimpl_->transition(TaskState::Running, TaskState::Running, TaskState::Paused,
                              true, false, false);
}

bool TaskController::resume() {
    return pimpl_->transition(TaskState::Paused, TaskState::Paused, TaskState::Running,
                              false, true, false);
}

bool TaskController::cancel() {
    return pimpl_->transition(TaskState::Running, TaskState::Paused, TaskState::Cancelling,
                              false, false, true);
}

TaskState TaskController::state() const {
    std::lock_guard<std::mutex> lock(pimpl_->state_mutex);
    return pimpl_->current ? pimpl_->current->state : TaskState::Idle;
}

TaskId TaskController::active_task() const {
    std::lock_guard<std::mutex> lock(pimpl_->state_mutex);
    const auto& task = pimpl_->current;
    return (task && !is_terminal(task->state)) ? task->id : 0;
}

bool TaskController::cancel_requested() const {
    std::lock_guard<std::mutex> lock(pimpl_->state_mutex);
    return pimpl_->current && pimpl_->current->flags.cancel_requested.load();
}

bool TaskController::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(pimpl_->state_mutex);
    return pimpl_->terminal_cv.wait_for(lock, timeout, [this] {
        return !pimpl_->current || pimpl_->current->terminal_delivered;
    });
}

bool TaskController::reload_engine() {
    std::lock_guard<std::recursive_mutex> delivery(pimpl_->delivery_mutex);
    {
        std::lock_guard<std::mutex> lock(pimpl_->state_mutex);
        if (pimpl_->current && !is_terminal(pimpl_->current->state)) {
            std::cerr << "[TaskController] reload_engine() rejected: task "
                      << pimpl_->current->id << " is active\n";
            return false;
        }
    }

    pimpl_->resolver->invalidate();
    pimpl_->resolved_preference.clear();
    return true;
}

std::shared_ptr<const ResolvedEngine> TaskController::resolved_engine() const {
    return pimpl_->resolver->resolved();
}

} // namespace huginn
