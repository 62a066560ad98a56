#pragma once

#include "export.h"
#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Host operating system (keys the candidate table)
 */
enum class OsPlatform {
    Linux,
    Windows,
    MacOS,
    Unknown
};

/**
 * @brief Host CPU architecture
 */
enum class CpuArch {
    X64,
    Arm64,
    Unknown
};

/**
 * @brief Hardware vendor tag
 *
 * Also the vocabulary of the user's device preference order
 * ("nvidia", "intel", "apple", "cpu"). AMD is detected but has no tier.
 */
enum class Vendor {
    Nvidia,
    Intel,
    Apple,
    Amd,
    Cpu,            // "no GPU vendor" - the CPU-only tier
    Other
};

/**
 * @brief GPU device class
 */
enum class DeviceClass {
    Discrete,
    Integrated,
    Unknown
};

/**
 * @brief Acceleration API a tier binary is compiled against
 *
 * None means plain CPU inference and is always available.
 */
enum class Accelerator {
    None,
    Cuda,
    OpenVINO,
    CoreML
};

/**
 * @brief Position of a candidate in the platform fallback chain
 */
enum class SourceTier {
    Primary,
    Secondary,
    Fallback
};

/**
 * @brief One detected GPU
 */
struct GpuDevice {
    Vendor vendor = Vendor::Other;
    DeviceClass device_class = DeviceClass::Unknown;
    std::string name;               // Marketing name or PCI ids ("8086:56a0")
    uint32_t pci_device_id = 0;     // 0 when unknown (macOS, Windows)
};

/**
 * @brief Host capabilities, probed once per process
 *
 * Immutable once returned by CapabilityProber::probe(). On probe failure
 * accelerators = {None}, gpu_vendors empty and probe_ok = false.
 */
struct CapabilityDescriptor {
    OsPlatform os_platform = OsPlatform::Unknown;
    CpuArch os_arch = CpuArch::Unknown;
    Vendor cpu_vendor = Vendor::Other;
    std::vector<GpuDevice> gpus;            // Discrete first, then detection order
    std::vector<Vendor> gpu_vendors;        // Ordered, unique
    std::set<Accelerator> accelerators = {Accelerator::None};
    bool probe_ok = true;

    bool has_accelerator(Accelerator acc) const {
        return acc == Accelerator::None || accelerators.count(acc) > 0;
    }

    bool has_gpu_vendor(Vendor vendor) const;
};

/**
 * @brief One compiled acceleration binary for a platform
 */
struct BinaryCandidate {
    std::string identifier;                 // File name stem, e.g. "engine-linux-cuda"
    SourceTier source_tier = SourceTier::Fallback;
    Accelerator required_accelerator = Accelerator::None;
    Vendor vendor = Vendor::Cpu;            // Preference tag this candidate answers to
    bool strict = false;                    // Never substituted if its load fails

    bool operator==(const BinaryCandidate& other) const {
        return identifier == other.identifier;
    }
    bool operator!=(const BinaryCandidate& other) const { return !(*this == other); }
};

/**
 * @brief Timed transcript segment produced by an engine
 */
struct TranscriptSegment {
    float start = 0.0f;             // Seconds
    float end = 0.0f;               // Seconds
    std::string text;
};

/**
 * @brief Transcript returned on successful completion
 */
struct TranscriptResult {
    std::vector<TranscriptSegment> segments;
    std::string language;
    std::string engine;             // Identifier of the tier that produced it

    auto begin() const { return segments.begin(); }
    auto end() const { return segments.end(); }
};

/**
 * @brief Per-task configuration supplied by the application
 */
struct TaskConfig {
    std::string model_path;                 // Passed through to the engine
    std::string language = "auto";          // "auto" or ISO 639-1 code
    bool translate = false;                 // Translate to English
    int threads = 0;                        // 0 = engine default
    int sample_rate = 16000;                // Of the supplied buffer
    std::vector<Vendor> device_preference;  // Empty = platform default order
};

using TaskId = uint64_t;

/**
 * @brief Task lifecycle
 *
 * Idle -> Running -> {Paused, Cancelling, Completed, Failed}
 * Paused -> {Running, Cancelling, Completed, Failed}
 * Cancelling -> {Cancelled, Failed}
 */
enum class TaskState {
    Idle,
    Running,
    Paused,
    Cancelling,
    Completed,
    Failed,
    Cancelled
};

inline bool is_terminal(TaskState state) {
    return state == TaskState::Completed ||
           state == TaskState::Failed ||
           state == TaskState::Cancelled;
}

/**
 * @brief Why a task failed
 */
enum class ErrorKind {
    None,
    EngineError,            // Native call returned HUGINN_ENGINE_ERROR
    UnexpectedTermination,  // Abort status without a cancel request, or unknown status
    NativeCallFault         // Exception escaped the native call, caught at the boundary
};

/**
 * @brief Event delivered to the application
 */
struct TaskEvent {
    enum class Type {
        StateChanged,
        Progress,
        Completed,
        Cancelled,
        Failed
    };

    Type type = Type::StateChanged;
    TaskId task_id = 0;
    TaskState state = TaskState::Idle;
    int percent = 0;                        // Progress only
    TranscriptResult transcript;            // Completed only
    ErrorKind error_kind = ErrorKind::None; // Failed only
    int error_code = 0;                     // Failed with EngineError
    std::string message;

    bool is_terminal() const {
        return type == Type::Completed || type == Type::Cancelled || type == Type::Failed;
    }
};

// String helpers (logging, manifest, CLI)
HUGINN_API std::string to_string(OsPlatform platform);
HUGINN_API std::string to_string(CpuArch arch);
HUGINN_API std::string to_string(Vendor vendor);
HUGINN_API std::string to_string(DeviceClass device_class);
HUGINN_API std::string to_string(Accelerator accelerator);
HUGINN_API std::string to_string(SourceTier tier);
HUGINN_API std::string to_string(TaskState state);
HUGINN_API std::string to_string(ErrorKind kind);

/**
 * @brief Parse a user preference order such as {"intel", "nvidia", "cpu"}
 *
 * Accepts exactly the tags nvidia, intel, apple, cpu (case-insensitive),
 * each at most once. An empty list is valid and means "platform default".
 *
 * @throws std::invalid_argument on an unknown or repeated tag
 */
HUGINN_API std::vector<Vendor> parse_preference_order(const std::vector<std::string>& tags);

/**
 * @brief The built-in preference order: nvidia, intel, apple, cpu
 */
HUGINN_API const std::vector<Vendor>& default_preference_order();

} // namespace huginn
