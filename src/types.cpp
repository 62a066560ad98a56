#include "huginn/types.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace huginn {

bool CapabilityDescriptor::has_gpu_vendor(Vendor vendor) const {
    return std::find(gpu_vendors.begin(), gpu_vendors.end(), vendor) != gpu_vendors.end();
}

std::string to_string(OsPlatform platform) {
    switch (platform) {
        case OsPlatform::Linux: return "linux";
        case OsPlatform::Windows: return "windows";
        case OsPlatform::MacOS: return "macos";
        default: return "unknown";
    }
}

std::string to_string(CpuArch arch) {
    switch (arch) {
        case CpuArch::X64: return "x64";
        case CpuArch::Arm64: return "arm64";
        default: return "unknown";
    }
}

std::string to_string(Vendor vendor) {
    switch (vendor) {
        case Vendor::Nvidia: return "nvidia";
        case Vendor::Intel: return "intel";
        case Vendor::Apple: return "apple";
        case Vendor::Amd: return "amd";
        case Vendor::Cpu: return "cpu";
        default: return "other";
    }
}

std::string to_string(DeviceClass device_class) {
    switch (device_class) {
        case DeviceClass::Discrete: return "discrete";
        case DeviceClass::Integrated: return "integrated";
        default: return "unknown";
    }
}

std::string to_string(Accelerator accelerator) {
    switch (accelerator) {
        case Accelerator::Cuda: return "cuda";
        case Accelerator::OpenVINO: return "openvino";
        case Accelerator::CoreML: return "coreml";
        default: return "none";
    }
}

std::string to_string(SourceTier tier) {
    switch (tier) {
        case SourceTier::Primary: return "primary";
        case SourceTier::Secondary: return "secondary";
        default: return "fallback";
    }
}

std::string to_string(TaskState state) {
    switch (state) {
        case TaskState::Idle: return "idle";
        case TaskState::Running: return "running";
        case TaskState::Paused: return "paused";
        case TaskState::Cancelling: return "cancelling";
        case TaskState::Completed: return "completed";
        case TaskState::Failed: return "failed";
        case TaskState::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EngineError: return "engine_error";
        case ErrorKind::UnexpectedTermination: return "unexpected_termination";
        case ErrorKind::NativeCallFault: return "native_call_fault";
        default: return "none";
    }
}

std::vector<Vendor> parse_preference_order(const std::vector<std::string>& tags) {
    std::vector<Vendor> order;
    order.reserve(tags.size());

    for (const auto& raw : tags) {
        std::string tag = raw;
        std::transform(tag.begin(), tag.end(), tag.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        Vendor vendor;
        if (tag == "nvidia") {
            vendor = Vendor::Nvidia;
        } else if (tag == "intel") {
            vendor = Vendor::Intel;
        } else if (tag == "apple") {
            vendor = Vendor::Apple;
        } else if (tag == "cpu") {
            vendor = Vendor::Cpu;
        } else {
            throw std::invalid_argument("Unknown device preference tag: '" + raw +
                                        "' (expected nvidia, intel, apple or cpu)");
        }

        if (std::find(order.begin(), order.end(), vendor) != order.end()) {
            throw std::invalid_argument("Device preference tag listed twice: '" + raw + "'");
        }
        order.push_back(vendor);
    }

    return order;
}

const std::vector<Vendor>& default_preference_order() {
    static const std::vector<Vendor> order = {
        Vendor::Nvidia, Vendor::Intel, Vendor::Apple, Vendor::Cpu
    };
    return order;
}

} // namespace huginn
