#pragma once

#include "huginn/export.h"
#include "huginn/types.h"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Raw host observations, before classification
 *
 * Gathered by collect_host_signals(); kept separate from the descriptor so
 * the classification rules can be exercised without real hardware.
 */
struct HostSignals {
    OsPlatform platform = OsPlatform::Unknown;
    CpuArch arch = CpuArch::Unknown;
    Vendor cpu_vendor = Vendor::Other;

    struct PciDisplay {
        uint32_t vendor_id = 0;
        uint32_t device_id = 0;
        bool boot_vga = false;      // Drives the primary display
        std::string name;           // Adapter name where the OS reports one
    };
    std::vector<PciDisplay> pci_displays;       // DRM (Linux), DXGI (Windows), IOKit (macOS)

    int cuda_device_count = 0;                  // From CTranslate2
    bool nvidia_driver_loaded = false;          // /proc/driver/nvidia/version
    bool openvino_runtime = false;              // INTEL_OPENVINO_DIR or libopenvino loadable
    std::vector<std::string> execution_providers;  // From ONNX Runtime
};

/**
 * @brief Read the host (OS, CPU, GPUs, accelerator runtimes)
 *
 * May throw if an OS query fails outright; CapabilityProber absorbs that.
 */
HUGINN_API HostSignals collect_host_signals();

/**
 * @brief Turn raw signals into a ranked capability descriptor
 *
 * - GPUs are ranked discrete first, then in detection order
 * - CUDA requires an NVIDIA GPU (or CUDA devices) plus a driver/runtime signal
 * - OpenVINO requires an Intel GPU plus an OpenVINO runtime signal
 * - CoreML is available on Apple Silicon only
 */
HUGINN_API CapabilityDescriptor build_descriptor(const HostSignals& signals);

/**
 * @brief Vendor from a PCI vendor id (0x10de, 0x8086, 0x1002)
 */
HUGINN_API Vendor vendor_from_pci_id(uint32_t vendor_id);

/**
 * @brief Discrete/integrated classification for a PCI display device
 *
 * Intel Arc (DG2/Battlemage device ids 0x56xx, 0x57xx, 0xe2xx) is discrete;
 * every other Intel GPU, including Core Ultra "Arc Graphics", is integrated.
 */
HUGINN_API DeviceClass classify_gpu(Vendor vendor, uint32_t device_id,
                                    bool boot_vga, Vendor cpu_vendor);

/**
 * @brief Lazily probed, cached host capabilities
 *
 * probe() runs the host query once and returns the cached descriptor on
 * every later call until invalidate(). Detection failure never blocks
 * startup: a throwing query yields accelerators = {None}, no GPU vendors.
 *
 * Thread-safe.
 */
class HUGINN_API CapabilityProber {
public:
    using HostQuery = std::function<CapabilityDescriptor()>;

    /**
     * @brief Prober over the real host
     */
    CapabilityProber();

    /**
     * @brief Prober over a custom query (tests, forced configurations)
     */
    explicit CapabilityProber(HostQuery query);

    /**
     * @brief Cached capabilities (probes on first call)
     */
    CapabilityDescriptor probe();

    /**
     * @brief Drop the cache; the next probe() queries the host again
     */
    void invalidate();

    bool has_cached() const;

private:
    HostQuery query_;
    mutable std::mutex mutex_;
    std::unique_ptr<CapabilityDescriptor> cached_;
};

/**
 * @brief Human-readable one-line summary for logs
 */
HUGINN_API std::string describe(const CapabilityDescriptor& descriptor);

} // namespace huginn
