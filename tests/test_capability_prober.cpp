/**
 * @file test_capability_prober.cpp
 * @brief GPU classification, accelerator rules and probe caching
 */

#include "huginn/binary_resolver.h"
#include "huginn/capability_prober.h"
#include "test_common.h"
#include <atomic>
#include <stdexcept>

using namespace huginn;

namespace {

HostSignals linux_host(Vendor cpu_vendor) {
    HostSignals signals;
    signals.platform = OsPlatform::Linux;
    signals.arch = CpuArch::X64;
    signals.cpu_vendor = cpu_vendor;
    return signals;
}

HostSignals::PciDisplay display(uint32_t vendor_id, uint32_t device_id, bool boot_vga) {
    HostSignals::PciDisplay d;
    d.vendor_id = vendor_id;
    d.device_id = device_id;
    d.boot_vga = boot_vga;
    return d;
}

std::vector<std::string> ordered_identifiers(const CapabilityDescriptor& desc) {
    std::vector<std::string> ids;
    for (const auto& c : order_candidates(candidate_table(desc.os_platform, desc.os_arch), desc, {})) {
        ids.push_back(c.identifier);
    }
    return ids;
}

TestResult test_pci_vendor_ids() {
    ASSERT_EQ(vendor_from_pci_id(0x10de), Vendor::Nvidia, "NVIDIA PCI id");
    ASSERT_EQ(vendor_from_pci_id(0x8086), Vendor::Intel, "Intel PCI id");
    ASSERT_EQ(vendor_from_pci_id(0x1002), Vendor::Amd, "AMD PCI id");
    ASSERT_EQ(vendor_from_pci_id(0x1234), Vendor::Other, "Unknown PCI id");
    return TEST_PASS();
}

TestResult test_gpu_classification() {
    // Arc A770 (DG2), Arc B580 (Battlemage)
    ASSERT_EQ(classify_gpu(Vendor::Intel, 0x56a0, false, Vendor::Intel), DeviceClass::Discrete, "Arc A770");
    ASSERT_EQ(classify_gpu(Vendor::Intel, 0xe20b, false, Vendor::Intel), DeviceClass::Discrete, "Arc B580");
    // Core Ultra (Meteor Lake) "Arc Graphics" and Iris Xe are integrated
    ASSERT_EQ(classify_gpu(Vendor::Intel, 0x7d55, true, Vendor::Intel), DeviceClass::Integrated, "Core Ultra iGPU");
    ASSERT_EQ(classify_gpu(Vendor::Intel, 0x9a49, true, Vendor::Intel), DeviceClass::Integrated, "Iris Xe");

    ASSERT_EQ(classify_gpu(Vendor::Nvidia, 0x2684, true, Vendor::Intel), DeviceClass::Discrete, "RTX 4090");
    ASSERT_EQ(classify_gpu(Vendor::Amd, 0x1638, true, Vendor::Amd), DeviceClass::Integrated, "AMD APU");
    ASSERT_EQ(classify_gpu(Vendor::Amd, 0x744c, false, Vendor::Amd), DeviceClass::Discrete, "Radeon on AMD CPU");
    ASSERT_EQ(classify_gpu(Vendor::Amd, 0x744c, true, Vendor::Intel), DeviceClass::Discrete, "Radeon on Intel CPU");
    ASSERT_EQ(classify_gpu(Vendor::Apple, 0, false, Vendor::Apple), DeviceClass::Integrated, "Apple GPU");
    return TEST_PASS();
}

TestResult test_discrete_gpus_ranked_first() {
    HostSignals signals = linux_host(Vendor::Intel);
    signals.pci_displays = {display(0x8086, 0x9a49, true), display(0x10de, 0x2684, false)};
    signals.nvidia_driver_loaded = true;

    auto desc = build_descriptor(signals);
    ASSERT_EQ(desc.gpus.size(), size_t(2), "Both GPUs detected");
    ASSERT_EQ(desc.gpus[0].vendor, Vendor::Nvidia, "Discrete GPU first");
    ASSERT_EQ(desc.gpus[0].name, std::string("10de:2684"), "PCI name");
    ASSERT_EQ(desc.gpus[1].device_class, DeviceClass::Integrated, "iGPU second");
    ASSERT_EQ(desc.gpu_vendors.size(), size_t(2), "Unique vendors");
    ASSERT_EQ(desc.gpu_vendors[0], Vendor::Nvidia, "Vendor order follows GPU rank");
    ASSERT_TRUE(desc.has_accelerator(Accelerator::Cuda), "CUDA from NVIDIA GPU + driver");
    ASSERT_TRUE(!desc.has_accelerator(Accelerator::OpenVINO), "No OpenVINO runtime");
    ASSERT_TRUE(desc.has_accelerator(Accelerator::None), "CPU always available");
    ASSERT_TRUE(desc.probe_ok, "probe_ok");
    return TEST_PASS();
}

TestResult test_cuda_requires_nvidia() {
    HostSignals signals = linux_host(Vendor::Amd);
    signals.pci_displays = {display(0x1002, 0x744c, false)};
    signals.execution_providers = {"CUDAExecutionProvider", "CPUExecutionProvider"};

    auto desc = build_descriptor(signals);
    ASSERT_TRUE(!desc.has_accelerator(Accelerator::Cuda), "CUDA EP alone is not enough");

    signals.cuda_device_count = 1;
    desc = build_descriptor(signals);
    ASSERT_TRUE(desc.has_accelerator(Accelerator::Cuda), "CUDA devices stand in for the GPU listing");
    ASSERT_TRUE(desc.has_gpu_vendor(Vendor::Nvidia), "Synthesized NVIDIA GPU");
    return TEST_PASS();
}

TestResult test_openvino_requires_intel_gpu() {
    HostSignals signals = linux_host(Vendor::Amd);
    signals.openvino_runtime = true;

    auto desc = build_descriptor(signals);
    ASSERT_TRUE(!desc.has_accelerator(Accelerator::OpenVINO), "Runtime without Intel GPU");

    signals.pci_displays = {display(0x8086, 0x56a0, false)};
    desc = build_descriptor(signals);
    ASSERT_TRUE(desc.has_accelerator(Accelerator::OpenVINO), "Arc + runtime");

    signals.openvino_runtime = false;
    signals.execution_providers = {"OpenVINOExecutionProvider"};
    desc = build_descriptor(signals);
    ASSERT_TRUE(desc.has_accelerator(Accelerator::OpenVINO), "Arc + ONNX Runtime OpenVINO EP");
    return TEST_PASS();
}

TestResult test_windows_intel_openvino() {
    HostSignals signals;
    signals.platform = OsPlatform::Windows;
    signals.arch = CpuArch::X64;
    signals.cpu_vendor = Vendor::Intel;
    // DXGI order: the iGPU drives the desktop, the Arc card is listed second
    auto igpu = display(0x8086, 0xa780, true);
    igpu.name = "Intel(R) UHD Graphics 770";
    auto arc = display(0x8086, 0x56a0, false);
    arc.name = "Intel(R) Arc(TM) A770 Graphics";
    signals.pci_displays = {igpu, arc};
    signals.openvino_runtime = true;

    auto desc = build_descriptor(signals);
    ASSERT_EQ(desc.gpus.size(), size_t(2), "Both adapters listed");
    ASSERT_EQ(desc.gpus[0].name, std::string("Intel(R) Arc(TM) A770 Graphics"), "Arc ranked first by name");
    ASSERT_EQ(desc.gpus[0].device_class, DeviceClass::Discrete, "Arc is discrete");
    ASSERT_TRUE(desc.has_accelerator(Accelerator::OpenVINO), "OpenVINO on Windows");
    ASSERT_TRUE(!desc.has_accelerator(Accelerator::Cuda), "No CUDA without NVIDIA");
    ASSERT_TRUE(ordered_identifiers(desc) ==
                (std::vector<std::string>{"engine-windows-openvino", "engine-windows-cpu"}),
                "OpenVINO tier reachable ahead of the CPU fallback");

    signals.openvino_runtime = false;
    desc = build_descriptor(signals);
    ASSERT_TRUE(ordered_identifiers(desc) == (std::vector<std::string>{"engine-windows-cpu"}),
                "CPU only without the runtime");
    return TEST_PASS();
}

TestResult test_macos_x64_intel_openvino() {
    HostSignals signals;
    signals.platform = OsPlatform::MacOS;
    signals.arch = CpuArch::X64;
    signals.cpu_vendor = Vendor::Intel;
    auto uhd = display(0x8086, 0x3e9b, false);
    uhd.name = "Intel UHD Graphics 630";
    signals.pci_displays = {uhd};
    signals.openvino_runtime = true;

    auto desc = build_descriptor(signals);
    ASSERT_EQ(desc.gpus.size(), size_t(1), "Only the PCI display");
    ASSERT_EQ(desc.gpus[0].device_class, DeviceClass::Integrated, "UHD 630 is integrated");
    ASSERT_EQ(desc.gpus[0].name, std::string("Intel UHD Graphics 630"), "IOKit model kept");
    ASSERT_TRUE(desc.has_accelerator(Accelerator::OpenVINO), "OpenVINO on Intel Macs");
    ASSERT_TRUE(!desc.has_accelerator(Accelerator::CoreML), "No CoreML on Intel Macs");
    ASSERT_TRUE(ordered_identifiers(desc) ==
                (std::vector<std::string>{"engine-macos-x64-openvino", "engine-macos-x64"}),
                "OpenVINO tier first");

    // Radeon Pro alongside the iGPU ranks first but does not change the accelerators
    auto radeon = display(0x1002, 0x67ef, false);
    radeon.name = "Radeon Pro 560X";
    signals.pci_displays = {uhd, radeon};
    desc = build_descriptor(signals);
    ASSERT_EQ(desc.gpus[0].vendor, Vendor::Amd, "Discrete Radeon first");
    ASSERT_TRUE(desc.has_accelerator(Accelerator::OpenVINO), "Intel iGPU still enables OpenVINO");
    return TEST_PASS();
}

TestResult test_apple_silicon() {
    HostSignals signals;
    signals.platform = OsPlatform::MacOS;
    signals.arch = CpuArch::Arm64;
    signals.cpu_vendor = Vendor::Apple;
    signals.execution_providers = {"CUDAExecutionProvider"};
    signals.cuda_device_count = 0;

    auto desc = build_descriptor(signals);
    ASSERT_TRUE(desc.has_accelerator(Accelerator::CoreML), "CoreML on Apple Silicon");
    ASSERT_TRUE(!desc.has_accelerator(Accelerator::Cuda), "Never CUDA on macOS");
    ASSERT_TRUE(desc.has_gpu_vendor(Vendor::Apple), "Apple GPU");

    signals.arch = CpuArch::X64;
    desc = build_descriptor(signals);
    ASSERT_TRUE(!desc.has_accelerator(Accelerator::CoreML), "No CoreML on Intel Macs");
    return TEST_PASS();
}

TestResult test_probe_is_cached() {
    std::atomic<int> calls{0};
    CapabilityProber prober([&calls] {
        ++calls;
        HostSignals signals = linux_host(Vendor::Intel);
        return build_descriptor(signals);
    });

    ASSERT_TRUE(!prober.has_cached(), "Lazy until first probe");
    prober.probe();
    prober.probe();
    ASSERT_EQ(calls.load(), 1, "Host queried once");
    ASSERT_TRUE(prober.has_cached(), "Cached");

    prober.invalidate();
    ASSERT_TRUE(!prober.has_cached(), "Invalidated");
    prober.probe();
    ASSERT_EQ(calls.load(), 2, "Re-probed after invalidate()");
    return TEST_PASS();
}

TestResult test_probe_failure_degrades_to_cpu() {
    std::atomic<int> calls{0};
    CapabilityProber prober([&calls]() -> CapabilityDescriptor {
        ++calls;
        throw std::runtime_error("sysfs unavailable");
    });

    CapabilityDescriptor desc;
    try {
        desc = prober.probe();
    } catch (const std::exception&) {
        ASSERT_TRUE(false, "probe() must not propagate");
    }

    ASSERT_TRUE(!desc.probe_ok, "Failure flagged");
    ASSERT_EQ(desc.accelerators.size(), size_t(1), "Only one accelerator");
    ASSERT_TRUE(desc.has_accelerator(Accelerator::None), "Accelerators = {none}");
    ASSERT_TRUE(desc.gpu_vendors.empty(), "No GPU vendors");

    prober.probe();
    ASSERT_EQ(calls.load(), 1, "Failed probe result is cached too");
    return TEST_PASS();
}

TestResult test_non_standard_throw_degrades_to_cpu() {
    CapabilityProber prober([]() -> CapabilityDescriptor {
        throw 7;
    });

    CapabilityDescriptor desc;
    bool escaped = false;
    try {
        desc = prober.probe();
    } catch (int) {
        escaped = true;
    }

    ASSERT_TRUE(!escaped, "Non-standard exception contained");
    ASSERT_TRUE(!desc.probe_ok, "Failure flagged");
    ASSERT_EQ(desc.accelerators.size(), size_t(1), "Only one accelerator");
    ASSERT_TRUE(desc.has_accelerator(Accelerator::None), "Accelerators = {none}");
    ASSERT_TRUE(prober.has_cached(), "Cached like any failure");
    return TEST_PASS();
}

TestResult test_real_host_probe() {
    CapabilityProber prober;
    auto desc = prober.probe();
    std::cout << "    Host: " << describe(desc) << "\n";
    ASSERT_TRUE(desc.has_accelerator(Accelerator::None), "CPU always available");
    return TEST_PASS();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    TestSuite suite("Huginn Capability Prober Test");
    suite.add("pci-vendor-ids", test_pci_vendor_ids);
    suite.add("gpu-classification", test_gpu_classification);
    suite.add("discrete-first", test_discrete_gpus_ranked_first);
    suite.add("cuda-requires-nvidia", test_cuda_requires_nvidia);
    suite.add("openvino-requires-intel", test_openvino_requires_intel_gpu);
    suite.add("windows-intel-openvino", test_windows_intel_openvino);
    suite.add("macos-x64-intel-openvino", test_macos_x64_intel_openvino);
    suite.add("apple-silicon", test_apple_silicon);
    suite.add("probe-cached", test_probe_is_cached);
    suite.add("probe-failure", test_probe_failure_degrades_to_cpu);
    suite.add("non-standard-throw", test_non_standard_throw_degrades_to_cpu);
    suite.add("real-host", test_real_host_probe);
    return suite.run(argc, argv);
}
