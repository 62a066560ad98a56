#include "huginn/capability_prober.h"
#include "huginn/shared_library.h"
#include <ctranslate2/devices.h>
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

#if defined(_WIN32)
#include <windows.h>
#include <dxgi.h>
#elif defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/IOKitLib.h>
#endif

namespace fs = std::filesystem;

namespace {

constexpr uint32_t PCI_VENDOR_NVIDIA = 0x10de;
constexpr uint32_t PCI_VENDOR_INTEL = 0x8086;
constexpr uint32_t PCI_VENDOR_AMD = 0x1002;

huginn::OsPlatform compiled_platform() {
#if defined(__linux__)
    return huginn::OsPlatform::Linux;
#elif defined(_WIN32)
    return huginn::OsPlatform::Windows;
#elif defined(__APPLE__)
    return huginn::OsPlatform::MacOS;
#else
    return huginn::OsPlatform::Unknown;
#endif
}

huginn::CpuArch compiled_arch() {
#if defined(__x86_64__) || defined(_M_X64)
    return huginn::CpuArch::X64;
#elif defined(__aarch64__) || defined(_M_ARM64)
    return huginn::CpuArch::Arm64;
#else
    return huginn::CpuArch::Unknown;
#endif
}

// Parse "0x8086\n" style sysfs attributes
uint32_t read_hex_attribute(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) return 0;

    std::string value;
    in >> value;
    try {
        return static_cast<uint32_t>(std::stoul(value, nullptr, 16));
    } catch (const std::exception&) {
        return 0;
    }
}

huginn::Vendor read_cpu_vendor(huginn::OsPlatform platform, huginn::CpuArch arch) {
    if (platform == huginn::OsPlatform::MacOS) {
        return arch == huginn::CpuArch::Arm64 ? huginn::Vendor::Apple : huginn::Vendor::Intel;
    }

    if (platform == huginn::OsPlatform::Windows) {
        const char* identifier = std::getenv("PROCESSOR_IDENTIFIER");
        std::string id = identifier ? identifier : "";
        if (id.find("Intel") != std::string::npos) return huginn::Vendor::Intel;
        if (id.find("AMD") != std::string::npos) return huginn::Vendor::Amd;
        return huginn::Vendor::Other;
    }

    std::ifstream cpuinfo("/proc/cpuinfo");
    if (!cpuinfo.is_open()) {
        throw std::runtime_error("Cannot read /proc/cpuinfo");
    }

    std::string line;
    while (std::getline(cpuinfo, line)) {
        if (line.rfind("vendor_id", 0) == 0) {
            if (line.find("GenuineIntel") != std::string::npos) return huginn::Vendor::Intel;
            if (line.find("AuthenticAMD") != std::string::npos) return huginn::Vendor::Amd;
            return huginn::Vendor::Other;
        }
    }
    return huginn::Vendor::Other;
}

std::vector<huginn::HostSignals::PciDisplay> read_drm_displays() {
    std::vector<huginn::HostSignals::PciDisplay> displays;

    const fs::path drm_root("/sys/class/drm");
    std::error_code ec;
    if (!fs::exists(drm_root, ec)) {
        return displays;
    }

    // Only cardN entries; connectors (card0-HDMI-A-1) and render nodes are skipped
    static const std::regex card_pattern("^card[0-9]+$");

    std::vector<fs::path> cards;
    for (const auto& entry : fs::directory_iterator(drm_root, ec)) {
        if (std::regex_match(entry.path().filename().string(), card_pattern)) {
            cards.push_back(entry.path());
        }
    }
    std::sort(cards.begin(), cards.end());

    for (const auto& card : cards) {
        huginn::HostSignals::PciDisplay display;
        display.vendor_id = read_hex_attribute(card / "device" / "vendor");
        display.device_id = read_hex_attribute(card / "device" / "device");
        display.boot_vga = read_hex_attribute(card / "device" / "boot_vga") == 1;
        if (display.vendor_id != 0) {
            displays.push_back(display);
        }
    }

    return displays;
}

#if defined(_WIN32)

std::string narrow(const wchar_t* wide) {
    int size = WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr, nullptr);
    if (size <= 1) return {};
    std::string out(static_cast<size_t>(size), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide, -1, &out[0], size, nullptr, nullptr);
    out.resize(static_cast<size_t>(size - 1));
    return out;
}

// Hardware adapters in DXGI order; adapter 0 drives the primary display
std::vector<huginn::HostSignals::PciDisplay> read_dxgi_adapters() {
    std::vector<huginn::HostSignals::PciDisplay> displays;

    IDXGIFactory1* factory = nullptr;
    HRESULT hr = CreateDXGIFactory1(__uuidof(IDXGIFactory1), reinterpret_cast<void**>(&factory));
    if (FAILED(hr) || !factory) {
        std::cout << "[Prober] DXGI factory unavailable (0x" << std::hex
                  << static_cast<unsigned long>(hr) << std::dec << "), no GPUs listed\n";
        return displays;
    }

    IDXGIAdapter1* adapter = nullptr;
    for (UINT index = 0; factory->EnumAdapters1(index, &adapter) != DXGI_ERROR_NOT_FOUND; ++index) {
        DXGI_ADAPTER_DESC1 desc;
        if (SUCCEEDED(adapter->GetDesc1(&desc)) && !(desc.Flags & DXGI_ADAPTER_FLAG_SOFTWARE)) {
            huginn::HostSignals::PciDisplay display;
            display.vendor_id = desc.VendorId;
            display.device_id = desc.DeviceId;
            display.boot_vga = index == 0;
            display.name = narrow(desc.Description);
            displays.push_back(display);
        }
        adapter->Release();
    }
    factory->Release();

    return displays;
}

#elif defined(__APPLE__)

// IOKit PCI properties are little-endian CFData blobs
uint32_t read_iokit_u32(io_registry_entry_t entry, CFStringRef key) {
    CFTypeRef property = IORegistryEntryCreateCFProperty(entry, key, kCFAllocatorDefault, 0);
    if (!property) return 0;

    uint32_t value = 0;
    if (CFGetTypeID(property) == CFDataGetTypeID() &&
        CFDataGetLength(static_cast<CFDataRef>(property)) >= 4) {
        UInt8 bytes[4];
        CFDataGetBytes(static_cast<CFDataRef>(property), CFRangeMake(0, 4), bytes);
        value = static_cast<uint32_t>(bytes[0]) | (static_cast<uint32_t>(bytes[1]) << 8) |
                (static_cast<uint32_t>(bytes[2]) << 16) | (static_cast<uint32_t>(bytes[3]) << 24);
    }
    CFRelease(property);
    return value;
}

std::string read_iokit_model(io_registry_entry_t entry) {
    CFTypeRef property = IORegistryEntryCreateCFProperty(entry, CFSTR("model"), kCFAllocatorDefault, 0);
    if (!property) return {};

    std::string model;
    if (CFGetTypeID(property) == CFDataGetTypeID()) {
        CFDataRef data = static_cast<CFDataRef>(property);
        const char* bytes = reinterpret_cast<const char*>(CFDataGetBytePtr(data));
        model.assign(bytes, static_cast<size_t>(CFDataGetLength(data)));
        model = model.c_str();      // Drop the trailing NUL
    }
    CFRelease(property);
    return model;
}

// PCI display controllers (class 0x03); Apple Silicon's GPU is not on PCI
std::vector<huginn::HostSignals::PciDisplay> read_iokit_displays() {
    std::vector<huginn::HostSignals::PciDisplay> displays;

    io_iterator_t iterator = 0;
    if (IOServiceGetMatchingServices(MACH_PORT_NULL, IOServiceMatching("IOPCIDevice"), &iterator) !=
        KERN_SUCCESS) {
        std::cout << "[Prober] IOKit PCI enumeration failed, no GPUs listed\n";
        return displays;
    }

    io_object_t service;
    while ((service = IOIteratorNext(iterator)) != 0) {
        if ((read_iokit_u32(service, CFSTR("class-code")) >> 16) == 0x03) {
            huginn::HostSignals::PciDisplay display;
            display.vendor_id = read_iokit_u32(service, CFSTR("vendor-id")) & 0xffff;
            display.device_id = read_iokit_u32(service, CFSTR("device-id")) & 0xffff;
            display.name = read_iokit_model(service);
            if (display.vendor_id != 0) {
                displays.push_back(display);
            }
        }
        IOObjectRelease(service);
    }
    IOObjectRelease(iterator);

    return displays;
}

#endif

bool openvino_runtime_present(huginn::OsPlatform platform) {
    const char* root = std::getenv("INTEL_OPENVINO_DIR");
    if (root && *root) {
        return true;
    }

    const char* soname = nullptr;
    switch (platform) {
        case huginn::OsPlatform::Windows: soname = "openvino.dll"; break;
        case huginn::OsPlatform::MacOS: soname = "libopenvino.dylib"; break;
        default: soname = "libopenvino.so"; break;
    }

    huginn::SharedLibrary probe;
    return probe.open(soname);
}

// What a failed detection degrades to
huginn::CapabilityDescriptor cpu_only_descriptor() {
    huginn::CapabilityDescriptor desc;
    desc.os_platform = compiled_platform();
    desc.os_arch = compiled_arch();
    desc.probe_ok = false;
    return desc;
}

bool has_provider(const std::vector<std::string>& providers, const char* name) {
    return std::find(providers.begin(), providers.end(), name) != providers.end();
}

} // anonymous namespace

namespace huginn {

Vendor vendor_from_pci_id(uint32_t vendor_id) {
    switch (vendor_id) {
        case PCI_VENDOR_NVIDIA: return Vendor::Nvidia;
        case PCI_VENDOR_INTEL: return Vendor::Intel;
        case PCI_VENDOR_AMD: return Vendor::Amd;
        default: return Vendor::Other;
    }
}

DeviceClass classify_gpu(Vendor vendor, uint32_t device_id, bool boot_vga, Vendor cpu_vendor) {
    switch (vendor) {
        case Vendor::Intel: {
            uint32_t family = (device_id >> 8) & 0xff;
            if (family == 0x56 || family == 0x57 || family == 0xe2) {
                return DeviceClass::Discrete;
            }
            return DeviceClass::Integrated;
        }
        case Vendor::Nvidia:
            return DeviceClass::Discrete;
        case Vendor::Amd:
            // APU graphics drive the boot display on an AMD CPU
            return (boot_vga && cpu_vendor == Vendor::Amd) ? DeviceClass::Integrated
                                                           : DeviceClass::Discrete;
        case Vendor::Apple:
            return DeviceClass::Integrated;
        default:
            return DeviceClass::Unknown;
    }
}

HostSignals collect_host_signals() {
    HostSignals signals;
    signals.platform = compiled_platform();
    signals.arch = compiled_arch();
    signals.cpu_vendor = read_cpu_vendor(signals.platform, signals.arch);

    if (signals.platform == OsPlatform::Linux) {
        signals.pci_displays = read_drm_displays();
        std::error_code ec;
        signals.nvidia_driver_loaded = fs::exists("/proc/driver/nvidia/version", ec);
    }
#if defined(_WIN32)
    signals.pci_displays = read_dxgi_adapters();
#elif defined(__APPLE__)
    signals.pci_displays = read_iokit_displays();
#endif

    try {
        signals.cuda_device_count = ctranslate2::get_device_count(ctranslate2::Device::CUDA);
    } catch (const std::exception& e) {
        std::cout << "[Prober] CTranslate2 CUDA query failed: " << e.what() << "\n";
        signals.cuda_device_count = 0;
    }

    try {
        signals.execution_providers = Ort::GetAvailableProviders();
    } catch (const Ort::Exception& e) {
        std::cout << "[Prober] ONNX Runtime provider query failed: " << e.what() << "\n";
    }

    signals.openvino_runtime = openvino_runtime_present(signals.platform);

    return signals;
}

CapabilityDescriptor build_descriptor(const HostSignals& signals) {
    CapabilityDescriptor desc;
    desc.os_platform = signals.platform;
    desc.os_arch = signals.arch;
    desc.cpu_vendor = signals.cpu_vendor;

    for (const auto& display : signals.pci_displays) {
        GpuDevice gpu;
        gpu.vendor = vendor_from_pci_id(display.vendor_id);
        gpu.pci_device_id = display.device_id;
        gpu.device_class = classify_gpu(gpu.vendor, display.device_id, display.boot_vga, signals.cpu_vendor);

        if (!display.name.empty()) {
            gpu.name = display.name;
        } else {
            std::ostringstream name;
            name << std::hex;
            name.fill('0');
            name.width(4);
            name << display.vendor_id << ":";
            name.width(4);
            name << display.device_id;
            gpu.name = name.str();
        }

        desc.gpus.push_back(gpu);
    }

    bool nvidia_listed = std::any_of(desc.gpus.begin(), desc.gpus.end(),
        [](const GpuDevice& gpu) { return gpu.vendor == Vendor::Nvidia; });

    // Adapter enumeration can miss NVIDIA GPUs; CUDA devices stand in for them
    if (!nvidia_listed && signals.cuda_device_count > 0) {
        for (int i = 0; i < signals.cuda_device_count; ++i) {
            GpuDevice gpu;
            gpu.vendor = Vendor::Nvidia;
            gpu.device_class = DeviceClass::Discrete;
            gpu.name = "CUDA device " + std::to_string(i);
            desc.gpus.push_back(gpu);
        }
    }

    if (signals.platform == OsPlatform::MacOS && signals.arch == CpuArch::Arm64) {
        GpuDevice gpu;
        gpu.vendor = Vendor::Apple;
        gpu.device_class = DeviceClass::Integrated;
        gpu.name = "Apple Silicon GPU";
        desc.gpus.push_back(gpu);
    }

    std::stable_sort(desc.gpus.begin(), desc.gpus.end(),
        [](const GpuDevice& a, const GpuDevice& b) {
            return a.device_class == DeviceClass::Discrete && b.device_class != DeviceClass::Discrete;
        });

    for (const auto& gpu : desc.gpus) {
        if (!desc.has_gpu_vendor(gpu.vendor)) {
            desc.gpu_vendors.push_back(gpu.vendor);
        }
    }

    desc.accelerators = {Accelerator::None};

    bool cuda_runtime = signals.cuda_device_count > 0 ||
                        signals.nvidia_driver_loaded ||
                        has_provider(signals.execution_providers, "CUDAExecutionProvider");
    if (desc.has_gpu_vendor(Vendor::Nvidia) && cuda_runtime && signals.platform != OsPlatform::MacOS) {
        desc.accelerators.insert(Accelerator::Cuda);
    }

    bool openvino_runtime = signals.openvino_runtime ||
                            has_provider(signals.execution_providers, "OpenVINOExecutionProvider");
    if (desc.has_gpu_vendor(Vendor::Intel) && openvino_runtime) {
        desc.accelerators.insert(Accelerator::OpenVINO);
    }

    if (signals.platform == OsPlatform::MacOS && signals.arch == CpuArch::Arm64) {
        desc.accelerators.insert(Accelerator::CoreML);
    }

    desc.probe_ok = true;
    return desc;
}

// =======================
// CapabilityProber
// =======================

CapabilityProber::CapabilityProber()
    : CapabilityProber([] { return build_descriptor(collect_host_signals()); })
{
}

CapabilityProber::CapabilityProber(HostQuery query)
    : query_(std::move(query))
{
}

CapabilityDescriptor CapabilityProber::probe() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cached_) {
        return *cached_;
    }

    CapabilityDescriptor desc;
    try {
        desc = query_();
        std::cout << "[Prober] " << describe(desc) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[Prober] Capability detection failed, assuming CPU only: " << e.what() << "\n";
        desc = cpu_only_descriptor();
    } catch (...) {
        std::cerr << "[Prober] Capability detection failed with a non-standard exception, assuming CPU only\n";
        desc = cpu_only_descriptor();
    }

    cached_ = std::make_unique<CapabilityDescriptor>(desc);
    return desc;
}

void CapabilityProber::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_.reset();
}

bool CapabilityProber::has_cached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_ != nullptr;
}

std::string describe(const CapabilityDescriptor& descriptor) {
    std::ostringstream out;
    out << to_string(descriptor.os_platform) << "/" << to_string(descriptor.os_arch)
        << ", cpu=" << to_string(descriptor.cpu_vendor)
        << ", gpus=[";
    for (size_t i = 0; i < descriptor.gpus.size(); ++i) {
        const auto& gpu = descriptor.gpus[i];
        out << (i ? ", " : "") << to_string(gpu.vendor) << " " << to_string(gpu.device_class)
            << " (" << gpu.name << ")";
    }
    out << "], accelerators=[";
    bool first = true;
    for (auto acc : descriptor.accelerators) {
        out << (first ? "" : ", ") << to_string(acc);
        first = false;
    }
    out << "]";
    if (!descriptor.probe_ok) {
        out << " (probe failed)";
    }
    return out.str();
}

} // namespace huginn
