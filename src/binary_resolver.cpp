#include "huginn/binary_resolver.h"
#include "huginn/resolution_manifest.h"
#include "huginn/shared_library.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace huginn {

namespace {

BinaryCandidate make_candidate(const char* identifier, SourceTier tier,
                               Accelerator accelerator, bool strict = false) {
    BinaryCandidate candidate;
    candidate.identifier = identifier;
    candidate.source_tier = tier;
    candidate.required_accelerator = accelerator;
    candidate.strict = strict;

    switch (accelerator) {
        case Accelerator::Cuda: candidate.vendor = Vendor::Nvidia; break;
        case Accelerator::OpenVINO: candidate.vendor = Vendor::Intel; break;
        case Accelerator::CoreML: candidate.vendor = Vendor::Apple; break;
        case Accelerator::None: candidate.vendor = Vendor::Cpu; break;
    }
    return candidate;
}

// Position in the preference; unlisted vendors sort last
size_t preference_rank(const std::vector<Vendor>& preference, Vendor vendor) {
    auto it = std::find(preference.begin(), preference.end(), vendor);
    return static_cast<size_t>(it - preference.begin());
}

std::string describe_attempts(const std::vector<ResolutionAttempt>& attempts) {
    if (attempts.empty()) {
        return "no candidate binaries for this platform";
    }

    std::ostringstream out;
    out << "tried ";
    for (size_t i = 0; i < attempts.size(); ++i) {
        const auto& attempt = attempts[i];
        out << (i ? "; " : "") << attempt.candidate.identifier
            << " [" << to_string(attempt.candidate.source_tier) << "]: " << attempt.outcome;
    }
    return out.str();
}

std::string error_message(ResolutionError::Kind kind, const std::vector<ResolutionAttempt>& attempts) {
    std::string head;
    if (kind == ResolutionError::Kind::StrictLoadFailed) {
        head = "Strict engine binary failed to load (no substitution allowed)";
    } else {
        head = "No usable engine binary";
    }
    return head + ": " + describe_attempts(attempts);
}

} // anonymous namespace

// =======================
// ResolverOptions / ResolutionError
// =======================

ResolverOptions ResolverOptions::from_environment() {
    ResolverOptions options;

    const char* engine_dir = std::getenv("HUGINN_ENGINE_DIR");
    if (engine_dir && *engine_dir) {
        options.engine_dir = engine_dir;
    }

    const char* manifest = std::getenv("HUGINN_MANIFEST");
    if (manifest && *manifest) {
        options.manifest_path = manifest;
    }

    return options;
}

ResolutionError::ResolutionError(Kind kind, std::vector<ResolutionAttempt> attempts)
    : std::runtime_error(error_message(kind, attempts))
    , kind_(kind)
    , attempts_(std::move(attempts))
{
}

// =======================
// Candidate table
// =======================

std::vector<BinaryCandidate> candidate_table(OsPlatform platform, CpuArch arch) {
    using T = SourceTier;
    using A = Accelerator;

    if (platform == OsPlatform::Linux && arch == CpuArch::X64) {
        return {
            make_candidate("engine-linux-cuda", T::Primary, A::Cuda),
            make_candidate("engine-linux-openvino", T::Primary, A::OpenVINO),
            make_candidate("engine-linux-cpu", T::Fallback, A::None),
        };
    }
    if (platform == OsPlatform::Linux && arch == CpuArch::Arm64) {
        return {
            make_candidate("engine-linux-arm64-cuda", T::Primary, A::Cuda),
            make_candidate("engine-linux-arm64-cpu", T::Fallback, A::None),
        };
    }
    if (platform == OsPlatform::Windows && arch == CpuArch::X64) {
        return {
            make_candidate("engine-windows-cuda", T::Primary, A::Cuda),
            make_candidate("engine-windows-openvino", T::Secondary, A::OpenVINO),
            make_candidate("engine-windows-cpu", T::Fallback, A::None),
        };
    }
    if (platform == OsPlatform::MacOS && arch == CpuArch::Arm64) {
        return {
            make_candidate("engine-macos-arm64-coreml", T::Primary, A::CoreML, true),
            make_candidate("engine-macos-arm64", T::Fallback, A::None),
        };
    }
    if (platform == OsPlatform::MacOS && arch == CpuArch::X64) {
        return {
            make_candidate("engine-macos-x64-openvino", T::Primary, A::OpenVINO),
            make_candidate("engine-macos-x64", T::Fallback, A::None),
        };
    }
    return {};
}

std::vector<BinaryCandidate> order_candidates(const std::vector<BinaryCandidate>& table,
                                              const CapabilityDescriptor& descriptor,
                                              const std::vector<Vendor>& preference)
{
    std::vector<BinaryCandidate> ordered;
    for (const auto& candidate : table) {
        if (!descriptor.has_accelerator(candidate.required_accelerator)) {
            continue;
        }
        if (!preference.empty() &&
            candidate.source_tier != SourceTier::Fallback &&
            std::find(preference.begin(), preference.end(), candidate.vendor) == preference.end()) {
            continue;
        }
        ordered.push_back(candidate);
    }

    // Tier first (the table is already grouped by tier), preference rank second
    std::stable_sort(ordered.begin(), ordered.end(),
        [&preference](const BinaryCandidate& a, const BinaryCandidate& b) {
            if (a.source_tier != b.source_tier) {
                return static_cast<int>(a.source_tier) < static_cast<int>(b.source_tier);
            }
            return preference_rank(preference, a.vendor) < preference_rank(preference, b.vendor);
        });

    return ordered;
}

// =======================
// BinaryResolver
// =======================

BinaryResolver::BinaryResolver(std::unique_ptr<CapabilityProber> prober,
                               std::unique_ptr<EngineLoader> loader,
                               ResolverOptions options)
    : prober_(std::move(prober))
    , loader_(std::move(loader))
    , options_(std::move(options))
{
    if (!prober_ || !loader_) {
        throw std::invalid_argument("BinaryResolver requires a prober and a loader");
    }
}

BinaryResolver::~BinaryResolver() = default;

ResolvedEngine BinaryResolver::resolve(const CapabilityDescriptor& descriptor,
                                       const std::vector<Vendor>& preference)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (memo_) {
        return *memo_;
    }
    return resolve_locked(descriptor, preference);
}

ResolvedEngine BinaryResolver::resolve(const std::vector<Vendor>& preference) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (memo_) {
        return *memo_;
    }
    return resolve_locked(prober_->probe(), preference);
}

ResolvedEngine BinaryResolver::resolve_locked(const CapabilityDescriptor& descriptor,
                                              const std::vector<Vendor>& preference)
{
    auto ordered = order_candidates(candidate_table(descriptor.os_platform, descriptor.os_arch),
                                    descriptor, preference);

    std::cout << "[Resolver] Resolving for " << to_string(descriptor.os_platform) << "/"
              << to_string(descriptor.os_arch) << ", " << ordered.size() << " candidate(s) in "
              << options_.engine_dir << "\n";

    std::vector<ResolutionAttempt> attempts;

    for (const auto& candidate : ordered) {
        ResolutionAttempt attempt;
        attempt.candidate = candidate;
        attempt.path = (std::filesystem::path(options_.engine_dir) /
                        (candidate.identifier + shared_library_suffix())).string();

        if (!loader_->exists(attempt.path)) {
            attempt.outcome = "missing";
            std::cout << "[Resolver]   " << candidate.identifier << " ("
                      << to_string(candidate.source_tier) << "): missing\n";
            attempts.push_back(attempt);
            continue;
        }

        std::string error;
        auto handle = loader_->load(attempt.path, candidate, error);

        if (!handle) {
            attempt.outcome = error.empty() ? "load failed" : "load failed: " + error;
            std::cerr << "[Resolver]   " << candidate.identifier << " ("
                      << to_string(candidate.source_tier) << "): " << attempt.outcome << "\n";
            attempts.push_back(attempt);

            if (candidate.strict) {
                throw ResolutionError(ResolutionError::Kind::StrictLoadFailed, std::move(attempts));
            }
            continue;
        }

        attempt.outcome = "loaded";
        attempts.push_back(attempt);
        std::cout << "[Resolver]   " << candidate.identifier << " ("
                  << to_string(candidate.source_tier) << "): loaded\n";

        auto engine = std::make_shared<ResolvedEngine>();
        engine->candidate = candidate;
        engine->path = attempt.path;
        engine->loaded_at = std::chrono::system_clock::now();
        engine->handle = std::move(handle);
        memo_ = engine;

        if (!options_.manifest_path.empty() &&
            !ResolutionManifest::write(options_.manifest_path, *engine, descriptor)) {
            std::cout << "[Resolver] Continuing without manifest\n";
        }

        return *engine;
    }

    ResolutionError error(ResolutionError::Kind::NoUsableBinary, std::move(attempts));
    std::cerr << "[Resolver] " << error.what() << "\n";
    throw error;
}

void BinaryResolver::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    memo_.reset();
    prober_->invalidate();
    std::cout << "[Resolver] Engine memo invalidated\n";
}

std::shared_ptr<const ResolvedEngine> BinaryResolver::resolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return memo_;
}

} // namespace huginn
