#pragma once

#include "huginn/capability_prober.h"
#include "huginn/engine_handle.h"
#include "huginn/engine_loader.h"
#include "huginn/export.h"
#include "huginn/types.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Resolver configuration
 */
struct ResolverOptions {
    std::string engine_dir = "engines";     // Directory holding the tier binaries
    std::string manifest_path;              // Empty = do not write a manifest

    /**
     * @brief Defaults overridden by HUGINN_ENGINE_DIR and HUGINN_MANIFEST
     */
    static ResolverOptions from_environment();
};

/**
 * @brief One step of the fallback walk, kept for diagnostics
 */
struct ResolutionAttempt {
    BinaryCandidate candidate;
    std::string path;
    std::string outcome;        // "missing", "loaded", or the load error
};

/**
 * @brief Resolution failed; no engine is memoized
 */
class HUGINN_API ResolutionError : public std::runtime_error {
public:
    enum class Kind {
        NoUsableBinary,     // Every candidate was missing or failed to load
        StrictLoadFailed    // A strict candidate was present but failed to load
    };

    ResolutionError(Kind kind, std::vector<ResolutionAttempt> attempts);

    Kind kind() const { return kind_; }
    const std::vector<ResolutionAttempt>& attempts() const { return attempts_; }

private:
    Kind kind_;
    std::vector<ResolutionAttempt> attempts_;
};

/**
 * @brief The loaded tier binary, memoized by the resolver
 */
struct ResolvedEngine {
    BinaryCandidate candidate;
    std::string path;
    std::chrono::system_clock::time_point loaded_at;
    std::shared_ptr<EngineHandle> handle;
};

/**
 * @brief Static candidate table for a platform, primary -> fallback
 *
 * Empty for platforms without shipped binaries.
 */
HUGINN_API std::vector<BinaryCandidate> candidate_table(OsPlatform platform, CpuArch arch);

/**
 * @brief Filter and order candidates for a host and a preference
 *
 * - Candidates whose accelerator the host lacks are dropped
 * - Within each tier, candidates are stably ordered by preference rank
 * - With a non-empty preference, non-fallback candidates whose vendor is
 *   not listed are dropped; fallback candidates are always kept
 * - Tiers are never reordered, so a strict candidate stays in its tier
 */
HUGINN_API std::vector<BinaryCandidate> order_candidates(const std::vector<BinaryCandidate>& table,
                                                         const CapabilityDescriptor& descriptor,
                                                         const std::vector<Vendor>& preference);

/**
 * @brief Picks, loads and memoizes the tier binary for this host
 *
 * Example:
 * @code
 *   huginn::BinaryResolver resolver(
 *       std::make_unique<huginn::CapabilityProber>(),
 *       std::make_unique<huginn::DynamicEngineLoader>(),
 *       huginn::ResolverOptions::from_environment());
 *
 *   auto engine = resolver.resolve({huginn::Vendor::Intel, huginn::Vendor::Cpu});
 *   std::cout << engine.candidate.identifier << "\n";
 * @endcode
 *
 * Only successes are memoized. Thread-safe.
 */
class HUGINN_API BinaryResolver {
public:
    /**
     * @throws std::invalid_argument if prober or loader is null
     */
    BinaryResolver(std::unique_ptr<CapabilityProber> prober,
                   std::unique_ptr<EngineLoader> loader,
                   ResolverOptions options = ResolverOptions());
    ~BinaryResolver();

    BinaryResolver(const BinaryResolver&) = delete;
    BinaryResolver& operator=(const BinaryResolver&) = delete;

    /**
     * @brief Resolve against an explicit descriptor
     *
     * Returns the memo if one exists, whatever the arguments.
     *
     * @throws ResolutionError if no candidate could be loaded
     */
    ResolvedEngine resolve(const CapabilityDescriptor& descriptor,
                           const std::vector<Vendor>& preference);

    /**
     * @brief Resolve against the (lazily probed) host
     */
    ResolvedEngine resolve(const std::vector<Vendor>& preference = {});

    /**
     * @brief Drop the memo and the probe cache
     *
     * Handles already given out stay valid until their last owner lets go.
     */
    void invalidate();

    /**
     * @brief Current memo, or nullptr
     */
    std::shared_ptr<const ResolvedEngine> resolved() const;

    const ResolverOptions& options() const { return options_; }

private:
    ResolvedEngine resolve_locked(const CapabilityDescriptor& descriptor,
                                  const std::vector<Vendor>& preference);

    std::unique_ptr<CapabilityProber> prober_;
    std::unique_ptr<EngineLoader> loader_;
    ResolverOptions options_;

    mutable std::mutex mutex_;
    std::shared_ptr<const ResolvedEngine> memo_;
};

} // namespace huginn
