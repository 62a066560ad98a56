#pragma once

#include "huginn/binary_resolver.h"
#include "huginn/export.h"
#include <string>

namespace huginn {

/**
 * @brief Diagnostic record of which tier binary was chosen
 *
 * Written after a successful resolution when a manifest path is configured.
 * Not read back by the resolver.
 */
class HUGINN_API ResolutionManifest {
public:
    /**
     * @brief Render a resolution as JSON
     *
     * {
     *   "identifier": "engine-linux-cuda",
     *   "tier": "primary",
     *   "accelerator": "cuda",
     *   ...
     * }
     */
    static std::string to_json(const ResolvedEngine& engine,
                               const CapabilityDescriptor& descriptor);

    /**
     * @brief Write the JSON record to path
     * @return True if written; failures are logged, never thrown
     */
    static bool write(const std::string& path,
                      const ResolvedEngine& engine,
                      const CapabilityDescriptor& descriptor);

private:
    static std::string escape_json_string(const std::string& str);
};

} // namespace huginn
