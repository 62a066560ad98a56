#include "huginn/resolution_manifest.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace huginn {

std::string ResolutionManifest::escape_json_string(const std::string& str) {
    std::string escaped;
    escaped.reserve(str.size());

    for (char c : str) {
        switch (c) {
            case '"':  escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    escaped += buf;
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

std::string ResolutionManifest::to_json(const ResolvedEngine& engine,
                                        const CapabilityDescriptor& descriptor)
{
    auto loaded_at = std::chrono::system_clock::to_time_t(engine.loaded_at);
    const BinaryCandidate& candidate = engine.candidate;

    std::ostringstream json;
    json << "{\n";
    json << "  \"identifier\": \"" << escape_json_string(candidate.identifier) << "\",\n";
    json << "  \"tier\": \"" << to_string(candidate.source_tier) << "\",\n";
    json << "  \"accelerator\": \"" << to_string(candidate.required_accelerator) << "\",\n";
    json << "  \"strict\": " << (candidate.strict ? "true" : "false") << ",\n";
    json << "  \"path\": \"" << escape_json_string(engine.path) << "\",\n";
    json << "  \"engine\": \"" << escape_json_string(engine.handle ? engine.handle->describe() : "") << "\",\n";
    json << "  \"loaded_at\": " << static_cast<long long>(loaded_at) << ",\n";
    json << "  \"platform\": \"" << to_string(descriptor.os_platform) << "\",\n";
    json << "  \"arch\": \"" << to_string(descriptor.os_arch) << "\",\n";
    json << "  \"probe_ok\": " << (descriptor.probe_ok ? "true" : "false") << ",\n";
    json << "  \"gpus\": [\n";

    for (size_t i = 0; i < descriptor.gpus.size(); ++i) {
        const auto& gpu = descriptor.gpus[i];
        json << "    {\n";
        json << "      \"vendor\": \"" << to_string(gpu.vendor) << "\",\n";
        json << "      \"class\": \"" << to_string(gpu.device_class) << "\",\n";
        json << "      \"name\": \"" << escape_json_string(gpu.name) << "\"\n";
        json << "    }" << (i < descriptor.gpus.size() - 1 ? "," : "") << "\n";
    }

    json << "  ]\n";
    json << "}\n";
    return json.str();
}

bool ResolutionManifest::write(const std::string& path,
                               const ResolvedEngine& engine,
                               const CapabilityDescriptor& descriptor)
{
    std::filesystem::path manifest_path(path);
    if (manifest_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(manifest_path.parent_path(), ec);
    }

    std::ofstream file(manifest_path);
    if (!file.is_open()) {
        std::cerr << "[Resolver] Failed to write manifest: " << path << "\n";
        return false;
    }

    file << to_json(engine, descriptor);
    file.close();

    if (file.fail()) {
        std::cerr << "[Resolver] Failed to write manifest: " << path << "\n";
        return false;
    }
    return true;
}

} // namespace huginn
