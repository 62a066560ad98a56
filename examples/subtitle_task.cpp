#include "huginn/task_controller.h"
#include <atomic>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

struct CliOptions {
    std::string audio_path;
    std::string model_path = "models/whisper-large-v3-turbo";
    std::string language = "auto";
    bool translate = false;
    std::vector<std::string> prefer;
    std::string engine_dir;
    std::string manifest_path;
    int cancel_after_ms = -1;       // -1 = never
    int pause_at = -1;              // Percent; -1 = never
    int pause_ms = 1000;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <audio.wav> [options]\n\n"
              << "  --model <path>           Model directory (default models/whisper-large-v3-turbo)\n"
              << "  --language <code|auto>   Source language (default auto)\n"
              << "  --translate              Translate to English\n"
              << "  --prefer <a,b,...>       Device preference: nvidia, intel, apple, cpu\n"
              << "  --engine-dir <dir>       Directory holding the tier binaries\n"
              << "  --manifest <file>        Write the resolution manifest here\n"
              << "  --cancel-after-ms <n>    Cancel the task after n milliseconds\n"
              << "  --pause-at <percent>     Pause once progress reaches percent\n"
              << "  --pause-ms <n>           How long to stay paused (default 1000)\n";
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--model") opts.model_path = value();
        else if (arg == "--language") opts.language = value();
        else if (arg == "--translate") opts.translate = true;
        else if (arg == "--prefer") opts.prefer = split_list(value());
        else if (arg == "--engine-dir") opts.engine_dir = value();
        else if (arg == "--manifest") opts.manifest_path = value();
        else if (arg == "--cancel-after-ms") opts.cancel_after_ms = std::stoi(value());
        else if (arg == "--pause-at") opts.pause_at = std::stoi(value());
        else if (arg == "--pause-ms") opts.pause_ms = std::stoi(value());
        else if (arg.rfind("--", 0) == 0) throw std::invalid_argument("Unknown option " + arg);
        else opts.audio_path = arg;
    }
    if (opts.audio_path.empty()) {
        throw std::invalid_argument("No audio file given");
    }
    return opts;
}

/**
 * @brief Read a 16-bit PCM mono WAV into float samples in [-1, 1]
 */
std::vector<float> read_wav(const std::string& path, int& sample_rate) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }

    char riff[12];
    in.read(riff, sizeof(riff));
    if (!in || std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
        throw std::runtime_error(path + " is not a RIFF/WAVE file");
    }

    uint16_t format = 0, channels = 0, bits = 0;
    uint32_t rate = 0;
    std::vector<float> samples;
    bool have_format = false;

    char chunk_id[4];
    uint32_t chunk_size = 0;
    while (in.read(chunk_id, 4) && in.read(reinterpret_cast<char*>(&chunk_size), 4)) {
        if (std::memcmp(chunk_id, "fmt ", 4) == 0) {
            std::vector<char> fmt(chunk_size);
            in.read(fmt.data(), chunk_size);
            if (chunk_size < 16) {
                throw std::runtime_error("Truncated fmt chunk");
            }
            std::memcpy(&format, &fmt[0], 2);
            std::memcpy(&channels, &fmt[2], 2);
            std::memcpy(&rate, &fmt[4], 4);
            std::memcpy(&bits, &fmt[14], 2);
            have_format = true;
        } else if (std::memcmp(chunk_id, "data", 4) == 0) {
            if (!have_format) {
                throw std::runtime_error("data chunk before fmt chunk");
            }
            if (format != 1 || channels != 1 || bits != 16) {
                throw std::runtime_error("Only 16-bit PCM mono WAV is supported");
            }
            std::vector<int16_t> pcm(chunk_size / 2);
            in.read(reinterpret_cast<char*>(pcm.data()), pcm.size() * 2);
            samples.reserve(pcm.size());
            for (int16_t s : pcm) {
                samples.push_back(static_cast<float>(s) / 32768.0f);
            }
            break;
        } else {
            in.seekg(chunk_size, std::ios::cur);
        }
        if (chunk_size & 1) in.seekg(1, std::ios::cur);
    }

    if (samples.empty()) {
        throw std::runtime_error(path + " has no audio data");
    }
    sample_rate = static_cast<int>(rate);
    return samples;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "Huginn - Subtitle Task Example\n";
    std::cout << "═══════════════════════════════════════════════════════════\n\n";

    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[Example] " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 2;
    }

    try {
        huginn::TaskConfig config;
        config.model_path = opts.model_path;
        config.language = opts.language;
        config.translate = opts.translate;
        config.device_preference = huginn::parse_preference_order(opts.prefer);

        std::cout << "[Example] Reading " << opts.audio_path << "...\n";
        auto samples = read_wav(opts.audio_path, config.sample_rate);
        std::cout << "[Example] " << samples.size() << " samples @ " << config.sample_rate << " Hz ("
                  << std::fixed << std::setprecision(1)
                  << static_cast<double>(samples.size()) / config.sample_rate << "s)\n\n";

        huginn::ResolverOptions resolver_options = huginn::ResolverOptions::from_environment();
        if (!opts.engine_dir.empty()) resolver_options.engine_dir = opts.engine_dir;
        if (!opts.manifest_path.empty()) resolver_options.manifest_path = opts.manifest_path;

        auto prober = std::make_unique<huginn::CapabilityProber>();
        std::cout << "[Example] Host: " << huginn::describe(prober->probe()) << "\n";

        auto resolver = std::make_unique<huginn::BinaryResolver>(
            std::move(prober), std::make_unique<huginn::DynamicEngineLoader>(), resolver_options);

        std::atomic<bool> pause_pending{opts.pause_at >= 0};
        std::atomic<bool> pause_due{false};

        huginn::TaskController controller(std::move(resolver),
            [&](const huginn::TaskEvent& ev) {
                switch (ev.type) {
                    case huginn::TaskEvent::Type::StateChanged:
                        std::cout << "[Example] State: " << huginn::to_string(ev.state) << "\n";
                        break;
                    case huginn::TaskEvent::Type::Progress:
                        std::cout << "[Example] Progress: " << ev.percent << "%\n";
                        if (pause_pending && ev.percent >= opts.pause_at) {
                            pause_pending = false;
                            pause_due = true;
                        }
                        break;
                    case huginn::TaskEvent::Type::Completed:
                        std::cout << "\n═══════════════════════════════════════════════════════════\n";
                        std::cout << "TRANSCRIPT (" << ev.transcript.engine << ", language "
                                  << ev.transcript.language << ")\n";
                        std::cout << "═══════════════════════════════════════════════════════════\n";
                        for (const auto& segment : ev.transcript) {
                            std::cout << "[" << segment.start << "s - " << segment.end << "s] "
                                      << segment.text << "\n";
                        }
                        break;
                    case huginn::TaskEvent::Type::Cancelled:
                        std::cout << "[Example] Cancelled\n";
                        break;
                    case huginn::TaskEvent::Type::Failed:
                        std::cerr << "[Example] Failed (" << huginn::to_string(ev.error_kind)
                                  << "): " << ev.message << "\n";
                        break;
                }
            });

        controller.start(std::move(samples), config);

        auto started = std::chrono::steady_clock::now();
        while (!controller.wait(std::chrono::milliseconds(20))) {
            if (pause_due.exchange(false) && controller.pause()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(opts.pause_ms));
                controller.resume();
            }
            if (opts.cancel_after_ms >= 0 &&
                std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(opts.cancel_after_ms)) {
                controller.cancel();
            }
        }

        return controller.state() == huginn::TaskState::Completed ? 0 : 1;

    } catch (const huginn::ResolutionError& e) {
        std::cerr << "[Example] No usable engine: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Example] ERROR: " << e.what() << "\n";
        return 1;
    }
}
