#include "huginn/engine_abi.h"
#include "mel_spectrogram.h"
#include <ctranslate2/models/whisper.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

// Engine-specific error codes reported through huginn_engine_result
constexpr int kErrorModelLoad = 1;
constexpr int kErrorInference = 2;
constexpr int kErrorInput = 3;

#ifdef HUGINN_ENGINE_DEVICE_CUDA
constexpr ctranslate2::Device kDevice = ctranslate2::Device::CUDA;
constexpr const char* kDescription = "ctranslate2 whisper (cuda)";
#else
constexpr ctranslate2::Device kDevice = ctranslate2::Device::CPU;
constexpr const char* kDescription = "ctranslate2 whisper (cpu)";
#endif

struct LoadedModel {
    std::string path;
    std::unique_ptr<ctranslate2::models::Whisper> model;
    std::unique_ptr<huginn::ct2::MelSpectrogram> mel;
};

std::mutex g_model_mutex;
LoadedModel g_model;

char* copy_string(const std::string& str) {
    char* out = static_cast<char*>(std::malloc(str.size() + 1));
    if (out) {
        std::memcpy(out, str.c_str(), str.size() + 1);
    }
    return out;
}

int fail(huginn_engine_result* out, int code, const std::string& message) {
    out->error_code = code;
    out->error_message = copy_string(message);
    std::cerr << "[Engine] " << message << "\n";
    return HUGINN_ENGINE_ERROR;
}

// Caller holds g_model_mutex
LoadedModel& load_model(const std::string& path) {
    if (g_model.model && g_model.path == path) {
        return g_model;
    }

    std::cout << "[Engine] Loading Whisper model: " << path << "\n";
    g_model.model = std::make_unique<ctranslate2::models::Whisper>(path, kDevice);
    g_model.mel = std::make_unique<huginn::ct2::MelSpectrogram>(
        static_cast<int>(g_model.model->n_mels()));
    g_model.path = path;

    std::cout << "[Engine] " << (g_model.model->is_multilingual() ? "Multilingual" : "English-only")
              << " model, " << g_model.model->n_mels() << " mel bins\n";
    return g_model;
}

ctranslate2::StorageView to_features(const std::vector<float>& mel, int n_mels) {
    return ctranslate2::StorageView(
        ctranslate2::Shape{1, static_cast<ctranslate2::dim_t>(n_mels),
                           static_cast<ctranslate2::dim_t>(huginn::ct2::MelSpectrogram::kFrames)},
        mel);
}

std::string detect_language(ctranslate2::models::Whisper& model,
                            const std::vector<float>& mel, int n_mels) {
    auto futures = model.detect_language(to_features(mel, n_mels));
    if (futures.empty()) {
        return "en";
    }

    auto probs = futures[0].get();
    if (probs.empty()) {
        return "en";
    }

    auto best = std::max_element(probs.begin(), probs.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });

    // "<|de|>" -> "de"
    std::string code = best->first;
    if (code.size() >= 4 && code.compare(0, 2, "<|") == 0 &&
        code.compare(code.size() - 2, 2, "|>") == 0) {
        code = code.substr(2, code.size() - 4);
    }
    return code;
}

std::string tokens_to_text(const std::vector<std::string>& tokens) {
    const std::string gpt2_space = "\xC4\xA0";  // U+0120, byte-level BPE space marker
    std::string text;

    for (const auto& token : tokens) {
        if (token.size() >= 4 && token.compare(0, 2, "<|") == 0 &&
            token.compare(token.size() - 2, 2, "|>") == 0) {
            continue;
        }

        std::string piece = token;
        size_t pos = 0;
        while ((pos = piece.find(gpt2_space, pos)) != std::string::npos) {
            piece.replace(pos, gpt2_space.size(), " ");
            pos += 1;
        }
        text += piece;
    }

    text.erase(0, text.find_first_not_of(" \t\n\r"));
    text.erase(text.find_last_not_of(" \t\n\r") + 1);
    return text;
}

void free_segments(std::vector<huginn_segment>& segments) {
    for (auto& seg : segments) {
        std::free(seg.text);
    }
    segments.clear();
}

int run_inference(const float* samples,
                  size_t n_samples,
                  const huginn_engine_params* params,
                  huginn_progress_fn progress,
                  huginn_abort_check_fn abort_check,
                  void* user_data,
                  huginn_engine_result* out)
{
    if (!params || !params->model_path || !*params->model_path) {
        return fail(out, kErrorInput, "No model path given");
    }
    if (params->sample_rate != huginn::ct2::MelSpectrogram::kSampleRate) {
        return fail(out, kErrorInput, "Expected 16 kHz audio, got " + std::to_string(params->sample_rate));
    }

    std::lock_guard<std::mutex> lock(g_model_mutex);

    LoadedModel* loaded = nullptr;
    try {
        loaded = &load_model(params->model_path);
    } catch (const std::exception& e) {
        g_model = LoadedModel{};
        return fail(out, kErrorModelLoad, std::string("Failed to load model: ") + e.what());
    }

    auto& model = *loaded->model;
    const int n_mels = loaded->mel->n_mels();
    const size_t window = huginn::ct2::MelSpectrogram::kWindowSamples;
    const size_t n_windows = std::max<size_t>(1, (n_samples + window - 1) / window);

    std::string language = params->language ? params->language : "auto";
    std::vector<huginn_segment> segments;

    try {
        for (size_t w = 0; w < n_windows; ++w) {
            if (abort_check && abort_check(user_data)) {
                free_segments(segments);
                return HUGINN_ENGINE_ABORTED;
            }

            size_t offset = w * window;
            size_t count = offset < n_samples ? std::min(window, n_samples - offset) : 0;
            std::vector<float> mel = loaded->mel->compute(samples + offset, count);

            if (language == "auto") {
                language = model.is_multilingual() ? detect_language(model, mel, n_mels) : "en";
                std::cout << "[Engine] Detected language: " << language << "\n";
            }

            std::vector<std::string> prompt = {"<|startoftranscript|>"};
            if (model.is_multilingual()) {
                prompt.push_back("<|" + language + "|>");
                prompt.push_back(params->translate ? "<|translate|>" : "<|transcribe|>");
            }
            prompt.push_back("<|notimestamps|>");
            std::vector<std::vector<std::string>> prompts = {prompt};

            ctranslate2::models::WhisperOptions options;
            options.beam_size = 5;
            options.num_hypotheses = 1;
            options.suppress_blank = true;

            auto futures = model.generate(to_features(mel, n_mels), prompts, options);
            if (!futures.empty()) {
                auto result = futures[0].get();
                std::string text = result.sequences.empty() ? "" : tokens_to_text(result.sequences[0]);
                if (!text.empty()) {
                    huginn_segment seg;
                    seg.start = static_cast<float>(offset) / huginn::ct2::MelSpectrogram::kSampleRate;
                    seg.end = static_cast<float>(offset + count) / huginn::ct2::MelSpectrogram::kSampleRate;
                    seg.text = copy_string(text);
                    segments.push_back(seg);
                }
            }

            if (progress) {
                progress(user_data, static_cast<int>((w + 1) * 100 / n_windows));
            }
        }
    } catch (const std::exception& e) {
        free_segments(segments);
        return fail(out, kErrorInference, std::string("Inference failed: ") + e.what());
    }

    out->n_segments = segments.size();
    out->segments = static_cast<huginn_segment*>(std::calloc(segments.size() ? segments.size() : 1,
                                                              sizeof(huginn_segment)));
    if (!out->segments) {
        free_segments(segments);
        out->n_segments = 0;
        return fail(out, kErrorInference, "Out of memory");
    }
    std::copy(segments.begin(), segments.end(), out->segments);
    out->language = copy_string(language);
    return HUGINN_ENGINE_OK;
}

} // anonymous namespace

extern "C" {

HUGINN_ENGINE_EXPORT int huginn_engine_abi_version(void) {
    return HUGINN_ENGINE_ABI_VERSION;
}

HUGINN_ENGINE_EXPORT const char* huginn_engine_describe(void) {
    return kDescription;
}

HUGINN_ENGINE_EXPORT int huginn_engine_infer(const float* samples,
                                             size_t n_samples,
                                             const huginn_engine_params* params,
                                             huginn_progress_fn progress,
                                             huginn_abort_check_fn abort_check,
                                             void* user_data,
                                             huginn_engine_result* out)
{
    if (!out) {
        return HUGINN_ENGINE_ERROR;
    }
    std::memset(out, 0, sizeof(*out));

    try {
        return run_inference(samples, n_samples, params, progress, abort_check, user_data, out);
    } catch (const std::exception& e) {
        return fail(out, kErrorInference, std::string("Unhandled engine error: ") + e.what());
    } catch (...) {
        return fail(out, kErrorInference, "Unhandled non-standard engine error");
    }
}

HUGINN_ENGINE_EXPORT void huginn_engine_release_result(huginn_engine_result* result) {
    if (!result) return;

    for (size_t i = 0; i < result->n_segments; ++i) {
        std::free(result->segments[i].text);
    }
    std::free(result->segments);
    std::free(result->language);
    std::free(result->error_message);
    std::memset(result, 0, sizeof(*result));
}

} // extern "C"
