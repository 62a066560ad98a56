#include "mel_spectrogram.h"
#include <algorithm>
#include <cmath>

namespace huginn {
namespace ct2 {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

MelSpectrogram::MelSpectrogram(int n_mels, int n_fft, int hop_length)
    : n_mels_(n_mels)
    , n_fft_(n_fft)
    , hop_length_(hop_length)
    , n_freqs_(n_fft / 2 + 1)
{
    // Periodic Hann, as torch.hann_window
    hann_window_.resize(n_fft_);
    for (int i = 0; i < n_fft_; i++) {
        hann_window_[i] = static_cast<float>(0.5 * (1.0 - std::cos(2.0 * kPi * i / n_fft_)));
    }

    cos_table_.resize(static_cast<size_t>(n_freqs_) * n_fft_);
    sin_table_.resize(static_cast<size_t>(n_freqs_) * n_fft_);
    for (int k = 0; k < n_freqs_; k++) {
        for (int n = 0; n < n_fft_; n++) {
            double angle = 2.0 * kPi * k * n / n_fft_;
            cos_table_[static_cast<size_t>(k) * n_fft_ + n] = static_cast<float>(std::cos(angle));
            sin_table_[static_cast<size_t>(k) * n_fft_ + n] = static_cast<float>(-std::sin(angle));
        }
    }

    build_filters(kSampleRate);
}

float MelSpectrogram::hz_to_mel(float hz) const {
    const float f_sp = 200.0f / 3.0f;
    const float min_log_hz = 1000.0f;
    const float min_log_mel = min_log_hz / f_sp;
    const float logstep = std::log(6.4f) / 27.0f;

    if (hz >= min_log_hz) {
        return min_log_mel + std::log(hz / min_log_hz) / logstep;
    }
    return hz / f_sp;
}

float MelSpectrogram::mel_to_hz(float mel) const {
    const float f_sp = 200.0f / 3.0f;
    const float min_log_hz = 1000.0f;
    const float min_log_mel = min_log_hz / f_sp;
    const float logstep = std::log(6.4f) / 27.0f;

    if (mel >= min_log_mel) {
        return min_log_hz * std::exp(logstep * (mel - min_log_mel));
    }
    return f_sp * mel;
}

void MelSpectrogram::build_filters(int sample_rate) {
    filters_.assign(static_cast<size_t>(n_mels_) * n_freqs_, 0.0f);

    float max_mel = hz_to_mel(sample_rate / 2.0f);
    std::vector<float> mel_hz(n_mels_ + 2);
    for (int i = 0; i < n_mels_ + 2; i++) {
        mel_hz[i] = mel_to_hz(max_mel * i / (n_mels_ + 1));
    }

    for (int m = 0; m < n_mels_; m++) {
        float left = mel_hz[m];
        float center = mel_hz[m + 1];
        float right = mel_hz[m + 2];
        float enorm = 2.0f / (right - left);    // Slaney area normalization

        for (int f = 0; f < n_freqs_; f++) {
            float freq = f * sample_rate / static_cast<float>(n_fft_);
            float lower = (freq - left) / (center - left);
            float upper = (right - freq) / (right - center);
            float weight = std::max(0.0f, std::min(lower, upper));
            filters_[static_cast<size_t>(m) * n_freqs_ + f] = weight * enorm;
        }
    }
}

std::vector<float> MelSpectrogram::compute(const float* samples, size_t n_samples) const {
    const int pad = n_fft_ / 2;
    const size_t used = std::min(n_samples, static_cast<size_t>(kWindowSamples));

    // Zero-pad to 30 s, then reflect-pad by n_fft/2 on both sides (center=True)
    std::vector<float> padded(kWindowSamples + 2 * pad, 0.0f);
    std::copy(samples, samples + used, padded.begin() + pad);
    for (int i = 0; i < pad; i++) {
        padded[pad - 1 - i] = padded[pad + 1 + i];
        padded[pad + kWindowSamples + i] = padded[pad + kWindowSamples - 2 - i];
    }

    std::vector<float> mel(static_cast<size_t>(n_mels_) * kFrames, 0.0f);
    std::vector<float> frame(n_fft_);
    std::vector<float> power(n_freqs_);

    for (int t = 0; t < kFrames; t++) {
        const float* src = padded.data() + static_cast<size_t>(t) * hop_length_;
        for (int n = 0; n < n_fft_; n++) {
            frame[n] = src[n] * hann_window_[n];
        }

        for (int k = 0; k < n_freqs_; k++) {
            const float* c = cos_table_.data() + static_cast<size_t>(k) * n_fft_;
            const float* s = sin_table_.data() + static_cast<size_t>(k) * n_fft_;
            float re = 0.0f;
            float im = 0.0f;
            for (int n = 0; n < n_fft_; n++) {
                re += frame[n] * c[n];
                im += frame[n] * s[n];
            }
            power[k] = re * re + im * im;
        }

        for (int m = 0; m < n_mels_; m++) {
            const float* filter = filters_.data() + static_cast<size_t>(m) * n_freqs_;
            float value = 0.0f;
            for (int k = 0; k < n_freqs_; k++) {
                value += filter[k] * power[k];
            }
            mel[static_cast<size_t>(m) * kFrames + t] = std::log10(std::max(value, 1e-10f));
        }
    }

    float max_log = *std::max_element(mel.begin(), mel.end());
    for (auto& value : mel) {
        value = (std::max(value, max_log - 8.0f) + 4.0f) / 4.0f;
    }

    return mel;
}

} // namespace ct2
} // namespace huginn
