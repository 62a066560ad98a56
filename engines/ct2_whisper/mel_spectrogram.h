#pragma once

#include <cstddef>
#include <vector>

namespace huginn {
namespace ct2 {

/**
 * @brief Log-mel features for one 30 second Whisper window
 *
 * Matches Whisper's front end: 400-point Hann STFT with a 160-sample hop
 * on reflect-padded audio, HTK/Slaney mel filters, log10 with the dynamic
 * range clamped to 8 below the window maximum, then (x + 4) / 4.
 *
 * Output is laid out mel-major ([n_mels][n_frames] flattened), which is
 * the order CTranslate2 expects for a {1, n_mels, n_frames} StorageView.
 */
class MelSpectrogram {
public:
    static constexpr int kSampleRate = 16000;
    static constexpr int kWindowSamples = 30 * kSampleRate;
    static constexpr int kFrames = 3000;

    explicit MelSpectrogram(int n_mels = 80, int n_fft = 400, int hop_length = 160);

    /**
     * @brief Features for one window
     *
     * Shorter input is zero-padded to 30 s; longer input is truncated.
     *
     * @return n_mels() * kFrames values, mel-major
     */
    std::vector<float> compute(const float* samples, size_t n_samples) const;

    int n_mels() const { return n_mels_; }

private:
    float hz_to_mel(float hz) const;
    float mel_to_hz(float mel) const;
    void build_filters(int sample_rate);

    int n_mels_;
    int n_fft_;
    int hop_length_;
    int n_freqs_;
    std::vector<float> hann_window_;
    std::vector<float> filters_;        // [n_mels][n_freqs]
    std::vector<float> cos_table_;      // [n_freqs][n_fft]
    std::vector<float> sin_table_;
};

} // namespace ct2
} // namespace huginn
