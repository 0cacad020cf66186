/**
 * @file chroma.hpp
 * @brief STFT chromagram through a Gaussian pitch-class filterbank
 */

#ifndef AUDIOPRINT_DSP_CHROMA_HPP
#define AUDIOPRINT_DSP_CHROMA_HPP

#include <array>
#include <vector>

#include "../audioprint_config.hpp"

namespace audioprint {
namespace dsp {

constexpr int kNumPitchClasses = 12;

using ChromaFrame = std::array<float, kNumPitchClasses>;

/**
 * @class Chromagram
 * @brief 12-bin pitch-class energy per frame, index 0 = C
 *
 * Every FFT bin from 32.7 Hz (C1) up to Nyquist contributes to each class
 * with weight exp(-2 d^2), d being its circular distance in semitones to the
 * class. Frames are scaled so their largest class is 1 (silent frames stay 0).
 */
class Chromagram {
public:
    Chromagram(const ExtractorConfig& config, int sample_rate);

    /// @throws std::runtime_error on FFTW failure
    std::vector<ChromaFrame> compute(const std::vector<float>& signal) const;

    /// @brief Filterbank weight of @p bin for @p pitch_class
    float weight(int pitch_class, int bin) const;

    static constexpr float kMinFrequency = 32.70319566f;    // C1

private:
    int n_fft_;
    int hop_length_;
    int sample_rate_;
    std::vector<ChromaFrame> weights_;      // one row per FFT bin

    void initializeFilterbank();
};

}  // namespace dsp
}  // namespace audioprint

#endif  // AUDIOPRINT_DSP_CHROMA_HPP
