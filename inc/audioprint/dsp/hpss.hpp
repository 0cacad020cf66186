/**
 * @file hpss.hpp
 * @brief Median-filtering harmonic / percussive source separation
 *
 * Fitzgerald, "Harmonic/percussive separation using median filtering", 2010.
 */

#ifndef AUDIOPRINT_DSP_HPSS_HPP
#define AUDIOPRINT_DSP_HPSS_HPP

#include <vector>

#include "../audioprint_config.hpp"
#include "stft.hpp"

namespace audioprint {

struct SeparatedAudio {
    std::vector<float> harmonic;
    std::vector<float> percussive;
};

/**
 * @class HarmonicPercussiveSeparator
 * @brief Splits a waveform into harmonic and percussive parts of equal length
 *
 * The magnitude spectrogram is median filtered along time (harmonic) and
 * along frequency (percussive); the filtered spectrograms form soft Wiener
 * masks that are applied to the complex STFT before inversion.
 */
class HarmonicPercussiveSeparator {
public:
    explicit HarmonicPercussiveSeparator(const ExtractorConfig& config);

    /// @throws std::runtime_error on FFTW failure
    SeparatedAudio separate(const std::vector<float>& signal) const;

    /**
     * @brief Median filter of odd length @p kernel over a strided sequence
     *
     * Edges use half-sample symmetric reflection (d c b a | a b c d | d c b a).
     */
    static void medianFilter(const float* input, float* output, int count, int stride, int kernel);

    /// @brief Soft mask X^p / (X^p + R^p); 0.5 where both are zero
    static float softMask(float x, float reference, float power, bool split_zeros);

private:
    int n_fft_;
    int hop_length_;
    int kernel_size_;
    float power_;
    float margin_;
};

}  // namespace audioprint

#endif  // AUDIOPRINT_DSP_HPSS_HPP
