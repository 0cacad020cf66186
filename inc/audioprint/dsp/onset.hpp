/**
 * @file onset.hpp
 * @brief Spectral-flux onset strength and peak picking
 */

#ifndef AUDIOPRINT_DSP_ONSET_HPP
#define AUDIOPRINT_DSP_ONSET_HPP

#include <vector>

#include "../audioprint_config.hpp"

namespace audioprint {
namespace dsp {

/**
 * @brief Peak picking window sizes in frames
 *
 * A frame n is a peak when x[n] is the maximum of x[n - pre_max, n + post_max),
 * x[n] >= mean(x[n - pre_avg, n + post_avg)) + delta, and more than @c wait
 * frames have passed since the previous peak. Windows are clipped at the
 * signal edges.
 */
struct PeakPickParams {
    int pre_max = 1;
    int post_max = 1;
    int pre_avg = 1;
    int post_avg = 1;
    int wait = 0;
    float delta = 0.0f;
};

class OnsetDetector {
public:
    OnsetDetector(const ExtractorConfig& config, int sample_rate);

    /**
     * @brief Onset strength envelope, one value per analysis frame
     *
     * Mel power spectrogram in dB, positive first difference averaged over
     * bands, delayed by 1 + n_fft / (2 * hop) frames to line up with the
     * centred frames.
     * @throws std::runtime_error on FFTW failure
     */
    std::vector<float> onsetStrength(const std::vector<float>& signal) const;

    /// @brief Onset frame indices of an envelope (normalised to [0, 1] first)
    std::vector<int> detect(const std::vector<float>& envelope) const;

    /// @brief Peak picking parameters derived from the configured times
    PeakPickParams peakPickParams() const;

    double frameToTime(int frame) const;

    static std::vector<int> peakPick(const std::vector<float>& x, const PeakPickParams& params);

    /// @brief 10 * log10(max(amin, S)), floored at max - top_db
    static void powerToDb(std::vector<float>& values, float amin, float top_db);

private:
    ExtractorConfig config_;
    int sample_rate_;
};

}  // namespace dsp
}  // namespace audioprint

#endif  // AUDIOPRINT_DSP_ONSET_HPP
