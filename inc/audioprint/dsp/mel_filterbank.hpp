/**
 * @file mel_filterbank.hpp
 * @brief Triangular mel filterbank (Slaney scale and area normalisation by default)
 */

#ifndef AUDIOPRINT_DSP_MEL_FILTERBANK_HPP
#define AUDIOPRINT_DSP_MEL_FILTERBANK_HPP

#include <vector>

namespace audioprint {
namespace dsp {

class MelFilterbank {
public:
    struct Config {
        int sample_rate = 22050;
        int n_fft = 2048;
        int n_mels = 128;
        float fmin = 0.0f;
        float fmax = 0.0f;          // <= 0 means Nyquist
        bool htk = false;           // HTK formula instead of the Slaney scale
        bool area_normalize = true; // scale each triangle to unit area
    };

    explicit MelFilterbank(const Config& config);

    int getNumMels() const { return config_.n_mels; }
    int getNumBins() const { return config_.n_fft / 2 + 1; }

    /**
     * @brief Project one power (or magnitude) spectrum onto the mel bands
     * @param spectrum getNumBins() values
     * @param mel_out  resized to getNumMels()
     */
    void apply(const float* spectrum, std::vector<float>& mel_out) const;

    /// @brief Dense weight of band @p mel at bin @p bin (mainly for tests)
    float weight(int mel, int bin) const;

    static double hzToMel(double freq, bool htk);
    static double melToHz(double mel, bool htk);

private:
    // Sparse mel filterbank: only the non-zero span of each triangle is stored
    struct MelFilter {
        int start_bin = 0;
        int end_bin = -1;           // inclusive
        std::vector<float> weights;
    };

    Config config_;
    std::vector<MelFilter> filters_;

    void initializeFilters();
};

}  // namespace dsp
}  // namespace audioprint

#endif  // AUDIOPRINT_DSP_MEL_FILTERBANK_HPP
