#include "audioprint/dsp/mel_filterbank.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace audioprint {
namespace dsp {

namespace {

// Slaney scale: linear below 1 kHz, logarithmic above
constexpr double kSlaneyHzPerMel = 200.0 / 3.0;
constexpr double kSlaneyMinLogHz = 1000.0;
constexpr double kSlaneyMinLogMel = kSlaneyMinLogHz / kSlaneyHzPerMel;

double slaneyLogStep() {
    return std::log(6.4) / 27.0;
}

}  // namespace

MelFilterbank::MelFilterbank(const Config& config)
    : config_(config)
{
    if (config_.n_mels <= 0 || config_.n_fft <= 0 || config_.sample_rate <= 0) {
        throw std::runtime_error("Invalid mel filterbank configuration (n_mels=" +
                                 std::to_string(config_.n_mels) + ")");
    }
    if (config_.fmax <= 0.0f) {
        config_.fmax = config_.sample_rate / 2.0f;
    }
    initializeFilters();
}

double MelFilterbank::hzToMel(double freq, bool htk) {
    if (htk) {
        return 2595.0 * std::log10(1.0 + freq / 700.0);
    }
    if (freq < kSlaneyMinLogHz) {
        return freq / kSlaneyHzPerMel;
    }
    return kSlaneyMinLogMel + std::log(freq / kSlaneyMinLogHz) / slaneyLogStep();
}

double MelFilterbank::melToHz(double mel, bool htk) {
    if (htk) {
        return 700.0 * (std::pow(10.0, mel / 2595.0) - 1.0);
    }
    if (mel < kSlaneyMinLogMel) {
        return mel * kSlaneyHzPerMel;
    }
    return kSlaneyMinLogHz * std::exp(slaneyLogStep() * (mel - kSlaneyMinLogMel));
}

void MelFilterbank::initializeFilters() {
    const int n_mels = config_.n_mels;
    const int num_bins = getNumBins();

    // n_mels + 2 band edges evenly spaced on the mel axis
    const double low_mel = hzToMel(config_.fmin, config_.htk);
    const double high_mel = hzToMel(config_.fmax, config_.htk);
    std::vector<double> edges_hz(n_mels + 2);
    for (int i = 0; i < n_mels + 2; ++i) {
        const double mel = low_mel + i * (high_mel - low_mel) / (n_mels + 1);
        edges_hz[i] = melToHz(mel, config_.htk);
    }

    filters_.assign(n_mels, MelFilter());

    for (int m = 0; m < n_mels; ++m) {
        const double lower = edges_hz[m];
        const double centre = edges_hz[m + 1];
        const double upper = edges_hz[m + 2];
        const double norm = config_.area_normalize ? 2.0 / (upper - lower) : 1.0;

        MelFilter& filter = filters_[m];
        std::vector<float> dense(num_bins, 0.0f);
        int first = -1;
        int last = -1;

        for (int k = 0; k < num_bins; ++k) {
            const double freq = static_cast<double>(k) * config_.sample_rate / config_.n_fft;
            // Rising and falling edge, whichever is lower
            const double rising = (freq - lower) / (centre - lower);
            const double falling = (upper - freq) / (upper - centre);
            const double w = std::max(0.0, std::min(rising, falling));
            if (w > 0.0) {
                dense[k] = static_cast<float>(w * norm);
                if (first < 0) first = k;
                last = k;
            }
        }

        if (first >= 0) {
            filter.start_bin = first;
            filter.end_bin = last;
            filter.weights.assign(dense.begin() + first, dense.begin() + last + 1);
        }
    }
}

void MelFilterbank::apply(const float* spectrum, std::vector<float>& mel_out) const {
    mel_out.assign(config_.n_mels, 0.0f);
    for (int m = 0; m < config_.n_mels; ++m) {
        const MelFilter& filter = filters_[m];
        double sum = 0.0;
        for (int k = filter.start_bin; k <= filter.end_bin; ++k) {
            sum += static_cast<double>(filter.weights[k - filter.start_bin]) * spectrum[k];
        }
        mel_out[m] = static_cast<float>(sum);
    }
}

float MelFilterbank::weight(int mel, int bin) const {
    if (mel < 0 || mel >= config_.n_mels) {
        return 0.0f;
    }
    const MelFilter& filter = filters_[mel];
    if (bin < filter.start_bin || bin > filter.end_bin) {
        return 0.0f;
    }
    return filter.weights[bin - filter.start_bin];
}

}  // namespace dsp
}  // namespace audioprint
