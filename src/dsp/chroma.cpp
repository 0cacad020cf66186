#include "audioprint/dsp/chroma.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>
#include <vector>

#include "audioprint/dsp/stft.hpp"

namespace audioprint {
namespace dsp {

Chromagram::Chromagram(const ExtractorConfig& config, int sample_rate)
    : n_fft_(config.n_fft)
    , hop_length_(config.hop_length)
    , sample_rate_(sample_rate)
{
    initializeFilterbank();
}

void Chromagram::initializeFilterbank() {
    const int bins = n_fft_ / 2 + 1;
    weights_.assign(bins, ChromaFrame{});

    for (int k = 1; k < bins; ++k) {
        const double freq = static_cast<double>(k) * sample_rate_ / n_fft_;
        if (freq < kMinFrequency) {
            continue;
        }
        // Semitones above C, folded into one octave
        const double pitch = std::fmod(12.0 * std::log2(freq / kMinFrequency), 12.0);
        for (int c = 0; c < kNumPitchClasses; ++c) {
            double d = std::fabs(pitch - c);
            d = std::min(d, 12.0 - d);
            weights_[k][c] = static_cast<float>(std::exp(-2.0 * d * d));
        }
    }
}

float Chromagram::weight(int pitch_class, int bin) const {
    if (pitch_class < 0 || pitch_class >= kNumPitchClasses ||
        bin < 0 || bin >= static_cast<int>(weights_.size())) {
        return 0.0f;
    }
    return weights_[bin][pitch_class];
}

std::vector<ChromaFrame> Chromagram::compute(const std::vector<float>& signal) const {
    Stft stft(Stft::Config{n_fft_, hop_length_});
    const int bins = stft.getNumBins();

    std::vector<ChromaFrame> chroma(stft.numFrames(signal.size()));

    stft.forEachFrame(signal, [&](int t, const std::complex<float>* spectrum) {
        std::array<double, kNumPitchClasses> energy{};
        for (int k = 0; k < bins; ++k) {
            const double power = std::norm(spectrum[k]);
            if (power == 0.0) {
                continue;
            }
            for (int c = 0; c < kNumPitchClasses; ++c) {
                energy[c] += weights_[k][c] * power;
            }
        }

        const double peak = *std::max_element(energy.begin(), energy.end());
        ChromaFrame& frame = chroma[t];
        if (peak > std::numeric_limits<float>::min()) {
            for (int c = 0; c < kNumPitchClasses; ++c) {
                frame[c] = static_cast<float>(energy[c] / peak);
            }
        } else {
            frame.fill(0.0f);
        }
    });

    return chroma;
}

}  // namespace dsp
}  // namespace audioprint
