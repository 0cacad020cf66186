/**
 * @file hpss.cpp
 * @brief Harmonic / percussive separation
 */

#include "audioprint/dsp/hpss.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>
#include <vector>

namespace audioprint {

namespace {

int reflectIndex(int i, int n) {
    if (n == 1) {
        return 0;
    }
    while (i < 0 || i >= n) {
        if (i < 0) {
            i = -i - 1;
        } else {
            i = 2 * n - i - 1;
        }
    }
    return i;
}

}  // namespace

HarmonicPercussiveSeparator::HarmonicPercussiveSeparator(const ExtractorConfig& config)
    : n_fft_(config.hpss_n_fft)
    , hop_length_(config.hpss_hop_length)
    , kernel_size_(config.hpss_kernel_size)
    , power_(config.hpss_power)
    , margin_(config.hpss_margin)
{
}

void HarmonicPercussiveSeparator::medianFilter(const float* input, float* output,
                                               int count, int stride, int kernel) {
    const int half = kernel / 2;
    std::vector<float> window(kernel);

    for (int i = 0; i < count; ++i) {
        for (int j = 0; j < kernel; ++j) {
            const int idx = reflectIndex(i + j - half, count);
            window[j] = input[static_cast<std::size_t>(idx) * stride];
        }
        std::nth_element(window.begin(), window.begin() + half, window.end());
        output[static_cast<std::size_t>(i) * stride] = window[half];
    }
}

float HarmonicPercussiveSeparator::softMask(float x, float reference, float power, bool split_zeros) {
    const float z = std::max(x, reference);
    if (z < std::numeric_limits<float>::min()) {
        return split_zeros ? 0.5f : 0.0f;
    }
    const float mask = std::pow(x / z, power);
    const float ref_mask = std::pow(reference / z, power);
    return mask / (mask + ref_mask);
}

SeparatedAudio HarmonicPercussiveSeparator::separate(const std::vector<float>& signal) const {
    dsp::Stft stft(dsp::Stft::Config{n_fft_, hop_length_});

    dsp::ComplexSpectrogram spectrum = stft.forward(signal);
    const int frames = spectrum.num_frames;
    const int bins = spectrum.num_bins;
    const std::size_t cells = spectrum.data.size();

    std::vector<float> magnitude(cells);
    for (std::size_t i = 0; i < cells; ++i) {
        magnitude[i] = std::abs(spectrum.data[i]);
    }

    // Harmonic: smooth each bin across time. Percussive: smooth each frame across frequency.
    std::vector<float> harmonic_mag(cells);
    std::vector<float> percussive_mag(cells);
    for (int k = 0; k < bins; ++k) {
        medianFilter(magnitude.data() + k, harmonic_mag.data() + k, frames, bins, kernel_size_);
    }
    for (int t = 0; t < frames; ++t) {
        const std::size_t offset = static_cast<std::size_t>(t) * bins;
        medianFilter(magnitude.data() + offset, percussive_mag.data() + offset, bins, 1, kernel_size_);
    }

    const bool split_zeros = (margin_ == 1.0f);

    dsp::ComplexSpectrogram harmonic_spec = spectrum;
    dsp::ComplexSpectrogram percussive_spec = spectrum;
    for (std::size_t i = 0; i < cells; ++i) {
        const float mask_h = softMask(harmonic_mag[i], percussive_mag[i] * margin_, power_, split_zeros);
        const float mask_p = softMask(percussive_mag[i], harmonic_mag[i] * margin_, power_, split_zeros);
        harmonic_spec.data[i] *= mask_h;
        percussive_spec.data[i] *= mask_p;
    }

    SeparatedAudio result;
    result.harmonic = stft.inverse(harmonic_spec, signal.size());
    result.percussive = stft.inverse(percussive_spec, signal.size());
    return result;
}

}  // namespace audioprint
