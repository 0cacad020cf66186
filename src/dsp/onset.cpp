#include "audioprint/dsp/onset.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>
#include <vector>

#include "audioprint/dsp/mel_filterbank.hpp"
#include "audioprint/dsp/stft.hpp"

namespace audioprint {
namespace dsp {

namespace {

constexpr float kAmin = 1e-10f;
constexpr float kTopDb = 80.0f;

// Frame count for a duration, truncated like floor division
int framesFor(float seconds, int sample_rate, int hop_length) {
    return static_cast<int>(std::floor(static_cast<double>(seconds) * sample_rate / hop_length));
}

}  // namespace

OnsetDetector::OnsetDetector(const ExtractorConfig& config, int sample_rate)
    : config_(config)
    , sample_rate_(sample_rate)
{
}

void OnsetDetector::powerToDb(std::vector<float>& values, float amin, float top_db) {
    if (values.empty()) {
        return;
    }
    float max_db = -std::numeric_limits<float>::infinity();
    for (float& v : values) {
        v = 10.0f * std::log10(std::max(amin, v));
        max_db = std::max(max_db, v);
    }
    const float floor_db = max_db - top_db;
    for (float& v : values) {
        v = std::max(v, floor_db);
    }
}

std::vector<float> OnsetDetector::onsetStrength(const std::vector<float>& signal) const {
    Stft stft(Stft::Config{config_.n_fft, config_.hop_length});

    MelFilterbank::Config mel_config;
    mel_config.sample_rate = sample_rate_;
    mel_config.n_fft = config_.n_fft;
    mel_config.n_mels = config_.n_mels;
    MelFilterbank mel(mel_config);

    const int frames = stft.numFrames(signal.size());
    const int n_mels = config_.n_mels;
    const int bins = stft.getNumBins();

    // Mel power spectrogram, frame-major
    std::vector<float> mel_spec(static_cast<std::size_t>(frames) * n_mels);
    std::vector<float> power(bins);
    std::vector<float> mel_frame;
    stft.forEachFrame(signal, [&](int t, const std::complex<float>* spectrum) {
        for (int k = 0; k < bins; ++k) {
            power[k] = std::norm(spectrum[k]);
        }
        mel.apply(power.data(), mel_frame);
        std::copy(mel_frame.begin(), mel_frame.end(), mel_spec.begin() + static_cast<std::size_t>(t) * n_mels);
    });

    powerToDb(mel_spec, kAmin, kTopDb);

    std::vector<float> envelope(frames, 0.0f);
    const int lag = 1;
    const int pad = lag + config_.n_fft / (2 * config_.hop_length);

    for (int t = pad; t < frames; ++t) {
        const int cur = t - pad + lag;
        const int prev = t - pad;
        if (cur >= frames) {
            break;
        }
        const float* a = mel_spec.data() + static_cast<std::size_t>(cur) * n_mels;
        const float* b = mel_spec.data() + static_cast<std::size_t>(prev) * n_mels;
        double sum = 0.0;
        for (int m = 0; m < n_mels; ++m) {
            sum += std::max(0.0f, a[m] - b[m]);
        }
        envelope[t] = static_cast<float>(sum / n_mels);
    }

    return envelope;
}

PeakPickParams OnsetDetector::peakPickParams() const {
    const int hop = config_.hop_length;
    PeakPickParams params;
    params.pre_max = framesFor(config_.onset_pre_max_s, sample_rate_, hop);
    params.post_max = framesFor(config_.onset_post_max_s, sample_rate_, hop) + 1;
    params.pre_avg = framesFor(config_.onset_pre_avg_s, sample_rate_, hop);
    params.post_avg = framesFor(config_.onset_post_avg_s, sample_rate_, hop) + 1;
    params.wait = framesFor(config_.onset_wait_s, sample_rate_, hop);
    params.delta = config_.onset_delta;
    return params;
}

std::vector<int> OnsetDetector::detect(const std::vector<float>& envelope) const {
    if (envelope.empty()) {
        return {};
    }

    const auto minmax = std::minmax_element(envelope.begin(), envelope.end());
    const float low = *minmax.first;
    const float range = *minmax.second - low;
    if (!(range > 0.0f)) {
        return {};     // flat envelope: nothing to pick
    }

    std::vector<float> normalized(envelope.size());
    for (std::size_t i = 0; i < envelope.size(); ++i) {
        normalized[i] = (envelope[i] - low) / (range + std::numeric_limits<float>::min());
    }

    return peakPick(normalized, peakPickParams());
}

double OnsetDetector::frameToTime(int frame) const {
    return static_cast<double>(frame) * config_.hop_length / sample_rate_;
}

std::vector<int> OnsetDetector::peakPick(const std::vector<float>& x, const PeakPickParams& params) {
    const int n = static_cast<int>(x.size());
    std::vector<int> peaks;

    // Prefix sums for the moving average
    std::vector<double> prefix(n + 1, 0.0);
    for (int i = 0; i < n; ++i) {
        prefix[i + 1] = prefix[i] + x[i];
    }

    int last_peak = -1;
    for (int i = 0; i < n; ++i) {
        const int max_lo = std::max(0, i - params.pre_max);
        const int max_hi = std::min(n, i + params.post_max);
        float window_max = x[i];
        for (int j = max_lo; j < max_hi; ++j) {
            window_max = std::max(window_max, x[j]);
        }
        if (x[i] != window_max || x[i] <= 0.0f) {
            continue;
        }

        // The averaging window always holds frame i
        const int avg_lo = std::max(0, i - std::max(0, params.pre_avg));
        const int avg_hi = std::min(n, i + std::max(1, params.post_avg));
        const double avg = (prefix[avg_hi] - prefix[avg_lo]) / (avg_hi - avg_lo);
        if (x[i] < avg + params.delta) {
            continue;
        }

        if (last_peak >= 0 && i <= last_peak + params.wait) {
            continue;
        }
        peaks.push_back(i);
        last_peak = i;
    }

    return peaks;
}

}  // namespace dsp
}  // namespace audioprint
