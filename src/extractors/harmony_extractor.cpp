#include "audioprint/extractors/harmony_extractor.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

namespace audioprint {

HarmonyFeatures HarmonyExtractor::summarize(const std::vector<dsp::ChromaFrame>& chroma,
                                            double duration, double epsilon) {
    HarmonyFeatures features;
    const std::size_t frames = chroma.size();
    if (frames == 0) {
        features.key_strength = 0.0;
        features.tonal_stability = 1.0;
        return features;
    }

    std::array<double, dsp::kNumPitchClasses> mean{};
    for (const auto& frame : chroma) {
        for (int c = 0; c < dsp::kNumPitchClasses; ++c) {
            mean[c] += frame[c];
        }
    }
    for (double& m : mean) {
        m /= frames;
    }

    // Per-class variance over time, averaged over classes
    double variance_sum = 0.0;
    for (int c = 0; c < dsp::kNumPitchClasses; ++c) {
        double sq = 0.0;
        for (const auto& frame : chroma) {
            const double d = frame[c] - mean[c];
            sq += d * d;
        }
        variance_sum += sq / frames;
    }
    features.chroma_variance = variance_sum / dsp::kNumPitchClasses;

    double profile_mean = 0.0;
    for (double m : mean) {
        profile_mean += m;
    }
    profile_mean /= dsp::kNumPitchClasses;
    features.key_strength = *std::max_element(mean.begin(), mean.end()) / (profile_mean + epsilon);

    double profile_sq = 0.0;
    for (double m : mean) {
        profile_sq += (m - profile_mean) * (m - profile_mean);
    }
    features.tonal_stability = 1.0 - std::sqrt(profile_sq / dsp::kNumPitchClasses);

    if (frames >= 2 && duration > 0.0) {
        double change = 0.0;
        for (std::size_t t = 1; t < frames; ++t) {
            for (int c = 0; c < dsp::kNumPitchClasses; ++c) {
                change += std::fabs(static_cast<double>(chroma[t][c]) - chroma[t - 1][c]);
            }
        }
        features.harmonic_change_rate = change / (frames - 1) / duration;
    }

    return features;
}

void HarmonyExtractor::compute(const AnalysisInput& input, FeatureRecord& record) {
    dsp::Chromagram chromagram(config_, input.sample_rate);
    const std::vector<dsp::ChromaFrame> chroma = chromagram.compute(input.signal);

    record.harmony = summarize(chroma, input.duration, config_.epsilon);
    logInfo("key_strength=" + std::to_string(record.harmony->key_strength) +
            " over " + std::to_string(chroma.size()) + " frames");
}

}  // namespace audioprint
