#include "audioprint/extractors/energy_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace audioprint {

std::vector<double> EnergyExtractor::rmsEnvelope(const std::vector<float>& signal,
                                                 int frame_length, int hop_length) {
    const long long length = static_cast<long long>(signal.size());
    const std::size_t frames = 1 + signal.size() / static_cast<std::size_t>(hop_length);

    // Prefix sum of squares; the zero padding contributes nothing
    std::vector<double> prefix(signal.size() + 1, 0.0);
    for (std::size_t i = 0; i < signal.size(); ++i) {
        prefix[i + 1] = prefix[i] + static_cast<double>(signal[i]) * signal[i];
    }

    std::vector<double> rms(frames);
    for (std::size_t t = 0; t < frames; ++t) {
        const long long start = static_cast<long long>(t) * hop_length - frame_length / 2;
        const long long lo = std::max(0LL, start);
        const long long hi = std::min(length, start + frame_length);
        const double energy = hi > lo ? prefix[hi] - prefix[lo] : 0.0;
        rms[t] = std::sqrt(std::max(0.0, energy) / frame_length);
    }
    return rms;
}

double EnergyExtractor::linearTrend(const std::vector<double>& values) {
    const std::size_t n = values.size();
    if (n < 2) {
        return 0.0;
    }
    const double x_mean = (n - 1) / 2.0;
    const double y_mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
    double sxy = 0.0;
    double sxx = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - x_mean;
        sxy += dx * (values[i] - y_mean);
        sxx += dx * dx;
    }
    return sxy / sxx;
}

std::size_t EnergyExtractor::countPeaks(const std::vector<double>& values, double min_height) {
    const std::size_t n = values.size();
    std::size_t count = 0;
    std::size_t i = 1;
    while (i + 1 < n) {
        if (values[i - 1] < values[i]) {
            // Walk to the end of a possible plateau
            std::size_t ahead = i + 1;
            while (ahead + 1 < n && values[ahead] == values[i]) {
                ++ahead;
            }
            if (values[ahead] < values[i]) {
                if (values[i] >= min_height) {
                    ++count;
                }
                i = ahead;
                continue;
            }
        }
        ++i;
    }
    return count;
}

void EnergyExtractor::compute(const AnalysisInput& input, FeatureRecord& record) {
    const std::vector<double> rms = rmsEnvelope(input.signal, config_.n_fft, config_.hop_length);

    EnergyFeatures features;
    const auto minmax = std::minmax_element(rms.begin(), rms.end());
    features.energy_range = *minmax.second - *minmax.first;
    features.avg_energy = std::accumulate(rms.begin(), rms.end(), 0.0) / rms.size();
    features.energy_trend = linearTrend(rms);
    features.peak_density = countPeaks(rms, features.avg_energy) / input.duration;

    logInfo(std::to_string(rms.size()) + " RMS frames, mean " + std::to_string(features.avg_energy));
    record.energy = features;
}

}  // namespace audioprint
