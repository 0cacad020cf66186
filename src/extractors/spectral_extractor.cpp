#include "audioprint/extractors/spectral_extractor.hpp"

#include <cmath>
#include <complex>
#include <limits>
#include <vector>

#include "audioprint/dsp/stft.hpp"

namespace audioprint {

SpectralExtractor::FrameShape SpectralExtractor::frameShape(const std::vector<float>& magnitude,
                                                            const std::vector<float>& frequencies,
                                                            double rolloff_percent) {
    FrameShape shape;
    const std::size_t bins = magnitude.size();

    double total = 0.0;
    double weighted = 0.0;
    for (std::size_t k = 0; k < bins; ++k) {
        total += magnitude[k];
        weighted += static_cast<double>(frequencies[k]) * magnitude[k];
    }

    // First bin whose cumulative magnitude reaches the threshold
    const double threshold = rolloff_percent * total;
    double cumulative = 0.0;
    for (std::size_t k = 0; k < bins; ++k) {
        cumulative += magnitude[k];
        if (cumulative >= threshold) {
            shape.rolloff = frequencies[k];
            break;
        }
    }

    if (total < std::numeric_limits<float>::min()) {
        shape.rolloff = 0.0;
        return shape;
    }

    shape.centroid = weighted / total;

    double spread = 0.0;
    for (std::size_t k = 0; k < bins; ++k) {
        const double d = frequencies[k] - shape.centroid;
        spread += magnitude[k] / total * d * d;
    }
    shape.bandwidth = std::sqrt(spread);

    return shape;
}

void SpectralExtractor::compute(const AnalysisInput& input, FeatureRecord& record) {
    dsp::Stft stft(dsp::Stft::Config{config_.n_fft, config_.hop_length});
    const std::vector<float> frequencies = dsp::Stft::binFrequencies(config_.n_fft, input.sample_rate);
    const int bins = stft.getNumBins();

    std::vector<float> magnitude(bins);
    std::vector<double> centroids;
    double rolloff_sum = 0.0;
    double bandwidth_sum = 0.0;

    stft.forEachFrame(input.signal, [&](int, const std::complex<float>* spectrum) {
        for (int k = 0; k < bins; ++k) {
            magnitude[k] = std::abs(spectrum[k]);
        }
        const FrameShape shape = frameShape(magnitude, frequencies, config_.rolloff_percent);
        centroids.push_back(shape.centroid);
        rolloff_sum += shape.rolloff;
        bandwidth_sum += shape.bandwidth;
    });

    const double frames = static_cast<double>(centroids.size());
    SpectralFeatures features;
    double centroid_sum = 0.0;
    for (double c : centroids) {
        centroid_sum += c;
    }
    features.avg_brightness = centroid_sum / frames;
    double sq = 0.0;
    for (double c : centroids) {
        sq += (c - features.avg_brightness) * (c - features.avg_brightness);
    }
    features.brightness_variance = sq / frames;
    features.avg_rolloff = rolloff_sum / frames;
    features.avg_bandwidth = bandwidth_sum / frames;

    logInfo("avg centroid " + std::to_string(features.avg_brightness) + " Hz");
    record.spectral = features;
}

}  // namespace audioprint
