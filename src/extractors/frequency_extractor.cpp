#include "audioprint/extractors/frequency_extractor.hpp"

#include <complex>
#include <sstream>
#include <vector>

#include "audioprint/dsp/stft.hpp"

namespace audioprint {

namespace {

struct BandAccumulator {
    FrequencyBand band;
    std::vector<int> bins;
    double sum = 0.0;

    double mean(int frames) const {
        if (bins.empty() || frames <= 0) {
            return 0.0;
        }
        return sum / (static_cast<double>(bins.size()) * frames);
    }
};

BandAccumulator makeBand(const FrequencyBand& band, const std::vector<float>& frequencies) {
    BandAccumulator acc;
    acc.band = band;
    for (std::size_t k = 0; k < frequencies.size(); ++k) {
        if (frequencies[k] >= band.low_hz && frequencies[k] <= band.high_hz) {
            acc.bins.push_back(static_cast<int>(k));
        }
    }
    return acc;
}

}  // namespace

FrequencyFeatures FrequencyExtractor::fromBandEnergies(double low, double mid, double high, double epsilon) {
    FrequencyFeatures features;
    const double total = low + mid + high;
    if (total < epsilon) {
        features.low_proportion = 1.0 / 3.0;
        features.mid_proportion = 1.0 / 3.0;
        features.high_proportion = 1.0 / 3.0;
    } else {
        features.low_proportion = low / total;
        features.mid_proportion = mid / total;
        features.high_proportion = high / total;
    }
    features.mid_low_ratio = mid / (low + epsilon);
    features.high_mid_ratio = high / (mid + epsilon);
    return features;
}

void FrequencyExtractor::compute(const AnalysisInput& input, FeatureRecord& record) {
    dsp::Stft stft(dsp::Stft::Config{config_.n_fft, config_.hop_length});
    const std::vector<float> frequencies = dsp::Stft::binFrequencies(config_.n_fft, input.sample_rate);

    BandAccumulator bands[3] = {
        makeBand(config_.low_band, frequencies),
        makeBand(config_.mid_band, frequencies),
        makeBand(config_.high_band, frequencies),
    };

    int frames = 0;
    stft.forEachFrame(input.signal, [&](int, const std::complex<float>* spectrum) {
        for (BandAccumulator& acc : bands) {
            for (int k : acc.bins) {
                acc.sum += std::abs(spectrum[k]);
            }
        }
        ++frames;
    });

    const double low = bands[0].mean(frames);
    const double mid = bands[1].mean(frames);
    const double high = bands[2].mean(frames);

    record.frequency = fromBandEnergies(low, mid, high, config_.epsilon);

    std::ostringstream msg;
    msg << "low/mid/high = " << record.frequency->low_proportion << " / "
        << record.frequency->mid_proportion << " / " << record.frequency->high_proportion;
    logInfo(msg.str());
}

}  // namespace audioprint
