#include "audioprint/extractors/rhythm_extractor.hpp"

#include <cmath>
#include <numeric>
#include <sstream>
#include <vector>

#include "audioprint/dsp/beat_tracker.hpp"
#include "audioprint/dsp/onset.hpp"

namespace audioprint {

double RhythmExtractor::syncopation(const std::vector<double>& intervals, double tempo) {
    if (intervals.empty() || !(tempo > 0.0)) {
        return 0.0;
    }
    const double beat_duration = 60.0 / tempo;
    double sum = 0.0;
    for (double interval : intervals) {
        const double beats = interval / beat_duration;
        sum += std::fabs(beats - std::nearbyint(beats));   // ties to even
    }
    return sum / intervals.size();
}

double RhythmExtractor::variance(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double sq = 0.0;
    for (double v : values) {
        sq += (v - mean) * (v - mean);
    }
    return sq / values.size();
}

void RhythmExtractor::compute(const AnalysisInput& input, FeatureRecord& record) {
    dsp::OnsetDetector detector(config_, input.sample_rate);
    dsp::BeatTracker tracker(config_, input.sample_rate);

    const std::vector<float> envelope = detector.onsetStrength(input.signal);
    const dsp::BeatResult beat = tracker.track(envelope);
    const std::vector<int> onsets = detector.detect(envelope);

    RhythmFeatures features;
    features.tempo = beat.tempo;
    features.beat_strength = envelope.empty()
        ? 0.0
        : std::accumulate(envelope.begin(), envelope.end(), 0.0) / envelope.size();

    if (onsets.size() < 2 || !(beat.tempo > 0.0)) {
        std::ostringstream msg;
        msg << "Degenerate rhythm (" << onsets.size() << " onsets, tempo "
            << beat.tempo << "), interval metrics set to 0";
        logInfo(msg.str());
    } else {
        std::vector<double> intervals;
        intervals.reserve(onsets.size() - 1);
        for (std::size_t i = 1; i < onsets.size(); ++i) {
            intervals.push_back(detector.frameToTime(onsets[i]) - detector.frameToTime(onsets[i - 1]));
        }
        features.syncopation_level = syncopation(intervals, beat.tempo);
        features.rhythmic_variance = variance(intervals);
        features.onset_density = onsets.size() / input.duration;
    }

    std::ostringstream msg;
    msg << "tempo=" << features.tempo << " BPM, " << onsets.size() << " onsets, "
        << beat.beats.size() << " beats";
    logInfo(msg.str());

    record.rhythm = features;
}

}  // namespace audioprint
