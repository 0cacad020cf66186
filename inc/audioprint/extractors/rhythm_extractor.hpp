#ifndef AUDIOPRINT_RHYTHM_EXTRACTOR_HPP
#define AUDIOPRINT_RHYTHM_EXTRACTOR_HPP

#include <string>
#include <vector>

#include "feature_extractor.hpp"

namespace audioprint {

/**
 * @class RhythmExtractor
 * @brief Tempo, onset statistics and beat strength from the percussive part
 *
 * With fewer than two onsets (or no tempo) the interval based metrics are 0.
 */
class RhythmExtractor : public BaseFeatureExtractor {
public:
    FeatureCategory getCategory() const override { return FeatureCategory::RHYTHM; }
    std::string getName() const override { return "RhythmExtractor"; }
    SignalComponent getInputComponent() const override { return SignalComponent::PERCUSSIVE; }

    /// @brief Mean distance of beat-relative intervals from whole beats
    static double syncopation(const std::vector<double>& intervals, double tempo);

    /// @brief Population variance
    static double variance(const std::vector<double>& values);

protected:
    void compute(const AnalysisInput& input, FeatureRecord& record) override;
};

}  // namespace audioprint

#endif  // AUDIOPRINT_RHYTHM_EXTRACTOR_HPP
