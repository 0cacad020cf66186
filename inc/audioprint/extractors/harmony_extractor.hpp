#ifndef AUDIOPRINT_HARMONY_EXTRACTOR_HPP
#define AUDIOPRINT_HARMONY_EXTRACTOR_HPP

#include <string>
#include <vector>

#include "../dsp/chroma.hpp"
#include "feature_extractor.hpp"

namespace audioprint {

/**
 * @class HarmonyExtractor
 * @brief Pitch-class statistics of the harmonic part
 */
class HarmonyExtractor : public BaseFeatureExtractor {
public:
    FeatureCategory getCategory() const override { return FeatureCategory::HARMONY; }
    std::string getName() const override { return "HarmonyExtractor"; }
    SignalComponent getInputComponent() const override { return SignalComponent::HARMONIC; }

    /// @brief Summary statistics of a chromagram
    static HarmonyFeatures summarize(const std::vector<dsp::ChromaFrame>& chroma,
                                     double duration, double epsilon);

protected:
    void compute(const AnalysisInput& input, FeatureRecord& record) override;
};

}  // namespace audioprint

#endif  // AUDIOPRINT_HARMONY_EXTRACTOR_HPP
