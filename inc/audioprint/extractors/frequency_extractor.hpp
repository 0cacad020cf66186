#ifndef AUDIOPRINT_FREQUENCY_EXTRACTOR_HPP
#define AUDIOPRINT_FREQUENCY_EXTRACTOR_HPP

#include <string>

#include "feature_extractor.hpp"

namespace audioprint {

/**
 * @class FrequencyExtractor
 * @brief Low / mid / high balance of the mean magnitude spectrum
 *
 * Bands include the bins whose centre frequency lies within the band edges
 * (edges inclusive, so a bin on a shared edge counts for both bands).
 */
class FrequencyExtractor : public BaseFeatureExtractor {
public:
    FeatureCategory getCategory() const override { return FeatureCategory::FREQUENCY; }
    std::string getName() const override { return "FrequencyExtractor"; }
    SignalComponent getInputComponent() const override { return SignalComponent::FULL; }

    /// @brief Proportions and ratios from the three band means
    static FrequencyFeatures fromBandEnergies(double low, double mid, double high, double epsilon);

protected:
    void compute(const AnalysisInput& input, FeatureRecord& record) override;
};

}  // namespace audioprint

#endif  // AUDIOPRINT_FREQUENCY_EXTRACTOR_HPP
