#ifndef AUDIOPRINT_ENERGY_EXTRACTOR_HPP
#define AUDIOPRINT_ENERGY_EXTRACTOR_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "feature_extractor.hpp"

namespace audioprint {

/**
 * @class EnergyExtractor
 * @brief Loudness dynamics from the RMS envelope of the full waveform
 */
class EnergyExtractor : public BaseFeatureExtractor {
public:
    FeatureCategory getCategory() const override { return FeatureCategory::ENERGY; }
    std::string getName() const override { return "EnergyExtractor"; }
    SignalComponent getInputComponent() const override { return SignalComponent::FULL; }

    /// @brief Centred, zero padded frame RMS (1 + len / hop frames)
    static std::vector<double> rmsEnvelope(const std::vector<float>& signal,
                                           int frame_length, int hop_length);

    /// @brief Least-squares slope of @p values over their index (0 for < 2 points)
    static double linearTrend(const std::vector<double>& values);

    /// @brief Local maxima (plateaus once, edges excluded) at or above @p min_height
    static std::size_t countPeaks(const std::vector<double>& values, double min_height);

protected:
    void compute(const AnalysisInput& input, FeatureRecord& record) override;
};

}  // namespace audioprint

#endif  // AUDIOPRINT_ENERGY_EXTRACTOR_HPP
