#ifndef AUDIOPRINT_SPECTRAL_EXTRACTOR_HPP
#define AUDIOPRINT_SPECTRAL_EXTRACTOR_HPP

#include <string>
#include <vector>

#include "feature_extractor.hpp"

namespace audioprint {

/**
 * @class SpectralExtractor
 * @brief Centroid, rolloff and bandwidth statistics of the full waveform
 */
class SpectralExtractor : public BaseFeatureExtractor {
public:
    FeatureCategory getCategory() const override { return FeatureCategory::SPECTRAL; }
    std::string getName() const override { return "SpectralExtractor"; }
    SignalComponent getInputComponent() const override { return SignalComponent::FULL; }

    struct FrameShape {
        double centroid = 0.0;
        double rolloff = 0.0;
        double bandwidth = 0.0;
    };

    /// @brief Shape of one magnitude spectrum; an all-zero frame gives all 0
    static FrameShape frameShape(const std::vector<float>& magnitude,
                                 const std::vector<float>& frequencies,
                                 double rolloff_percent);

protected:
    void compute(const AnalysisInput& input, FeatureRecord& record) override;
};

}  // namespace audioprint

#endif  // AUDIOPRINT_SPECTRAL_EXTRACTOR_HPP
