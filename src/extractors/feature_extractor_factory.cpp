#include "audioprint/extractors/feature_extractor.hpp"

#include <memory>
#include <vector>

#include "audioprint/extractors/energy_extractor.hpp"
#include "audioprint/extractors/frequency_extractor.hpp"
#include "audioprint/extractors/harmony_extractor.hpp"
#include "audioprint/extractors/rhythm_extractor.hpp"
#include "audioprint/extractors/spectral_extractor.hpp"

namespace audioprint {

std::unique_ptr<IFeatureExtractor> FeatureExtractorFactory::create(FeatureCategory category) {
    switch (category) {
        case FeatureCategory::RHYTHM:
            return std::make_unique<RhythmExtractor>();
        case FeatureCategory::HARMONY:
            return std::make_unique<HarmonyExtractor>();
        case FeatureCategory::ENERGY:
            return std::make_unique<EnergyExtractor>();
        case FeatureCategory::SPECTRAL:
            return std::make_unique<SpectralExtractor>();
        case FeatureCategory::FREQUENCY:
            return std::make_unique<FrequencyExtractor>();
        default:
            return nullptr;
    }
}

std::vector<std::unique_ptr<IFeatureExtractor>> FeatureExtractorFactory::createAll() {
    std::vector<std::unique_ptr<IFeatureExtractor>> extractors;
    for (FeatureCategory category : allFeatureCategories()) {
        extractors.push_back(create(category));
    }
    return extractors;
}

}  // namespace audioprint
