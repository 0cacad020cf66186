#include "audioprint/embedding.hpp"

#include <cmath>
#include <optional>
#include <string>

namespace audioprint {

namespace {

template <typename Block, std::optional<Block> FeatureRecord::*Category, double Block::*Member>
std::optional<double> readField(const FeatureRecord& record) {
    const std::optional<Block>& block = record.*Category;
    if (!block) {
        return std::nullopt;
    }
    return (*block).*Member;
}

const std::array<EmbeddingField, kEmbeddingDimensions> kLayout = {{
    {FeatureCategory::RHYTHM, "tempo", 200.0, 120.0, false,
        &readField<RhythmFeatures, &FeatureRecord::rhythm, &RhythmFeatures::tempo>},
    {FeatureCategory::RHYTHM, "onset_density", 15.0, 0.0, false,
        &readField<RhythmFeatures, &FeatureRecord::rhythm, &RhythmFeatures::onset_density>},
    {FeatureCategory::RHYTHM, "syncopation_level", 1.0, 0.0, false,
        &readField<RhythmFeatures, &FeatureRecord::rhythm, &RhythmFeatures::syncopation_level>},
    {FeatureCategory::RHYTHM, "rhythmic_variance", 0.1, 0.0, false,
        &readField<RhythmFeatures, &FeatureRecord::rhythm, &RhythmFeatures::rhythmic_variance>},

    {FeatureCategory::HARMONY, "chroma_variance", 0.1, 0.0, false,
        &readField<HarmonyFeatures, &FeatureRecord::harmony, &HarmonyFeatures::chroma_variance>},
    {FeatureCategory::HARMONY, "key_strength", 3.0, 1.0, false,
        &readField<HarmonyFeatures, &FeatureRecord::harmony, &HarmonyFeatures::key_strength>},
    {FeatureCategory::HARMONY, "harmonic_change_rate", 0.005, 0.0, false,
        &readField<HarmonyFeatures, &FeatureRecord::harmony, &HarmonyFeatures::harmonic_change_rate>},
    {FeatureCategory::HARMONY, "tonal_stability", 1.0, 0.5, false,
        &readField<HarmonyFeatures, &FeatureRecord::harmony, &HarmonyFeatures::tonal_stability>},

    {FeatureCategory::ENERGY, "energy_range", 1.0, 0.0, false,
        &readField<EnergyFeatures, &FeatureRecord::energy, &EnergyFeatures::energy_range>},
    {FeatureCategory::ENERGY, "avg_energy", 1.0, 0.0, false,
        &readField<EnergyFeatures, &FeatureRecord::energy, &EnergyFeatures::avg_energy>},
    {FeatureCategory::ENERGY, "energy_trend", 0.001, 0.0, true,
        &readField<EnergyFeatures, &FeatureRecord::energy, &EnergyFeatures::energy_trend>},
    {FeatureCategory::ENERGY, "peak_density", 25.0, 0.0, false,
        &readField<EnergyFeatures, &FeatureRecord::energy, &EnergyFeatures::peak_density>},

    {FeatureCategory::SPECTRAL, "avg_brightness", 8000.0, 1000.0, false,
        &readField<SpectralFeatures, &FeatureRecord::spectral, &SpectralFeatures::avg_brightness>},
    {FeatureCategory::SPECTRAL, "brightness_variance", 2000000.0, 0.0, false,
        &readField<SpectralFeatures, &FeatureRecord::spectral, &SpectralFeatures::brightness_variance>},

    {FeatureCategory::FREQUENCY, "low_proportion", 1.0, 0.33, false,
        &readField<FrequencyFeatures, &FeatureRecord::frequency, &FrequencyFeatures::low_proportion>},
    {FeatureCategory::FREQUENCY, "mid_proportion", 1.0, 0.33, false,
        &readField<FrequencyFeatures, &FeatureRecord::frequency, &FrequencyFeatures::mid_proportion>},
    {FeatureCategory::FREQUENCY, "high_proportion", 1.0, 0.33, false,
        &readField<FrequencyFeatures, &FeatureRecord::frequency, &FrequencyFeatures::high_proportion>},
    {FeatureCategory::FREQUENCY, "mid_low_ratio", 1.0, 1.0, false,
        &readField<FrequencyFeatures, &FeatureRecord::frequency, &FrequencyFeatures::mid_low_ratio>},
    {FeatureCategory::FREQUENCY, "high_mid_ratio", 1.0, 1.0, false,
        &readField<FrequencyFeatures, &FeatureRecord::frequency, &FrequencyFeatures::high_mid_ratio>},
}};

}  // namespace

const std::array<EmbeddingField, kEmbeddingDimensions>& embeddingLayout() {
    return kLayout;
}

EmbeddingVector createEmbeddingVector(const FeatureRecord& record) {
    EmbeddingVector vector{};
    for (std::size_t i = 0; i < kLayout.size(); ++i) {
        const EmbeddingField& slot = kLayout[i];
        double value = slot.read(record).value_or(slot.default_value);
        if (slot.absolute) {
            value = std::abs(value);
        }
        vector[i] = static_cast<float>(value / slot.divisor);
    }
    return vector;
}

std::string embeddingFieldName(std::size_t index) {
    if (index >= kLayout.size()) {
        return "";
    }
    return std::string(categoryToString(kLayout[index].category)) + "." + kLayout[index].field;
}

}  // namespace audioprint
