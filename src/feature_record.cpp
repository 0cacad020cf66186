#include "audioprint/feature_record.hpp"

#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace audioprint {

bool FeatureRecord::hasCategory(FeatureCategory category) const {
    switch (category) {
        case FeatureCategory::RHYTHM:    return rhythm.has_value();
        case FeatureCategory::HARMONY:   return harmony.has_value();
        case FeatureCategory::ENERGY:    return energy.has_value();
        case FeatureCategory::SPECTRAL:  return spectral.has_value();
        case FeatureCategory::FREQUENCY: return frequency.has_value();
    }
    return false;
}

void FeatureRecord::removeCategory(FeatureCategory category) {
    switch (category) {
        case FeatureCategory::RHYTHM:    rhythm.reset();    break;
        case FeatureCategory::HARMONY:   harmony.reset();   break;
        case FeatureCategory::ENERGY:    energy.reset();    break;
        case FeatureCategory::SPECTRAL:  spectral.reset();  break;
        case FeatureCategory::FREQUENCY: frequency.reset(); break;
    }
}

void FeatureRecord::mergeFrom(const FeatureRecord& other) {
    if (other.rhythm)    rhythm = other.rhythm;
    if (other.harmony)   harmony = other.harmony;
    if (other.energy)    energy = other.energy;
    if (other.spectral)  spectral = other.spectral;
    if (other.frequency) frequency = other.frequency;
}

std::vector<FeatureCategory> FeatureRecord::categories() const {
    std::vector<FeatureCategory> present;
    for (FeatureCategory category : allFeatureCategories()) {
        if (hasCategory(category)) {
            present.push_back(category);
        }
    }
    return present;
}

FeatureBlock FeatureRecord::block(FeatureCategory category) const {
    FeatureBlock out;
    switch (category) {
        case FeatureCategory::RHYTHM:
            if (rhythm) {
                out["tempo"] = rhythm->tempo;
                out["onset_density"] = rhythm->onset_density;
                out["syncopation_level"] = rhythm->syncopation_level;
                out["rhythmic_variance"] = rhythm->rhythmic_variance;
                out["beat_strength"] = rhythm->beat_strength;
            }
            break;
        case FeatureCategory::HARMONY:
            if (harmony) {
                out["chroma_variance"] = harmony->chroma_variance;
                out["key_strength"] = harmony->key_strength;
                out["harmonic_change_rate"] = harmony->harmonic_change_rate;
                out["tonal_stability"] = harmony->tonal_stability;
            }
            break;
        case FeatureCategory::ENERGY:
            if (energy) {
                out["energy_range"] = energy->energy_range;
                out["avg_energy"] = energy->avg_energy;
                out["energy_trend"] = energy->energy_trend;
                out["peak_density"] = energy->peak_density;
            }
            break;
        case FeatureCategory::SPECTRAL:
            if (spectral) {
                out["avg_brightness"] = spectral->avg_brightness;
                out["brightness_variance"] = spectral->brightness_variance;
                out["avg_rolloff"] = spectral->avg_rolloff;
                out["avg_bandwidth"] = spectral->avg_bandwidth;
            }
            break;
        case FeatureCategory::FREQUENCY:
            if (frequency) {
                out["low_proportion"] = frequency->low_proportion;
                out["mid_proportion"] = frequency->mid_proportion;
                out["high_proportion"] = frequency->high_proportion;
                out["mid_low_ratio"] = frequency->mid_low_ratio;
                out["high_mid_ratio"] = frequency->high_mid_ratio;
            }
            break;
    }
    return out;
}

std::map<std::string, FeatureBlock> FeatureRecord::toMap() const {
    std::map<std::string, FeatureBlock> out;
    out["metadata"] = {
        {"duration", metadata.duration},
        {"sample_rate", static_cast<double>(metadata.sample_rate)},
    };
    for (FeatureCategory category : categories()) {
        out[categoryToString(category)] = block(category);
    }
    return out;
}

bool FeatureRecord::allFinite() const {
    if (!std::isfinite(metadata.duration)) {
        return false;
    }
    for (FeatureCategory category : categories()) {
        for (const auto& field : block(category)) {
            if (!std::isfinite(field.second)) {
                return false;
            }
        }
    }
    return true;
}

FeatureRecord filterFeatureSet(const FeatureRecord& record,
                               const std::vector<FeatureCategory>& exclude_categories) {
    FeatureRecord filtered = record;
    for (FeatureCategory category : exclude_categories) {
        filtered.removeCategory(category);
    }
    return filtered;
}

}  // namespace audioprint
