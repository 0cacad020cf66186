#ifndef AUDIOPRINT_FEATURE_RECORD_HPP
#define AUDIOPRINT_FEATURE_RECORD_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "audioprint_types.hpp"

namespace audioprint {

// =============================================================================
// Category Blocks
// =============================================================================

struct TrackMetadata {
    double duration = 0.0;      // seconds, after truncation
    int sample_rate = 0;        // Hz
};

struct RhythmFeatures {
    double tempo = 0.0;                 // BPM
    double onset_density = 0.0;         // onsets per second
    double syncopation_level = 0.0;     // mean off-beat deviation, in beats
    double rhythmic_variance = 0.0;     // variance of inter-onset intervals (s^2)
    double beat_strength = 0.0;         // mean onset envelope
};

struct HarmonyFeatures {
    double chroma_variance = 0.0;
    double key_strength = 0.0;
    double harmonic_change_rate = 0.0;
    double tonal_stability = 0.0;
};

struct EnergyFeatures {
    double energy_range = 0.0;
    double avg_energy = 0.0;
    double energy_trend = 0.0;          // slope per RMS frame
    double peak_density = 0.0;          // peaks per second
};

struct SpectralFeatures {
    double avg_brightness = 0.0;        // mean centroid (Hz)
    double brightness_variance = 0.0;
    double avg_rolloff = 0.0;
    double avg_bandwidth = 0.0;
};

struct FrequencyFeatures {
    double low_proportion = 0.0;
    double mid_proportion = 0.0;
    double high_proportion = 0.0;
    double mid_low_ratio = 0.0;
    double high_mid_ratio = 0.0;
};

// =============================================================================
// Feature Record
// =============================================================================
//
// Output of one extraction call. A category that was filtered out (or never
// computed) is an empty optional; consumers fall back to documented defaults.
//

using FeatureBlock = std::map<std::string, double>;

struct FeatureRecord {
    TrackMetadata metadata;

    std::optional<RhythmFeatures> rhythm;
    std::optional<HarmonyFeatures> harmony;
    std::optional<EnergyFeatures> energy;
    std::optional<SpectralFeatures> spectral;
    std::optional<FrequencyFeatures> frequency;

    bool hasCategory(FeatureCategory category) const;

    /// @brief Drop one category block
    void removeCategory(FeatureCategory category);

    /// @brief Copy every category block present in @p other into this record
    void mergeFrom(const FeatureRecord& other);

    /// @brief Categories currently present, in canonical order
    std::vector<FeatureCategory> categories() const;

    /// @brief Flat name -> value view of one category (empty if absent)
    FeatureBlock block(FeatureCategory category) const;

    /// @brief Nested view: "metadata" and every present category
    std::map<std::string, FeatureBlock> toMap() const;

    /// @brief True if every numeric field present is finite
    bool allFinite() const;
};

/// @brief Copy of @p record without the given categories (metadata is kept)
FeatureRecord filterFeatureSet(const FeatureRecord& record,
                               const std::vector<FeatureCategory>& exclude_categories = {FeatureCategory::SPECTRAL});

}  // namespace audioprint

#endif  // AUDIOPRINT_FEATURE_RECORD_HPP
