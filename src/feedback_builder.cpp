#include "audioprint/feedback_builder.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace audioprint {

namespace {

template <typename Block>
double fieldOrZero(const std::optional<Block>& block, double Block::*member) {
    return block ? (*block).*member : 0.0;
}

std::map<std::string, double> eqSection(const FeatureRecord& r) {
    return {
        {"brightness", fieldOrZero(r.spectral, &SpectralFeatures::avg_brightness)},
        {"brightness_variance", fieldOrZero(r.spectral, &SpectralFeatures::brightness_variance)},
        {"rolloff", fieldOrZero(r.spectral, &SpectralFeatures::avg_rolloff)},
        {"bandwidth", fieldOrZero(r.spectral, &SpectralFeatures::avg_bandwidth)},
        {"low_end", fieldOrZero(r.frequency, &FrequencyFeatures::low_proportion)},
        {"mid_range", fieldOrZero(r.frequency, &FrequencyFeatures::mid_proportion)},
        {"high_end", fieldOrZero(r.frequency, &FrequencyFeatures::high_proportion)},
        {"mid_to_low_ratio", fieldOrZero(r.frequency, &FrequencyFeatures::mid_low_ratio)},
        {"high_to_mid_ratio", fieldOrZero(r.frequency, &FrequencyFeatures::high_mid_ratio)},
    };
}

std::map<std::string, double> energySection(const FeatureRecord& r) {
    return {
        {"dynamic_range", fieldOrZero(r.energy, &EnergyFeatures::energy_range)},
        {"loudness", fieldOrZero(r.energy, &EnergyFeatures::avg_energy)},
        {"energy_trend", fieldOrZero(r.energy, &EnergyFeatures::energy_trend)},
        {"peak_density", fieldOrZero(r.energy, &EnergyFeatures::peak_density)},
        {"beat_strength", fieldOrZero(r.rhythm, &RhythmFeatures::beat_strength)},
    };
}

std::map<std::string, double> rhythmSection(const FeatureRecord& r) {
    return {
        {"tempo_bpm", fieldOrZero(r.rhythm, &RhythmFeatures::tempo)},
        {"onset_density", fieldOrZero(r.rhythm, &RhythmFeatures::onset_density)},
        {"syncopation", fieldOrZero(r.rhythm, &RhythmFeatures::syncopation_level)},
        {"rhythmic_variance", fieldOrZero(r.rhythm, &RhythmFeatures::rhythmic_variance)},
        {"beat_strength", fieldOrZero(r.rhythm, &RhythmFeatures::beat_strength)},
    };
}

std::string escapeJson(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:   result += c;      break;
        }
    }
    return result;
}

// JSON has no NaN / Infinity literals
void writeNumber(std::ostringstream& json, double value) {
    if (std::isfinite(value)) {
        json << value;
    } else {
        json << "null";
    }
}

}  // namespace

std::string FeedbackObject::toJson() const {
    std::ostringstream json;
    json << std::setprecision(std::numeric_limits<double>::max_digits10);
    json << "{\n";
    json << "    \"metadata\": {\n";
    json << "        \"duration\": ";
    writeNumber(json, metadata.duration);
    json << ",\n";
    json << "        \"sample_rate\": " << metadata.sample_rate << "\n";
    json << "    }";

    for (const auto& category : categories) {
        json << ",\n";
        json << "    \"" << escapeJson(category.first) << "\": {";
        std::size_t i = 0;
        for (const auto& field : category.second) {
            json << (i == 0 ? "\n" : ",\n");
            json << "        \"" << escapeJson(field.first) << "\": ";
            writeNumber(json, field.second);
            ++i;
        }
        json << (category.second.empty() ? "}" : "\n    }");
    }

    json << "\n}";
    return json.str();
}

FeedbackObject buildFeedbackObject(const FeatureRecord& record,
                                   const std::vector<FeedbackCategory>& categories) {
    FeedbackObject object;
    object.metadata = record.metadata;

    for (FeedbackCategory category : categories) {
        switch (category) {
            case FeedbackCategory::EQ:
                object.categories["eq"] = eqSection(record);
                break;
            case FeedbackCategory::ENERGY:
                object.categories["energy"] = energySection(record);
                break;
            case FeedbackCategory::RHYTHM:
                object.categories["rhythm"] = rhythmSection(record);
                break;
            case FeedbackCategory::ARRANGEMENT:
                // TODO: arrangement needs section boundaries, which no extractor produces yet
                break;
        }
    }

    return object;
}

FeedbackObject buildFeedbackObject(const FeatureRecord& record,
                                   const std::vector<std::string>& category_names) {
    std::vector<FeedbackCategory> categories;
    categories.reserve(category_names.size());
    for (const auto& name : category_names) {
        FeedbackCategory category;
        if (!feedbackCategoryFromString(name, category)) {
            std::cerr << "[FeedbackBuilder] Skipping unknown category: " << name << std::endl;
            continue;
        }
        categories.push_back(category);
    }
    return buildFeedbackObject(record, categories);
}

}  // namespace audioprint
