/**
 * @file feedback_builder.hpp
 * @brief Human / storage facing regrouping of a FeatureRecord
 */

#ifndef AUDIOPRINT_FEEDBACK_BUILDER_HPP
#define AUDIOPRINT_FEEDBACK_BUILDER_HPP

#include <map>
#include <string>
#include <vector>

#include "feature_record.hpp"

namespace audioprint {

// =============================================================================
// Feedback Category
// =============================================================================

enum class FeedbackCategory {
    EQ,             // spectral + frequency balance
    ENERGY,         // dynamics + beat strength
    RHYTHM,         // rhythm block
    ARRANGEMENT,    // reserved, produces no content yet
};

inline const char* feedbackCategoryToString(FeedbackCategory category) {
    switch (category) {
        case FeedbackCategory::EQ:          return "eq";
        case FeedbackCategory::ENERGY:      return "energy";
        case FeedbackCategory::RHYTHM:      return "rhythm";
        case FeedbackCategory::ARRANGEMENT: return "arrangement";
        default:                            return "unknown";
    }
}

inline bool feedbackCategoryFromString(const std::string& name, FeedbackCategory& out) {
    if (name == "eq")          { out = FeedbackCategory::EQ;          return true; }
    if (name == "energy")      { out = FeedbackCategory::ENERGY;      return true; }
    if (name == "rhythm")      { out = FeedbackCategory::RHYTHM;      return true; }
    if (name == "arrangement") { out = FeedbackCategory::ARRANGEMENT; return true; }
    return false;
}

// =============================================================================
// Feedback Object
// =============================================================================

struct FeedbackObject {
    TrackMetadata metadata;
    std::map<std::string, std::map<std::string, double>> categories;

    bool hasCategory(const std::string& name) const {
        return categories.find(name) != categories.end();
    }

    /// @brief Render as a JSON document ("metadata" first, then categories)
    std::string toJson() const;
};

/// @brief Build the feedback object for the requested categories
/// @note Metadata is always present; missing source fields read as 0
FeedbackObject buildFeedbackObject(const FeatureRecord& record,
                                   const std::vector<FeedbackCategory>& categories = {
                                       FeedbackCategory::EQ,
                                       FeedbackCategory::ENERGY,
                                       FeedbackCategory::RHYTHM});

/// @brief String form; unknown names are skipped with a warning
FeedbackObject buildFeedbackObject(const FeatureRecord& record,
                                   const std::vector<std::string>& category_names);

}  // namespace audioprint

#endif  // AUDIOPRINT_FEEDBACK_BUILDER_HPP
