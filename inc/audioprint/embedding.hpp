/**
 * @file embedding.hpp
 * @brief Fixed 19-dimensional embedding of a FeatureRecord
 *
 * The field order, divisors and defaults form the on-disk layout of every
 * stored vector and must never be reordered.
 */

#ifndef AUDIOPRINT_EMBEDDING_HPP
#define AUDIOPRINT_EMBEDDING_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string>

#include "feature_record.hpp"

namespace audioprint {

constexpr std::size_t kEmbeddingDimensions = 19;

using EmbeddingVector = std::array<float, kEmbeddingDimensions>;

/**
 * @brief One slot of the embedding layout
 *
 * value = (read(record) if present, else default_value) / divisor,
 * with the absolute value taken first when @c absolute is set.
 */
struct EmbeddingField {
    FeatureCategory category;
    const char* field;
    double divisor;
    double default_value;
    bool absolute;
    std::optional<double> (*read)(const FeatureRecord& record);
};

/// @brief The ordered slot table (index i of the table is index i of the vector)
const std::array<EmbeddingField, kEmbeddingDimensions>& embeddingLayout();

/// @brief Map a feature record to its embedding; absent categories use defaults
EmbeddingVector createEmbeddingVector(const FeatureRecord& record);

/// @brief "category.field" name of slot @p index, or "" if out of range
std::string embeddingFieldName(std::size_t index);

}  // namespace audioprint

#endif  // AUDIOPRINT_EMBEDDING_HPP
