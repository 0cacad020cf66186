#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "audioprint/feature_record.hpp"

using namespace audioprint;

class FeatureRecordTest : public ::testing::Test {
protected:
    void SetUp() override {
        full_.metadata.duration = 12.5;
        full_.metadata.sample_rate = 22050;

        RhythmFeatures rhythm;
        rhythm.tempo = 128.0;
        rhythm.onset_density = 3.0;
        full_.rhythm = rhythm;

        full_.harmony = HarmonyFeatures{0.02, 1.8, 0.001, 0.9};
        full_.energy = EnergyFeatures{0.4, 0.2, -0.0001, 6.0};
        full_.spectral = SpectralFeatures{2500.0, 1.0e5, 5000.0, 1800.0};
        full_.frequency = FrequencyFeatures{0.5, 0.3, 0.2, 0.6, 0.66};
    }

    FeatureRecord full_;
};

TEST_F(FeatureRecordTest, CategoriesInCanonicalOrder) {
    const auto categories = full_.categories();
    ASSERT_EQ(categories.size(), 5u);
    EXPECT_EQ(categories[0], FeatureCategory::RHYTHM);
    EXPECT_EQ(categories[1], FeatureCategory::HARMONY);
    EXPECT_EQ(categories[2], FeatureCategory::ENERGY);
    EXPECT_EQ(categories[3], FeatureCategory::SPECTRAL);
    EXPECT_EQ(categories[4], FeatureCategory::FREQUENCY);
}

TEST_F(FeatureRecordTest, FilterDropsSpectralByDefault) {
    const FeatureRecord filtered = filterFeatureSet(full_);

    EXPECT_FALSE(filtered.hasCategory(FeatureCategory::SPECTRAL));
    EXPECT_TRUE(filtered.hasCategory(FeatureCategory::RHYTHM));
    EXPECT_TRUE(filtered.hasCategory(FeatureCategory::FREQUENCY));
    EXPECT_DOUBLE_EQ(filtered.metadata.duration, 12.5);

    // The source record is untouched
    EXPECT_TRUE(full_.hasCategory(FeatureCategory::SPECTRAL));
}

TEST_F(FeatureRecordTest, FilterWithExplicitList) {
    const FeatureRecord filtered = filterFeatureSet(full_, {FeatureCategory::RHYTHM, FeatureCategory::ENERGY});
    EXPECT_FALSE(filtered.hasCategory(FeatureCategory::RHYTHM));
    EXPECT_FALSE(filtered.hasCategory(FeatureCategory::ENERGY));
    EXPECT_TRUE(filtered.hasCategory(FeatureCategory::SPECTRAL));

    const FeatureRecord unchanged = filterFeatureSet(full_, std::vector<FeatureCategory>{});
    EXPECT_EQ(unchanged.categories().size(), 5u);
}

TEST_F(FeatureRecordTest, ToMapHasMetadataAndBlocks) {
    const auto map = full_.toMap();
    ASSERT_EQ(map.count("metadata"), 1u);
    EXPECT_DOUBLE_EQ(map.at("metadata").at("duration"), 12.5);
    EXPECT_DOUBLE_EQ(map.at("metadata").at("sample_rate"), 22050.0);

    ASSERT_EQ(map.count("rhythm"), 1u);
    EXPECT_DOUBLE_EQ(map.at("rhythm").at("tempo"), 128.0);
    EXPECT_EQ(map.at("rhythm").size(), 5u);
    EXPECT_EQ(map.at("frequency").size(), 5u);
    EXPECT_EQ(map.at("spectral").size(), 4u);
}

TEST_F(FeatureRecordTest, MergeKeepsMissingBlocks) {
    FeatureRecord target;
    target.energy = EnergyFeatures{1.0, 1.0, 1.0, 1.0};

    FeatureRecord partial;
    partial.rhythm = full_.rhythm;

    target.mergeFrom(partial);
    EXPECT_TRUE(target.hasCategory(FeatureCategory::RHYTHM));
    EXPECT_TRUE(target.hasCategory(FeatureCategory::ENERGY));
    EXPECT_DOUBLE_EQ(target.energy->avg_energy, 1.0);
}

TEST_F(FeatureRecordTest, AllFiniteDetectsNaN) {
    EXPECT_TRUE(full_.allFinite());
    full_.energy->energy_trend = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(full_.allFinite());
}

TEST_F(FeatureRecordTest, BlockOfAbsentCategoryIsEmpty) {
    full_.removeCategory(FeatureCategory::HARMONY);
    EXPECT_TRUE(full_.block(FeatureCategory::HARMONY).empty());
    EXPECT_EQ(full_.toMap().count("harmony"), 0u);
}
