#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <vector>

#include "audioprint/audioprint_config.hpp"
#include "audioprint/dsp/onset.hpp"
#include "audioprint/extractors/energy_extractor.hpp"
#include "audioprint/extractors/feature_extractor.hpp"
#include "audioprint/extractors/frequency_extractor.hpp"
#include "audioprint/extractors/harmony_extractor.hpp"
#include "audioprint/extractors/rhythm_extractor.hpp"
#include "audioprint/extractors/spectral_extractor.hpp"
#include "test_helpers.hpp"

using namespace audioprint;
using audioprint::test::TestSignalGenerator;

class ExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = ExtractorConfig::defaults().quiet();
    }

    ErrorInfo run(IFeatureExtractor& extractor, const std::vector<float>& signal, FeatureRecord& record) {
        ErrorInfo err = extractor.initialize(config_);
        if (!err.isOk()) {
            return err;
        }
        AnalysisInput input{signal, kSampleRate, static_cast<double>(signal.size()) / kSampleRate};
        return extractor.extract(input, record);
    }

    static constexpr int kSampleRate = 22050;
    ExtractorConfig config_;
};

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(ExtractorTest, FactoryCreatesCanonicalOrder) {
    const auto extractors = FeatureExtractorFactory::createAll();
    const auto categories = allFeatureCategories();
    ASSERT_EQ(extractors.size(), categories.size());
    for (std::size_t i = 0; i < extractors.size(); ++i) {
        ASSERT_NE(extractors[i], nullptr);
        EXPECT_EQ(extractors[i]->getCategory(), categories[i]);
        EXPECT_FALSE(extractors[i]->isInitialized());
    }
    EXPECT_EQ(FeatureExtractorFactory::create(FeatureCategory::RHYTHM)->getInputComponent(),
              SignalComponent::PERCUSSIVE);
    EXPECT_EQ(FeatureExtractorFactory::create(FeatureCategory::HARMONY)->getInputComponent(),
              SignalComponent::HARMONIC);
    EXPECT_EQ(FeatureExtractorFactory::create(FeatureCategory::ENERGY)->getInputComponent(),
              SignalComponent::FULL);
}

TEST_F(ExtractorTest, ExtractBeforeInitialize) {
    EnergyExtractor extractor;
    const std::vector<float> signal(kSampleRate, 0.1f);
    FeatureRecord record;
    AnalysisInput input{signal, kSampleRate, 1.0};

    EXPECT_EQ(extractor.extract(input, record).code, ErrorCode::NOT_INITIALIZED);
    EXPECT_FALSE(record.hasCategory(FeatureCategory::ENERGY));
}

TEST_F(ExtractorTest, RejectsInvalidInput) {
    EnergyExtractor extractor;
    ASSERT_TRUE(extractor.initialize(config_).isOk());

    const std::vector<float> signal(kSampleRate, 0.1f);
    FeatureRecord record;
    EXPECT_EQ(extractor.extract(AnalysisInput{signal, 0, 1.0}, record).code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(extractor.extract(AnalysisInput{signal, kSampleRate, 0.0}, record).code,
              ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ExtractorTest, InitializeRejectsBadConfig) {
    config_.n_fft = -1;
    SpectralExtractor extractor;
    EXPECT_EQ(extractor.initialize(config_).code, ErrorCode::INVALID_CONFIG);
    EXPECT_FALSE(extractor.isInitialized());
}

// =============================================================================
// Rhythm
// =============================================================================

TEST_F(ExtractorTest, RhythmOfSilenceIsZero) {
    RhythmExtractor extractor;
    const std::vector<float> silence(kSampleRate * 3, 0.0f);
    FeatureRecord record;
    ASSERT_TRUE(run(extractor, silence, record).isOk());

    ASSERT_TRUE(record.rhythm.has_value());
    EXPECT_DOUBLE_EQ(record.rhythm->tempo, 0.0);
    EXPECT_DOUBLE_EQ(record.rhythm->onset_density, 0.0);
    EXPECT_DOUBLE_EQ(record.rhythm->syncopation_level, 0.0);
    EXPECT_DOUBLE_EQ(record.rhythm->rhythmic_variance, 0.0);
    EXPECT_DOUBLE_EQ(record.rhythm->beat_strength, 0.0);
}

TEST_F(ExtractorTest, RhythmOfClickTrack) {
    RhythmExtractor extractor;
    const auto clicks = TestSignalGenerator::clickTrack(120.0f, 8.0f, kSampleRate);
    FeatureRecord record;
    ASSERT_TRUE(run(extractor, clicks, record).isOk());

    ASSERT_TRUE(record.rhythm.has_value());
    EXPECT_NEAR(record.rhythm->tempo, 120.0, 6.0);
    EXPECT_NEAR(record.rhythm->onset_density, 2.0, 0.5);
    EXPECT_LT(record.rhythm->syncopation_level, 0.2);
    EXPECT_LT(record.rhythm->rhythmic_variance, 0.02);
    EXPECT_GT(record.rhythm->beat_strength, 0.0);
}

TEST_F(ExtractorTest, RhythmOfSingleClick) {
    // One click after a second of silence, the next would fall past the end
    std::vector<float> signal(kSampleRate, 0.0f);
    const auto click = TestSignalGenerator::clickTrack(20.0f, 2.0f, kSampleRate);
    signal.insert(signal.end(), click.begin(), click.end());

    dsp::OnsetDetector detector(config_, kSampleRate);
    ASSERT_LT(detector.detect(detector.onsetStrength(signal)).size(), 2u);

    RhythmExtractor extractor;
    FeatureRecord record;
    ASSERT_TRUE(run(extractor, signal, record).isOk());

    ASSERT_TRUE(record.rhythm.has_value());
    EXPECT_DOUBLE_EQ(record.rhythm->onset_density, 0.0);
    EXPECT_DOUBLE_EQ(record.rhythm->syncopation_level, 0.0);
    EXPECT_DOUBLE_EQ(record.rhythm->rhythmic_variance, 0.0);
    // Tempo and beat strength are still reported
    EXPECT_TRUE(std::isfinite(record.rhythm->tempo));
    EXPECT_GE(record.rhythm->tempo, 0.0);
    EXPECT_GT(record.rhythm->beat_strength, 0.0);
}

TEST_F(ExtractorTest, Syncopation) {
    // 0.5 s = 1 beat and 0.6 s = 1.2 beats at 120 BPM
    EXPECT_NEAR(RhythmExtractor::syncopation({0.5, 0.6}, 120.0), 0.1, 1e-9);
    EXPECT_NEAR(RhythmExtractor::syncopation({1.25}, 120.0), 0.5, 1e-9);
    EXPECT_DOUBLE_EQ(RhythmExtractor::syncopation({}, 120.0), 0.0);
    EXPECT_DOUBLE_EQ(RhythmExtractor::syncopation({0.3}, 0.0), 0.0);
}

TEST_F(ExtractorTest, PopulationVariance) {
    EXPECT_DOUBLE_EQ(RhythmExtractor::variance({1.0, 2.0, 3.0, 4.0}), 1.25);
    EXPECT_DOUBLE_EQ(RhythmExtractor::variance({}), 0.0);
}

// =============================================================================
// Harmony
// =============================================================================

TEST_F(ExtractorTest, HarmonySummaryOfEmptyChroma) {
    const HarmonyFeatures features = HarmonyExtractor::summarize({}, 1.0, 1e-8);
    EXPECT_DOUBLE_EQ(features.chroma_variance, 0.0);
    EXPECT_DOUBLE_EQ(features.key_strength, 0.0);
    EXPECT_DOUBLE_EQ(features.harmonic_change_rate, 0.0);
    EXPECT_DOUBLE_EQ(features.tonal_stability, 1.0);
}

TEST_F(ExtractorTest, HarmonySummaryOfConstantFrames) {
    dsp::ChromaFrame frame{};
    frame[0] = 1.0f;
    const std::vector<dsp::ChromaFrame> chroma(10, frame);

    const HarmonyFeatures features = HarmonyExtractor::summarize(chroma, 2.0, 1e-8);
    EXPECT_NEAR(features.chroma_variance, 0.0, 1e-12);
    EXPECT_NEAR(features.key_strength, 12.0, 1e-4);
    EXPECT_NEAR(features.harmonic_change_rate, 0.0, 1e-12);
    EXPECT_LT(features.tonal_stability, 1.0);
}

TEST_F(ExtractorTest, HarmonyOfSine) {
    HarmonyExtractor extractor;
    const auto tone = TestSignalGenerator::sine(440.0f, 0.5f, 2.0f, kSampleRate);
    FeatureRecord record;
    ASSERT_TRUE(run(extractor, tone, record).isOk());

    ASSERT_TRUE(record.harmony.has_value());
    EXPECT_GT(record.harmony->key_strength, 1.5);
    EXPECT_TRUE(std::isfinite(record.harmony->harmonic_change_rate));
    EXPECT_GE(record.harmony->chroma_variance, 0.0);
}

// =============================================================================
// Energy
// =============================================================================

TEST_F(ExtractorTest, LinearTrend) {
    EXPECT_DOUBLE_EQ(EnergyExtractor::linearTrend({1.0, 3.0, 5.0, 7.0}), 2.0);
    EXPECT_DOUBLE_EQ(EnergyExtractor::linearTrend({5.0}), 0.0);
    EXPECT_DOUBLE_EQ(EnergyExtractor::linearTrend({}), 0.0);
}

TEST_F(ExtractorTest, CountPeaksHandlesPlateaus) {
    const std::vector<double> values = {0.0, 1.0, 0.0, 2.0, 2.0, 0.0, 1.0, 1.0};
    // The trailing plateau never descends, so it is not a peak
    EXPECT_EQ(EnergyExtractor::countPeaks(values, 0.0), 2u);
    EXPECT_EQ(EnergyExtractor::countPeaks(values, 1.5), 1u);
    EXPECT_EQ(EnergyExtractor::countPeaks({1.0, 2.0}, 0.0), 0u);
}

TEST_F(ExtractorTest, RmsEnvelopeOfConstant) {
    const std::vector<float> dc(8192, 0.5f);
    const auto rms = EnergyExtractor::rmsEnvelope(dc, 2048, 512);
    ASSERT_EQ(rms.size(), 17u);
    EXPECT_NEAR(rms[8], 0.5, 1e-6);
    EXPECT_NEAR(rms[0], 0.5 * std::sqrt(0.5), 1e-3);    // half the frame is padding
}

TEST_F(ExtractorTest, RisingEnergyHasPositiveTrend) {
    EnergyExtractor extractor;
    const auto ramp = TestSignalGenerator::rampedSine(220.0f, 0.05f, 0.9f, 4.0f, kSampleRate);
    FeatureRecord record;
    ASSERT_TRUE(run(extractor, ramp, record).isOk());

    ASSERT_TRUE(record.energy.has_value());
    EXPECT_GT(record.energy->energy_trend, 0.0);
    EXPECT_GT(record.energy->energy_range, 0.3);
    EXPECT_GT(record.energy->avg_energy, 0.1);
    EXPECT_GE(record.energy->peak_density, 0.0);
}

// =============================================================================
// Spectral
// =============================================================================

TEST_F(ExtractorTest, FrameShapeOfSilence) {
    const std::vector<float> magnitude(5, 0.0f);
    const std::vector<float> freqs = {0.0f, 100.0f, 200.0f, 300.0f, 400.0f};
    const auto shape = SpectralExtractor::frameShape(magnitude, freqs, 0.85);
    EXPECT_DOUBLE_EQ(shape.centroid, 0.0);
    EXPECT_DOUBLE_EQ(shape.rolloff, 0.0);
    EXPECT_DOUBLE_EQ(shape.bandwidth, 0.0);
}

TEST_F(ExtractorTest, FrameShapeOfTwoBins) {
    const std::vector<float> magnitude = {0.0f, 1.0f, 0.0f, 1.0f, 0.0f};
    const std::vector<float> freqs = {0.0f, 100.0f, 200.0f, 300.0f, 400.0f};
    const auto shape = SpectralExtractor::frameShape(magnitude, freqs, 0.85);
    EXPECT_DOUBLE_EQ(shape.centroid, 200.0);
    EXPECT_DOUBLE_EQ(shape.rolloff, 300.0);
    EXPECT_DOUBLE_EQ(shape.bandwidth, 100.0);
}

TEST_F(ExtractorTest, SpectralCentroidOfSine) {
    SpectralExtractor extractor;
    const auto tone = TestSignalGenerator::sine(1000.0f, 0.5f, 2.0f, kSampleRate);
    FeatureRecord record;
    ASSERT_TRUE(run(extractor, tone, record).isOk());

    ASSERT_TRUE(record.spectral.has_value());
    EXPECT_NEAR(record.spectral->avg_brightness, 1000.0, 100.0);
    EXPECT_GT(record.spectral->avg_rolloff, 900.0);
    EXPECT_GE(record.spectral->brightness_variance, 0.0);
}

// =============================================================================
// Frequency balance
// =============================================================================

TEST_F(ExtractorTest, BandEnergiesBelowEpsilon) {
    const FrequencyFeatures features = FrequencyExtractor::fromBandEnergies(0.0, 0.0, 0.0, 1e-8);
    EXPECT_DOUBLE_EQ(features.low_proportion, 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(features.mid_proportion, 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(features.high_proportion, 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(features.mid_low_ratio, 0.0);
    EXPECT_DOUBLE_EQ(features.high_mid_ratio, 0.0);
}

TEST_F(ExtractorTest, BandEnergyRatios) {
    const FrequencyFeatures features = FrequencyExtractor::fromBandEnergies(2.0, 1.0, 1.0, 1e-8);
    EXPECT_DOUBLE_EQ(features.low_proportion, 0.5);
    EXPECT_DOUBLE_EQ(features.mid_proportion, 0.25);
    EXPECT_NEAR(features.mid_low_ratio, 0.5, 1e-8);
    EXPECT_NEAR(features.high_mid_ratio, 1.0, 1e-7);
}

TEST_F(ExtractorTest, LowSineDominatesLowBand) {
    FrequencyExtractor extractor;
    const auto tone = TestSignalGenerator::sine(100.0f, 0.5f, 2.0f, kSampleRate);
    FeatureRecord record;
    ASSERT_TRUE(run(extractor, tone, record).isOk());

    ASSERT_TRUE(record.frequency.has_value());
    const FrequencyFeatures& f = *record.frequency;
    EXPECT_GT(f.low_proportion, 0.8);
    EXPECT_NEAR(f.low_proportion + f.mid_proportion + f.high_proportion, 1.0, 1e-9);
    EXPECT_LT(f.mid_low_ratio, 0.2);
}
