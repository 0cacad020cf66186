#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "audioprint/audioprint.hpp"
#include "test_helpers.hpp"

using namespace audioprint;
using audioprint::test::TempDir;
using audioprint::test::TestSignalGenerator;

class FeatureEngineTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        dir_ = new TempDir("engine");

        // 10 s of tone + noise at the pipeline rate
        const auto signal = TestSignalGenerator::mix(
            TestSignalGenerator::sine(220.0f, 0.5f, 10.0f, kSampleRate),
            TestSignalGenerator::noise(0.2f, 10.0f, kSampleRate));
        mixed_path_ = dir_->file("mixed.wav");
        test::writeWav(mixed_path_, signal, kSampleRate);

        // 3 s stereo at 44.1 kHz: exercises downmix and resampling
        const auto left = TestSignalGenerator::sine(440.0f, 0.4f, 3.0f, 44100);
        std::vector<float> stereo(left.size() * 2);
        for (std::size_t i = 0; i < left.size(); ++i) {
            stereo[2 * i] = left[i];
            stereo[2 * i + 1] = -left[i] * 0.5f;
        }
        stereo_path_ = dir_->file("stereo_44k.wav");
        test::writeWav(stereo_path_, stereo, 44100, 2);

        garbage_path_ = dir_->file("garbage.wav");
        test::writeTextFile(garbage_path_, "this is not a RIFF file at all");

        empty_path_ = dir_->file("empty.wav");
        test::writeWav(empty_path_, {}, kSampleRate);

        // FLAC whose header promises 4 s but whose stream stops halfway
        truncated_path_ = dir_->file("truncated.flac");
        test::writeFlac(truncated_path_, TestSignalGenerator::noise(0.5f, 4.0f, kSampleRate), kSampleRate);
        test::truncateFile(truncated_path_, 0.5);
    }

    static void TearDownTestSuite() {
        delete dir_;
        dir_ = nullptr;
    }

    void SetUp() override {
        config_ = ExtractorConfig::defaults().quiet();
    }

    static constexpr int kSampleRate = 22050;
    static TempDir* dir_;
    static std::string mixed_path_;
    static std::string stereo_path_;
    static std::string garbage_path_;
    static std::string empty_path_;
    static std::string truncated_path_;

    ExtractorConfig config_;
};

TempDir* FeatureEngineTest::dir_ = nullptr;
std::string FeatureEngineTest::mixed_path_;
std::string FeatureEngineTest::stereo_path_;
std::string FeatureEngineTest::garbage_path_;
std::string FeatureEngineTest::empty_path_;
std::string FeatureEngineTest::truncated_path_;

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(FeatureEngineTest, InitializeTwice) {
    FeatureEngine engine;
    EXPECT_FALSE(engine.isInitialized());
    ASSERT_TRUE(engine.initialize(config_).isOk());
    EXPECT_TRUE(engine.isInitialized());
    EXPECT_EQ(engine.initialize(config_).code, ErrorCode::ALREADY_INITIALIZED);

    engine.shutdown();
    EXPECT_FALSE(engine.isInitialized());
    EXPECT_TRUE(engine.initialize(config_).isOk());
}

TEST_F(FeatureEngineTest, InitializeRejectsBadConfig) {
    FeatureEngine engine;
    config_.hpss_kernel_size = 4;
    EXPECT_EQ(engine.initialize(config_).code, ErrorCode::INVALID_CONFIG);
    EXPECT_FALSE(engine.isInitialized());
    EXPECT_EQ(engine.getLastError().code, ErrorCode::INVALID_CONFIG);
}

TEST_F(FeatureEngineTest, ExtractBeforeInitialize) {
    FeatureEngine engine;
    FeatureRecord record;
    EXPECT_EQ(engine.extractGlobalFeatures(mixed_path_, 30.0, record).code, ErrorCode::NOT_INITIALIZED);

    AudioHandle handle;
    EXPECT_EQ(engine.extractGlobalFeatures(handle, 30.0, record).code, ErrorCode::NOT_INITIALIZED);
}

// =============================================================================
// Extraction
// =============================================================================

TEST_F(FeatureEngineTest, AnalyzeTrack) {
    FeatureEngine engine;
    ASSERT_TRUE(engine.initialize(config_).isOk());

    TrackAnalysis analysis;
    const ErrorInfo err = engine.analyzeTrack(mixed_path_, 30.0, analysis);
    ASSERT_TRUE(err.isOk()) << err.toString();

    EXPECT_EQ(analysis.file_path, mixed_path_);
    EXPECT_NEAR(analysis.duration, 10.0, 0.01);
    EXPECT_EQ(analysis.sample_rate, kSampleRate);
    EXPECT_GE(analysis.processing_time_ms, 0);

    const FeatureRecord& features = analysis.features;
    EXPECT_EQ(features.categories().size(), 5u);
    EXPECT_TRUE(features.allFinite());

    ASSERT_TRUE(features.frequency.has_value());
    const double total = features.frequency->low_proportion +
                         features.frequency->mid_proportion +
                         features.frequency->high_proportion;
    EXPECT_GE(total, 0.95);
    EXPECT_LE(total, 1.05);

    for (std::size_t i = 0; i < kEmbeddingDimensions; ++i) {
        EXPECT_TRUE(std::isfinite(analysis.embedding[i])) << embeddingFieldName(i);
    }
    const EmbeddingVector expected = createEmbeddingVector(features);
    for (std::size_t i = 0; i < kEmbeddingDimensions; ++i) {
        EXPECT_FLOAT_EQ(analysis.embedding[i], expected[i]) << embeddingFieldName(i);
    }
}

TEST_F(FeatureEngineTest, TruncatesToMaxDuration) {
    FeatureEngine engine;
    ASSERT_TRUE(engine.initialize(config_).isOk());

    FeatureRecord record;
    ASSERT_TRUE(engine.extractGlobalFeatures(mixed_path_, 4.0, record).isOk());
    EXPECT_DOUBLE_EQ(record.metadata.duration, 4.0);
    EXPECT_EQ(record.metadata.sample_rate, kSampleRate);

    FeatureRecord unbounded;
    ASSERT_TRUE(engine.extractGlobalFeatures(mixed_path_, std::numeric_limits<double>::infinity(),
                                             unbounded).isOk());
    EXPECT_NEAR(unbounded.metadata.duration, 10.0, 0.01);
}

TEST_F(FeatureEngineTest, ResamplesAndDownmixes) {
    FeatureEngine engine;
    ASSERT_TRUE(engine.initialize(config_).isOk());

    AudioHandle handle;
    ASSERT_TRUE(engine.loadAudio(stereo_path_, handle).isOk());
    EXPECT_EQ(handle.sample_rate, kSampleRate);
    EXPECT_NEAR(handle.duration(), 3.0, 0.01);

    FeatureRecord record;
    ASSERT_TRUE(engine.extractGlobalFeatures(handle, 30.0, record).isOk());
    EXPECT_NEAR(record.metadata.duration, 3.0, 0.01);
    EXPECT_TRUE(record.allFinite());
}

TEST_F(FeatureEngineTest, Deterministic) {
    FeatureEngine engine;
    ASSERT_TRUE(engine.initialize(config_).isOk());

    FeatureRecord first;
    FeatureRecord second;
    ASSERT_TRUE(engine.extractGlobalFeatures(mixed_path_, 5.0, first).isOk());
    ASSERT_TRUE(engine.extractGlobalFeatures(mixed_path_, 5.0, second).isOk());

    const EmbeddingVector a = createEmbeddingVector(first);
    const EmbeddingVector b = createEmbeddingVector(second);
    for (std::size_t i = 0; i < kEmbeddingDimensions; ++i) {
        EXPECT_EQ(a[i], b[i]) << embeddingFieldName(i);
    }
}

TEST_F(FeatureEngineTest, ParallelMatchesSequential) {
    FeatureEngine sequential;
    FeatureEngine parallel;
    ASSERT_TRUE(sequential.initialize(config_).isOk());
    ASSERT_TRUE(parallel.initialize(config_.withParallelExtraction()).isOk());

    FeatureRecord a;
    FeatureRecord b;
    ASSERT_TRUE(sequential.extractGlobalFeatures(mixed_path_, 5.0, a).isOk());
    ASSERT_TRUE(parallel.extractGlobalFeatures(mixed_path_, 5.0, b).isOk());

    const auto map_a = a.toMap();
    const auto map_b = b.toMap();
    ASSERT_EQ(map_a.size(), map_b.size());
    for (const auto& category : map_a) {
        for (const auto& field : category.second) {
            EXPECT_DOUBLE_EQ(field.second, map_b.at(category.first).at(field.first))
                << category.first << "." << field.first;
        }
    }
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(FeatureEngineTest, MissingFile) {
    FeatureEngine engine;
    ASSERT_TRUE(engine.initialize(config_).isOk());

    FeatureRecord record;
    record.metadata.duration = 99.0;
    const ErrorInfo err = engine.extractGlobalFeatures(dir_->file("nope.wav"), 30.0, record);
    EXPECT_EQ(err.code, ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(engine.getLastError().code, ErrorCode::FILE_NOT_FOUND);

    // All-or-nothing: the output is untouched
    EXPECT_DOUBLE_EQ(record.metadata.duration, 99.0);
    EXPECT_TRUE(record.categories().empty());
}

TEST_F(FeatureEngineTest, UndecodableFile) {
    FeatureEngine engine;
    ASSERT_TRUE(engine.initialize(config_).isOk());

    FeatureRecord record;
    const ErrorInfo err = engine.extractGlobalFeatures(garbage_path_, 30.0, record);
    EXPECT_EQ(err.code, ErrorCode::DECODE_FAILED);
    EXPECT_FALSE(err.detail.empty());
}

TEST_F(FeatureEngineTest, TruncatedStream) {
    FeatureEngine engine;
    ASSERT_TRUE(engine.initialize(config_).isOk());

    FeatureRecord record;
    record.metadata.duration = 99.0;
    const ErrorInfo err = engine.extractGlobalFeatures(truncated_path_, 30.0, record);
    EXPECT_EQ(err.code, ErrorCode::DECODE_FAILED);
    EXPECT_FALSE(err.detail.empty());

    // The decoded prefix is not passed on as a shorter track
    EXPECT_DOUBLE_EQ(record.metadata.duration, 99.0);
    EXPECT_TRUE(record.categories().empty());
}

TEST_F(FeatureEngineTest, EmptyFile) {
    FeatureEngine engine;
    ASSERT_TRUE(engine.initialize(config_).isOk());

    FeatureRecord record;
    EXPECT_EQ(engine.extractGlobalFeatures(empty_path_, 30.0, record).code, ErrorCode::EMPTY_AUDIO);
}

TEST_F(FeatureEngineTest, InvalidMaxDuration) {
    FeatureEngine engine;
    ASSERT_TRUE(engine.initialize(config_).isOk());

    FeatureRecord record;
    EXPECT_EQ(engine.extractGlobalFeatures(mixed_path_, 0.0, record).code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(engine.extractGlobalFeatures(mixed_path_, -5.0, record).code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(engine.extractGlobalFeatures(mixed_path_, std::numeric_limits<double>::quiet_NaN(), record).code,
              ErrorCode::INVALID_ARGUMENT);

    // Shorter than one sample
    EXPECT_EQ(engine.extractGlobalFeatures(mixed_path_, 1e-6, record).code, ErrorCode::EMPTY_AUDIO);
    EXPECT_TRUE(record.categories().empty());
}

// =============================================================================
// Callbacks
// =============================================================================

TEST_F(FeatureEngineTest, CallbackOnSuccess) {
    FeatureEngine engine;
    ASSERT_TRUE(engine.initialize(config_).isOk());

    SimpleCallback callback;
    engine.setCallback(&callback);

    FeatureRecord record;
    ASSERT_TRUE(engine.extractGlobalFeatures(mixed_path_, 3.0, record).isOk());

    EXPECT_TRUE(callback.hasResult());
    EXPECT_FALSE(callback.hasError());
    EXPECT_EQ(callback.getCloseCount(), 1);
    EXPECT_EQ(callback.getStages(), allFeatureCategories());
    EXPECT_DOUBLE_EQ(callback.getResult().metadata.duration, record.metadata.duration);
}

TEST_F(FeatureEngineTest, CallbackOnError) {
    FeatureEngine engine;
    ASSERT_TRUE(engine.initialize(config_).isOk());

    SimpleCallback callback;
    engine.setCallback(&callback);

    TrackAnalysis analysis;
    EXPECT_FALSE(engine.analyzeTrack(garbage_path_, 30.0, analysis).isOk());

    EXPECT_FALSE(callback.hasResult());
    EXPECT_TRUE(callback.hasError());
    EXPECT_EQ(callback.getError().code, ErrorCode::DECODE_FAILED);
    EXPECT_EQ(callback.getCloseCount(), 1);
    EXPECT_TRUE(callback.getStages().empty());
}

TEST_F(FeatureEngineTest, SharedCallbackOutlivesCaller) {
    FeatureEngine first;
    FeatureEngine second;
    ASSERT_TRUE(first.initialize(config_).isOk());
    ASSERT_TRUE(second.initialize(config_).isOk());

    auto first_callback = std::make_shared<SimpleCallback>();
    auto second_callback = std::make_shared<SimpleCallback>();
    std::weak_ptr<SimpleCallback> first_watch = first_callback;

    first.setSharedCallback(first_callback);
    second.setSharedCallback(second_callback);
    first_callback.reset();

    // Installing a callback on one engine does not release another engine's
    ASSERT_FALSE(first_watch.expired());

    FeatureRecord record;
    ASSERT_TRUE(first.extractGlobalFeatures(mixed_path_, 2.0, record).isOk());
    auto still_installed = first_watch.lock();
    ASSERT_NE(still_installed, nullptr);
    EXPECT_TRUE(still_installed->hasResult());
    EXPECT_EQ(still_installed->getCloseCount(), 1);
    EXPECT_FALSE(second_callback->hasResult());
    still_installed.reset();

    // Replacing the callback drops the engine's share
    first.setCallback(static_cast<IExtractionCallback*>(nullptr));
    EXPECT_TRUE(first_watch.expired());
}

TEST_F(FeatureEngineTest, LambdaCallbackOrder) {
    FeatureEngine engine;
    ASSERT_TRUE(engine.initialize(config_).isOk());

    std::vector<std::string> events;
    engine.setCallback(LambdaCallback::create()
        .onStart([&events](const std::string&) { events.push_back("start"); })
        .onStageComplete([&events](FeatureCategory c) { events.push_back(categoryToString(c)); })
        .onResult([&events](const FeatureRecord&) { events.push_back("result"); })
        .onComplete([&events]() { events.push_back("complete"); })
        .onClose([&events]() { events.push_back("close"); })
        .build());

    FeatureRecord record;
    ASSERT_TRUE(engine.extractGlobalFeatures(mixed_path_, 3.0, record).isOk());

    const std::vector<std::string> expected = {
        "start", "rhythm", "harmony", "energy", "spectral", "frequency",
        "result", "complete", "close"};
    EXPECT_EQ(events, expected);
}
