#ifndef AUDIOPRINT_ENGINE_HPP
#define AUDIOPRINT_ENGINE_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "audioprint_callback.hpp"
#include "audioprint_config.hpp"
#include "audioprint_types.hpp"
#include "dsp/audio_loader.hpp"
#include "dsp/preparation.hpp"
#include "embedding.hpp"
#include "extractors/feature_extractor.hpp"
#include "feature_record.hpp"

namespace audioprint {

// =============================================================================
// Track Analysis
// =============================================================================
//
// Everything the storage layer keeps for one track.
//

struct TrackAnalysis {
    std::string file_path;
    FeatureRecord features;
    EmbeddingVector embedding{};
    double duration = 0.0;
    int sample_rate = 0;
    int64_t processing_time_ms = 0;
};

// =============================================================================
// Feature Engine (main entry point)
// =============================================================================
//
// Wires loader, preparation and the five extractors together.
//
//   audioprint::FeatureEngine engine;
//   engine.initialize(audioprint::ExtractorConfig::defaults());
//
//   audioprint::FeatureRecord record;
//   auto err = engine.extractGlobalFeatures("song.wav", 150.0, record);
//   if (err.isOk()) {
//       auto vec = audioprint::createEmbeddingVector(record);
//   }
//
// Every extraction call is synchronous and all-or-nothing: on error the
// caller's output is left as it was. The engine itself keeps no per-track
// state, so one initialised engine may serve several threads.
//

class FeatureEngine {
public:
    FeatureEngine();
    ~FeatureEngine();

    // Non-copyable
    FeatureEngine(const FeatureEngine&) = delete;
    FeatureEngine& operator=(const FeatureEngine&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Validate @p config and create the extractors
    ErrorInfo initialize(const ExtractorConfig& config);

    void shutdown();

    bool isInitialized() const;

    const ExtractorConfig& getConfig() const { return config_; }

    // -------------------------------------------------------------------------
    // Callback
    // -------------------------------------------------------------------------

    /// @brief Set callback (engine owns it)
    void setCallback(std::unique_ptr<IExtractionCallback> callback);

    /// @brief Set callback (caller owns it)
    void setCallback(IExtractionCallback* callback);

    /// @brief Set callback (ownership shared with the caller, kept until replaced)
    void setSharedCallback(std::shared_ptr<IExtractionCallback> callback);

    // -------------------------------------------------------------------------
    // Pipeline steps
    // -------------------------------------------------------------------------

    /// @brief Decode @p file_path at the configured sample rate
    ErrorInfo loadAudio(const std::string& file_path, AudioHandle& handle);

    /// @brief Truncate and separate; @p max_duration has no default on purpose
    ErrorInfo prepareAudio(const AudioHandle& handle, double max_duration, PreparedAudio& prepared);

    // -------------------------------------------------------------------------
    // Extraction
    // -------------------------------------------------------------------------

    /// @brief Load, prepare and run every extractor
    ErrorInfo extractGlobalFeatures(const std::string& file_path, double max_duration,
                                    FeatureRecord& record);

    /// @brief Same for an already loaded track
    ErrorInfo extractGlobalFeatures(const AudioHandle& handle, double max_duration,
                                    FeatureRecord& record);

    /// @brief Features, embedding and timing of one file
    ErrorInfo analyzeTrack(const std::string& file_path, double max_duration,
                           TrackAnalysis& analysis);

    // -------------------------------------------------------------------------
    // Status
    // -------------------------------------------------------------------------

    ErrorInfo getLastError() const;

    static std::string getVersion();

private:
    ExtractorConfig config_;
    std::vector<std::unique_ptr<IFeatureExtractor>> extractors_;

    std::unique_ptr<IExtractionCallback> owned_callback_;
    std::shared_ptr<IExtractionCallback> shared_callback_;
    IExtractionCallback* callback_ = nullptr;

    std::atomic<bool> initialized_{false};
    mutable std::mutex mutex_;

    mutable std::mutex error_mutex_;
    ErrorInfo last_error_;

    ErrorInfo extractInternal(const AudioHandle& handle, double max_duration, FeatureRecord& record);
    ErrorInfo runExtractors(const PreparedAudio& prepared, FeatureRecord& record);

    void setLastError(const ErrorInfo& error);
    void logInfo(const std::string& message) const;

    // Callback notifications
    void notifyStart(const std::string& file_path);
    void notifyStageComplete(FeatureCategory category);
    void notifyResult(const FeatureRecord& record);
    void notifyError(const ErrorInfo& error);
    void notifyComplete();
    void notifyClose();
};

}  // namespace audioprint

#endif  // AUDIOPRINT_ENGINE_HPP
