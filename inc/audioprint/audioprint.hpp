#ifndef AUDIOPRINT_HPP
#define AUDIOPRINT_HPP

// =============================================================================
// AudioPrint - main include
// =============================================================================
//
//   #include <audioprint/audioprint.hpp>
//
// Quick start:
//
//   // 1. Create the engine
//   audioprint::FeatureEngine engine;
//
//   // 2. Initialise (22.05 kHz, 2048/128 framing)
//   auto err = engine.initialize(audioprint::ExtractorConfig::defaults());
//   if (!err.isOk()) {
//       std::cerr << "Init failed: " << err.message << std::endl;
//       return -1;
//   }
//
//   // 3. Analyse at most 150 s of a track
//   audioprint::TrackAnalysis analysis;
//   err = engine.analyzeTrack("song.wav", 150.0, analysis);
//
//   // 4. Store analysis.embedding, and the feedback object for prompting
//   auto feedback = audioprint::buildFeedbackObject(analysis.features);
//   std::cout << feedback.toJson() << std::endl;
//

#include <string>

// Core types
#include "audioprint_types.hpp"

// Configuration
#include "audioprint_config.hpp"

// Feature record, embedding and feedback object
#include "feature_record.hpp"
#include "embedding.hpp"
#include "feedback_builder.hpp"

// Callback interface
#include "audioprint_callback.hpp"

// Main engine
#include "audioprint_engine.hpp"

namespace audioprint {

// =============================================================================
// Version
// =============================================================================

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string getVersionString() {
    return std::to_string(VERSION_MAJOR) + "." +
        std::to_string(VERSION_MINOR) + "." +
        std::to_string(VERSION_PATCH);
}

}  // namespace audioprint

#endif  // AUDIOPRINT_HPP
