/**
 * AudioPrint batch import example
 *
 * Scans a directory of track pair folders, each holding an "input--" and a
 * "ref--" audio file, and prints the analysis of both tracks. Storing the
 * results is left to the caller.
 *
 * Usage:
 *   ./audioprint_batch [batch_dir]      (default: data/batch_import)
 */

#include <iostream>
#include <string>
#include <vector>

#include "audioprint/audioprint.hpp"
#include "audioprint/track_pairs.hpp"

namespace {

constexpr double kMaxDuration = 150.0;

void printAnalysis(const std::string& role, const audioprint::TrackAnalysis& analysis) {
    std::cout << "  " << role << ": " << analysis.file_path << std::endl;
    std::cout << "    duration=" << analysis.duration << " s, sample_rate="
              << analysis.sample_rate << " Hz, " << analysis.processing_time_ms << " ms" << std::endl;
    std::cout << "    embedding=[";
    for (std::size_t i = 0; i < analysis.embedding.size(); ++i) {
        std::cout << (i ? ", " : "") << analysis.embedding[i];
    }
    std::cout << "]" << std::endl;

    auto feedback = audioprint::buildFeedbackObject(analysis.features,
        std::vector<audioprint::FeedbackCategory>{audioprint::FeedbackCategory::RHYTHM,
                                                  audioprint::FeedbackCategory::ENERGY});
    std::cout << feedback.toJson() << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string batch_dir = argc >= 2 ? argv[1] : "data/batch_import";

    std::vector<std::string> skipped;
    auto pairs = audioprint::findTrackPairs(batch_dir, &skipped);
    for (const auto& folder : skipped) {
        std::cerr << "[Batch] Skipping " << folder << ": missing input-- or ref-- file" << std::endl;
    }
    if (pairs.empty()) {
        std::cerr << "[Batch] No valid track pairs found in " << batch_dir << std::endl;
        return 1;
    }
    std::cout << "[Batch] Found " << pairs.size() << " track pairs" << std::endl;

    audioprint::FeatureEngine engine;
    auto err = engine.initialize(audioprint::ExtractorConfig::defaults().quiet());
    if (!err.isOk()) {
        std::cerr << "Init failed: " << err.toString() << std::endl;
        return 1;
    }

    int succeeded = 0;
    std::vector<std::string> failed;

    for (const auto& pair : pairs) {
        std::cout << "[Batch] Importing " << pair.folder << std::endl;

        audioprint::TrackAnalysis input;
        audioprint::TrackAnalysis reference;
        err = engine.analyzeTrack(pair.input_file, kMaxDuration, input);
        if (err.isOk()) {
            err = engine.analyzeTrack(pair.reference_file, kMaxDuration, reference);
        }
        if (!err.isOk()) {
            std::cerr << "[Batch] Failed " << pair.folder << ": " << err.toString() << std::endl;
            failed.push_back(pair.folder);
            continue;
        }

        printAnalysis("input", input);
        printAnalysis("reference", reference);
        ++succeeded;
    }

    std::cout << "[Batch] Complete: " << succeeded << "/" << pairs.size() << " successful" << std::endl;
    for (const auto& folder : failed) {
        std::cout << "[Batch]   failed: " << folder << std::endl;
    }

    return failed.empty() ? 0 : 1;
}
