/**
 * AudioPrint single file extraction example
 *
 * Usage:
 *   ./audioprint_extract <audio_file> [max_duration_s] [--parallel]
 *
 * Examples:
 *   ./audioprint_extract ~/song.wav
 *   ./audioprint_extract ~/song.wav 150
 *   ./audioprint_extract ~/song.wav 300 --parallel
 */

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>

#include "audioprint/audioprint.hpp"

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <audio_file> [max_duration_s] [--parallel]" << std::endl;
    std::cout << std::endl;
    std::cout << "Arguments:" << std::endl;
    std::cout << "  audio_file      Path to an audio file (wav, aiff, flac, ogg, mp3)" << std::endl;
    std::cout << "  max_duration_s  Seconds analysed from the start (default: 150)" << std::endl;
    std::cout << "  --parallel      Run the five extractors on separate threads" << std::endl;
}

void printCategory(const audioprint::FeatureRecord& record, audioprint::FeatureCategory category) {
    std::cout << "--- " << audioprint::categoryToString(category) << " ---" << std::endl;
    for (const auto& field : record.block(category)) {
        std::cout << "  " << std::left << std::setw(22) << field.first
                  << std::setprecision(6) << field.second << std::endl;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        printUsage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    std::string audio_file = argv[1];
    double max_duration = 150.0;
    bool parallel = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--parallel") {
            parallel = true;
        } else {
            max_duration = std::atof(arg.c_str());
        }
    }

    // Expand ~ to HOME
    if (!audio_file.empty() && audio_file[0] == '~') {
        const char* home = getenv("HOME");
        if (home) {
            audio_file = std::string(home) + audio_file.substr(1);
        }
    }

    std::cout << "========================================" << std::endl;
    std::cout << "    AudioPrint " << audioprint::getVersionString() << std::endl;
    std::cout << "========================================" << std::endl;

    audioprint::FeatureEngine engine;
    auto config = audioprint::ExtractorConfig::defaults().withParallelExtraction(parallel);

    auto callback = audioprint::LambdaCallback::create()
        .onStageComplete([](audioprint::FeatureCategory category) {
            std::cout << ">>> " << audioprint::categoryToString(category) << " done" << std::endl;
        })
        .onError([](const audioprint::ErrorInfo& e) {
            std::cerr << "Error: " << e.toString() << std::endl;
        })
        .build();
    engine.setCallback(std::move(callback));

    auto err = engine.initialize(config);
    if (!err.isOk()) {
        std::cerr << "Init failed: " << err.toString() << std::endl;
        return 1;
    }

    audioprint::TrackAnalysis analysis;
    err = engine.analyzeTrack(audio_file, max_duration, analysis);
    if (!err.isOk()) {
        return 1;
    }

    std::cout << std::endl;
    std::cout << "File:        " << analysis.file_path << std::endl;
    std::cout << "Duration:    " << std::fixed << std::setprecision(2) << analysis.duration << " s" << std::endl;
    std::cout << "Sample rate: " << analysis.sample_rate << " Hz" << std::endl;
    std::cout << "Processing:  " << analysis.processing_time_ms << " ms" << std::endl;
    std::cout << std::defaultfloat << std::endl;

    for (auto category : analysis.features.categories()) {
        printCategory(analysis.features, category);
    }

    std::cout << std::endl << "--- embedding ---" << std::endl;
    for (std::size_t i = 0; i < analysis.embedding.size(); ++i) {
        std::cout << "  [" << std::setw(2) << i << "] " << std::left << std::setw(32)
                  << audioprint::embeddingFieldName(i) << analysis.embedding[i] << std::endl;
    }

    std::cout << std::endl << ">>> Feedback object:" << std::endl;
    std::cout << audioprint::buildFeedbackObject(analysis.features).toJson() << std::endl;

    return 0;
}
