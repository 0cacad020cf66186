/**
 * @file track_pairs.hpp
 * @brief Discovery of input / reference track pairs for batch import
 *
 * Layout: <root>/<pair folder>/{input--*.ext, ref--*.ext}
 */

#ifndef AUDIOPRINT_TRACK_PAIRS_HPP
#define AUDIOPRINT_TRACK_PAIRS_HPP

#include <string>
#include <vector>

namespace audioprint {

struct TrackPair {
    std::string folder;             // folder name (not the full path)
    std::string input_file;         // full path of the input-- file
    std::string reference_file;     // full path of the ref-- file
};

/// @brief True for the audio extensions batch import accepts (case-insensitive)
bool isSupportedAudioFile(const std::string& path);

/**
 * @brief Find the input-- and ref-- files in one folder
 * @return false unless both were found; the found paths are still filled in
 */
bool findPairFiles(const std::string& folder_path, TrackPair& pair);

/**
 * @brief Every complete pair folder under @p root, sorted by folder name
 * @param skipped [out, optional] folders missing one of the two files
 */
std::vector<TrackPair> findTrackPairs(const std::string& root,
                                      std::vector<std::string>* skipped = nullptr);

}  // namespace audioprint

#endif  // AUDIOPRINT_TRACK_PAIRS_HPP
