#include "audioprint/track_pairs.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace audioprint {

namespace {

const char* const kInputPrefix = "input--";
const char* const kReferencePrefix = "ref--";

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

bool isSupportedAudioFile(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const std::vector<std::string> supported = {
        ".wav", ".aif", ".aiff", ".flac", ".ogg", ".mp3"};
    return std::find(supported.begin(), supported.end(), ext) != supported.end();
}

bool findPairFiles(const std::string& folder_path, TrackPair& pair) {
    pair.folder = fs::path(folder_path).filename().string();
    pair.input_file.clear();
    pair.reference_file.clear();

    std::error_code ec;
    std::vector<fs::path> files;
    for (fs::directory_iterator it(folder_path, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());

    // The last match in name order wins when a folder holds several
    for (const auto& file : files) {
        const std::string name = file.filename().string();
        if (!isSupportedAudioFile(name)) {
            continue;
        }
        if (startsWith(name, kInputPrefix)) {
            pair.input_file = file.string();
        } else if (startsWith(name, kReferencePrefix)) {
            pair.reference_file = file.string();
        }
    }

    return !pair.input_file.empty() && !pair.reference_file.empty();
}

std::vector<TrackPair> findTrackPairs(const std::string& root, std::vector<std::string>* skipped) {
    std::vector<TrackPair> pairs;

    std::error_code ec;
    std::vector<fs::path> folders;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) {
            folders.push_back(it->path());
        }
    }
    std::sort(folders.begin(), folders.end());

    for (const auto& folder : folders) {
        TrackPair pair;
        if (findPairFiles(folder.string(), pair)) {
            pairs.push_back(pair);
        } else if (skipped) {
            skipped->push_back(pair.folder);
        }
    }

    return pairs;
}

}  // namespace audioprint
