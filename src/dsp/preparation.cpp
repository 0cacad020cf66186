#include "audioprint/dsp/preparation.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <string>

#include "audioprint/dsp/hpss.hpp"

namespace audioprint {

AudioPreparer::AudioPreparer(const ExtractorConfig& config)
    : config_(config)
{
}

std::size_t AudioPreparer::truncatedLength(std::size_t available, int sample_rate, double max_duration) {
    if (std::isinf(max_duration)) {
        return available;
    }
    const double limit = std::floor(max_duration * sample_rate);
    if (limit >= static_cast<double>(available)) {
        return available;
    }
    return static_cast<std::size_t>(limit);
}

ErrorInfo AudioPreparer::prepare(const AudioHandle& handle, double max_duration,
                                 PreparedAudio& prepared) const {
    if (std::isnan(max_duration) || max_duration <= 0.0) {
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "max_duration must be a positive number of seconds",
            "max_duration=" + std::to_string(max_duration));
    }
    if (handle.sample_rate <= 0) {
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "Audio handle has no sample rate: " + handle.file_path);
    }

    const std::size_t length = truncatedLength(handle.samples.size(), handle.sample_rate, max_duration);
    if (length == 0) {
        return ErrorInfo::error(ErrorCode::EMPTY_AUDIO,
            "No samples left after truncation: " + handle.file_path);
    }

    auto start_time = std::chrono::steady_clock::now();

    PreparedAudio result;
    result.samples.assign(handle.samples.begin(), handle.samples.begin() + length);
    result.sample_rate = handle.sample_rate;
    result.duration = static_cast<double>(length) / handle.sample_rate;

    HarmonicPercussiveSeparator separator(config_);
    SeparatedAudio separated = separator.separate(result.samples);
    result.harmonic = std::move(separated.harmonic);
    result.percussive = std::move(separated.percussive);

    if (config_.verbose) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        std::cout << "[AudioPreparer] " << result.duration << " s prepared, HPSS took "
                  << elapsed << " ms" << std::endl;
    }

    prepared = std::move(result);
    return ErrorInfo::ok();
}

}  // namespace audioprint
