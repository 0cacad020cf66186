/**
 * @file audio_loader.cpp
 * @brief libsndfile based waveform loader
 */

#include "audioprint/dsp/audio_loader.hpp"

#include <sndfile.h>

#include <cmath>
#include <cstring>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace audioprint {

AudioLoader::AudioLoader(const ExtractorConfig& config)
    : config_(config)
{
}

ErrorInfo AudioLoader::load(const std::string& file_path, AudioHandle& handle) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return ErrorInfo::error(ErrorCode::FILE_NOT_FOUND,
            "Audio file not found: " + file_path);
    }

    // Open audio file
    SF_INFO sf_info;
    memset(&sf_info, 0, sizeof(sf_info));

    SNDFILE* file = sf_open(file_path.c_str(), SFM_READ, &sf_info);
    if (!file) {
        return ErrorInfo::error(ErrorCode::DECODE_FAILED,
            "Failed to decode audio file: " + file_path,
            sf_strerror(nullptr));
    }

    if (sf_info.frames <= 0 || sf_info.channels <= 0) {
        sf_close(file);
        return ErrorInfo::error(ErrorCode::EMPTY_AUDIO,
            "Audio file contains no samples: " + file_path);
    }

    // Read interleaved frames as float
    std::vector<float> audio_data(static_cast<std::size_t>(sf_info.frames) * sf_info.channels);
    sf_count_t frames_read = sf_readf_float(file, audio_data.data(), sf_info.frames);
    std::string read_error = sf_strerror(file);
    sf_close(file);

    // A stream that stops decoding before the header frame count is corrupt
    if (frames_read != sf_info.frames) {
        return ErrorInfo::error(ErrorCode::DECODE_FAILED,
            "Failed to read audio data from file: " + file_path,
            "read " + std::to_string(frames_read) + " of " +
            std::to_string(sf_info.frames) + " frames: " + read_error);
    }

    // Down-mix to mono by averaging channels
    std::vector<float> mono_audio(static_cast<std::size_t>(frames_read));
    if (sf_info.channels > 1) {
        for (sf_count_t i = 0; i < frames_read; ++i) {
            float sum = 0.0f;
            for (int ch = 0; ch < sf_info.channels; ++ch) {
                sum += audio_data[static_cast<std::size_t>(i) * sf_info.channels + ch];
            }
            mono_audio[static_cast<std::size_t>(i)] = sum / sf_info.channels;
        }
    } else {
        std::copy(audio_data.begin(), audio_data.begin() + frames_read, mono_audio.begin());
    }

    if (sf_info.samplerate != config_.sample_rate) {
        if (config_.verbose) {
            std::cout << "[AudioLoader] Resampling " << sf_info.samplerate << " Hz -> "
                      << config_.sample_rate << " Hz" << std::endl;
        }
        mono_audio = resampleLinear(mono_audio, sf_info.samplerate, config_.sample_rate);
        if (mono_audio.empty()) {
            return ErrorInfo::error(ErrorCode::EMPTY_AUDIO,
                "Audio file too short to resample: " + file_path);
        }
    }

    handle.file_path = file_path;
    handle.sample_rate = config_.sample_rate;
    handle.samples = std::move(mono_audio);

    if (config_.verbose) {
        std::cout << "[AudioLoader] Loaded " << file_path << " ("
                  << handle.samples.size() << " samples, "
                  << handle.duration() << " s)" << std::endl;
    }

    return ErrorInfo::ok();
}

std::vector<float> AudioLoader::resampleLinear(const std::vector<float>& input,
                                               int input_rate, int target_rate) {
    if (input.empty() || input_rate <= 0 || target_rate <= 0) {
        return {};
    }
    if (input_rate == target_rate) {
        return input;
    }

    const double ratio = static_cast<double>(target_rate) / input_rate;
    const std::size_t out_size = static_cast<std::size_t>(std::llround(input.size() * ratio));
    std::vector<float> out(out_size, 0.0f);

    if (input.size() < 2 || out_size == 0) {
        if (!out.empty()) {
            std::fill(out.begin(), out.end(), input.front());
        }
        return out;
    }

    // Interpolation positions clipped to [0, input_size - 1]
    const double step = 1.0 / ratio;
    const double last = static_cast<double>(input.size() - 1);
    for (std::size_t i = 0; i < out_size; ++i) {
        const double pos = std::min(static_cast<double>(i) * step, last);
        const std::size_t lo = static_cast<std::size_t>(pos);
        const std::size_t hi = std::min(lo + 1, input.size() - 1);
        const double frac = pos - static_cast<double>(lo);
        out[i] = static_cast<float>(input[lo] + (input[hi] - input[lo]) * frac);
    }

    return out;
}

}  // namespace audioprint
