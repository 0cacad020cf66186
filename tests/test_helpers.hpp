/**
 * @file test_helpers.hpp
 * @brief Synthetic signals and temporary WAV files shared by the tests
 */

#ifndef AUDIOPRINT_TEST_HELPERS_HPP
#define AUDIOPRINT_TEST_HELPERS_HPP

#include <sndfile.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace audioprint {
namespace test {

class TestSignalGenerator {
public:
    static std::vector<float> sine(float frequency, float amplitude, float duration_s, int sample_rate) {
        const std::size_t n = static_cast<std::size_t>(duration_s * sample_rate);
        std::vector<float> out(n);
        for (std::size_t i = 0; i < n; ++i) {
            out[i] = amplitude * static_cast<float>(std::sin(2.0 * M_PI * frequency * i / sample_rate));
        }
        return out;
    }

    // Fixed seed so every run sees the same noise
    static std::vector<float> noise(float amplitude, float duration_s, int sample_rate, uint32_t seed = 42) {
        const std::size_t n = static_cast<std::size_t>(duration_s * sample_rate);
        std::mt19937 rng(seed);
        std::uniform_real_distribution<float> dist(-amplitude, amplitude);
        std::vector<float> out(n);
        for (float& s : out) {
            s = dist(rng);
        }
        return out;
    }

    /// Short decaying noise bursts every 60 / bpm seconds
    static std::vector<float> clickTrack(float bpm, float duration_s, int sample_rate) {
        const std::size_t n = static_cast<std::size_t>(duration_s * sample_rate);
        const std::size_t period = static_cast<std::size_t>(60.0 / bpm * sample_rate);
        const std::size_t click_len = static_cast<std::size_t>(0.01 * sample_rate);
        std::mt19937 rng(7);
        std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

        std::vector<float> out(n, 0.0f);
        for (std::size_t start = 0; start < n; start += period) {
            for (std::size_t j = 0; j < click_len && start + j < n; ++j) {
                const float decay = static_cast<float>(std::exp(-5.0 * j / click_len));
                out[start + j] = 0.9f * decay * dist(rng);
            }
        }
        return out;
    }

    /// Sine whose amplitude ramps linearly from @p from to @p to
    static std::vector<float> rampedSine(float frequency, float from, float to,
                                         float duration_s, int sample_rate) {
        std::vector<float> out = sine(frequency, 1.0f, duration_s, sample_rate);
        for (std::size_t i = 0; i < out.size(); ++i) {
            const float t = static_cast<float>(i) / out.size();
            out[i] *= from + (to - from) * t;
        }
        return out;
    }

    static std::vector<float> mix(const std::vector<float>& a, const std::vector<float>& b) {
        std::vector<float> out(std::max(a.size(), b.size()), 0.0f);
        for (std::size_t i = 0; i < a.size(); ++i) out[i] += a[i];
        for (std::size_t i = 0; i < b.size(); ++i) out[i] += b[i];
        return out;
    }
};

/**
 * @brief Scratch directory under the system temp path, removed on destruction
 */
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("audioprint_" + name + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

/// Write a 16-bit PCM WAV; interleaved when @p channels > 1
inline void writeAudio(const std::string& path, const std::vector<float>& samples,
                       int sample_rate, int format, int channels = 1) {
    SF_INFO info = {};
    info.samplerate = sample_rate;
    info.channels = channels;
    info.format = format;

    SNDFILE* file = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!file) {
        throw std::runtime_error("Cannot create " + path + ": " + sf_strerror(nullptr));
    }
    const sf_count_t frames = static_cast<sf_count_t>(samples.size() / channels);
    const sf_count_t written = sf_writef_float(file, samples.data(), frames);
    sf_close(file);
    if (written != frames) {
        throw std::runtime_error("Short write to " + path);
    }
}

inline void writeWav(const std::string& path, const std::vector<float>& samples,
                     int sample_rate, int channels = 1) {
    writeAudio(path, samples, sample_rate, SF_FORMAT_WAV | SF_FORMAT_PCM_16, channels);
}

inline void writeFlac(const std::string& path, const std::vector<float>& samples,
                      int sample_rate, int channels = 1) {
    writeAudio(path, samples, sample_rate, SF_FORMAT_FLAC | SF_FORMAT_PCM_16, channels);
}

// Cuts a file down to the given fraction of its size
inline void truncateFile(const std::string& path, double fraction) {
    const auto size = std::filesystem::file_size(path);
    std::filesystem::resize_file(path, static_cast<std::uintmax_t>(size * fraction));
}

inline void writeTextFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

}  // namespace test
}  // namespace audioprint

#endif  // AUDIOPRINT_TEST_HELPERS_HPP
