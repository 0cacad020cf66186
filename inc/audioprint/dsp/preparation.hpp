/**
 * @file preparation.hpp
 * @brief Truncation + separation step shared by every extractor
 */

#ifndef AUDIOPRINT_DSP_PREPARATION_HPP
#define AUDIOPRINT_DSP_PREPARATION_HPP

#include <vector>

#include "../audioprint_config.hpp"
#include "../audioprint_types.hpp"
#include "audio_loader.hpp"

namespace audioprint {

/**
 * @brief Analysis-ready audio: truncated waveform plus both HPSS components
 *
 * All three signals have the same length.
 */
struct PreparedAudio {
    std::vector<float> samples;
    std::vector<float> harmonic;
    std::vector<float> percussive;
    double duration = 0.0;          // samples.size() / sample_rate
    int sample_rate = 0;

    const std::vector<float>& component(SignalComponent which) const {
        switch (which) {
            case SignalComponent::HARMONIC:   return harmonic;
            case SignalComponent::PERCUSSIVE: return percussive;
            case SignalComponent::FULL:
            default:                          return samples;
        }
    }
};

/**
 * @class AudioPreparer
 * @brief Truncates a handle to max_duration and separates it exactly once
 */
class AudioPreparer {
public:
    explicit AudioPreparer(const ExtractorConfig& config);

    /**
     * @param max_duration seconds, > 0; +inf keeps the whole track
     * @return INVALID_ARGUMENT for a non-positive / NaN bound,
     *         EMPTY_AUDIO when nothing is left after truncation
     * @throws std::runtime_error on FFTW failure
     */
    ErrorInfo prepare(const AudioHandle& handle, double max_duration, PreparedAudio& prepared) const;

    /// @brief Number of samples kept for the given bound
    static std::size_t truncatedLength(std::size_t available, int sample_rate, double max_duration);

private:
    ExtractorConfig config_;
};

}  // namespace audioprint

#endif  // AUDIOPRINT_DSP_PREPARATION_HPP
