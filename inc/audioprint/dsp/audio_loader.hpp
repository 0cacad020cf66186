/**
 * @file audio_loader.hpp
 * @brief Decode an audio file into a mono waveform at the pipeline rate
 */

#ifndef AUDIOPRINT_DSP_AUDIO_LOADER_HPP
#define AUDIOPRINT_DSP_AUDIO_LOADER_HPP

#include <string>
#include <vector>

#include "../audioprint_config.hpp"
#include "../audioprint_types.hpp"

namespace audioprint {

/**
 * @brief Decoded track
 *
 * Created by AudioLoader and treated as read-only by everything downstream.
 */
struct AudioHandle {
    std::string file_path;
    int sample_rate = 0;            // always the configured pipeline rate
    std::vector<float> samples;     // mono

    double duration() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/**
 * @class AudioLoader
 * @brief libsndfile decoder with channel down-mix and linear resampling
 */
class AudioLoader {
public:
    explicit AudioLoader(const ExtractorConfig& config);

    /**
     * @brief Load @p file_path into @p handle
     * @return FILE_NOT_FOUND, DECODE_FAILED or EMPTY_AUDIO on failure;
     *         @p handle is left untouched unless the load succeeds
     */
    ErrorInfo load(const std::string& file_path, AudioHandle& handle) const;

    /// @brief Linear-interpolation resampler
    static std::vector<float> resampleLinear(const std::vector<float>& input,
                                             int input_rate, int target_rate);

private:
    ExtractorConfig config_;
};

}  // namespace audioprint

#endif  // AUDIOPRINT_DSP_AUDIO_LOADER_HPP
