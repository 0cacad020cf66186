/**
 * @file beat_tracker.hpp
 * @brief Tempo estimation and dynamic-programming beat tracking
 *
 * Tempo: mean autocorrelation tempogram of the onset envelope weighted by a
 * log-normal prior. Beats: Ellis, "Beat Tracking by Dynamic Programming",
 * JNMR 2007.
 */

#ifndef AUDIOPRINT_DSP_BEAT_TRACKER_HPP
#define AUDIOPRINT_DSP_BEAT_TRACKER_HPP

#include <vector>

#include "../audioprint_config.hpp"

namespace audioprint {
namespace dsp {

struct BeatResult {
    double tempo = 0.0;             // BPM, 0 when the envelope is silent
    std::vector<int> beats;         // frame indices, ascending
};

class BeatTracker {
public:
    BeatTracker(const ExtractorConfig& config, int sample_rate);

    /// @brief Tempo then beat grid; a silent envelope yields {0, {}}
    BeatResult track(const std::vector<float>& onset_envelope) const;

    /**
     * @brief Mean of the column-normalised autocorrelation tempogram
     * @return one value per lag in frames, [0, win_length)
     * @throws std::runtime_error on FFTW failure
     */
    std::vector<double> meanTempogram(const std::vector<float>& onset_envelope) const;

    /// @brief Most likely tempo (BPM) of an onset envelope
    double estimateTempo(const std::vector<float>& onset_envelope) const;

    /// @brief Beat frames for a known tempo
    std::vector<int> trackBeats(const std::vector<float>& onset_envelope, double bpm) const;

    /**
     * @brief Drop leading and trailing beats whose local score is at most half
     * the RMS of the Hann-smoothed beat scores
     * @param localscore indexed by frame, must cover every beat
     */
    static std::vector<int> trimWeakBeats(const std::vector<int>& beats,
                                          const std::vector<double>& localscore);

    /// @brief BPM represented by an autocorrelation lag (lag 0 is +inf)
    double lagToBpm(int lag) const;

    int tempogramWindow() const;

private:
    ExtractorConfig config_;
    int sample_rate_;
    double frame_rate_;
};

}  // namespace dsp
}  // namespace audioprint

#endif  // AUDIOPRINT_DSP_BEAT_TRACKER_HPP
