#ifndef AUDIOPRINT_CONFIG_HPP
#define AUDIOPRINT_CONFIG_HPP

#include <cmath>
#include <map>
#include <string>

#include "audioprint_types.hpp"

namespace audioprint {

// =============================================================================
// Frequency Band
// =============================================================================

struct FrequencyBand {
    float low_hz = 0.0f;
    float high_hz = 0.0f;
};

// =============================================================================
// Extractor Configuration
// =============================================================================

struct ExtractorConfig {
    // -------------------------------------------------------------------------
    // Pipeline-wide audio format
    // -------------------------------------------------------------------------

    int sample_rate = 22050;        // every file is resampled to this rate (Hz)

    // -------------------------------------------------------------------------
    // Analysis framing (rhythm / harmony / energy / spectral / frequency)
    // -------------------------------------------------------------------------

    int n_fft = 2048;               // FFT size and RMS frame length
    int hop_length = 128;           // analysis hop in samples

    // -------------------------------------------------------------------------
    // Harmonic / percussive separation
    // -------------------------------------------------------------------------

    int hpss_n_fft = 2048;
    int hpss_hop_length = 512;
    int hpss_kernel_size = 31;      // median filter length, must be odd
    float hpss_power = 2.0f;        // soft mask exponent
    float hpss_margin = 1.0f;       // >= 1, larger keeps the components stricter

    // -------------------------------------------------------------------------
    // Onset detection
    // -------------------------------------------------------------------------

    int n_mels = 128;
    float onset_pre_max_s = 0.03f;
    float onset_post_max_s = 0.0f;
    float onset_pre_avg_s = 0.10f;
    float onset_post_avg_s = 0.10f;
    float onset_wait_s = 0.03f;
    float onset_delta = 0.07f;

    // -------------------------------------------------------------------------
    // Tempo / beat tracking
    // -------------------------------------------------------------------------

    float start_bpm = 120.0f;       // centre of the tempo prior
    float std_bpm = 1.0f;           // prior width in octaves
    float max_tempo = 320.0f;
    float tempo_ac_size_s = 8.0f;   // longest autocorrelation lag considered
    float beat_tightness = 100.0f;

    // -------------------------------------------------------------------------
    // Spectral / frequency bands
    // -------------------------------------------------------------------------

    float rolloff_percent = 0.85f;
    FrequencyBand low_band = {20.0f, 250.0f};       // bass / kick
    FrequencyBand mid_band = {250.0f, 2000.0f};     // vocals / snare
    FrequencyBand high_band = {2000.0f, 8000.0f};   // cymbals / air

    double epsilon = 1e-8;          // guards ratio denominators

    // -------------------------------------------------------------------------
    // Runtime
    // -------------------------------------------------------------------------

    bool parallel_extractors = false;   // one thread per extractor
    bool verbose = true;                // info logging to stdout

    std::map<std::string, std::string> extra_params;

    // -------------------------------------------------------------------------
    // Convenience builders
    // -------------------------------------------------------------------------

    static ExtractorConfig defaults() {
        return ExtractorConfig();
    }

    ExtractorConfig withSampleRate(int rate) const {
        ExtractorConfig config = *this;
        config.sample_rate = rate;
        return config;
    }

    ExtractorConfig withHopLength(int hop) const {
        ExtractorConfig config = *this;
        config.hop_length = hop;
        return config;
    }

    ExtractorConfig withParallelExtraction(bool enabled = true) const {
        ExtractorConfig config = *this;
        config.parallel_extractors = enabled;
        return config;
    }

    ExtractorConfig quiet() const {
        ExtractorConfig config = *this;
        config.verbose = false;
        return config;
    }
};

// =============================================================================
// Config Validator
// =============================================================================

class ConfigValidator {
public:
    static ErrorInfo validate(const ExtractorConfig& config) {
        if (config.sample_rate <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Sample rate must be positive");
        }

        if (config.n_fft <= 0 || config.hop_length <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "n_fft and hop_length must be positive");
        }
        if (config.hop_length > config.n_fft) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "hop_length must not exceed n_fft");
        }

        if (config.hpss_n_fft <= 0 || config.hpss_hop_length <= 0 ||
            config.hpss_hop_length > config.hpss_n_fft) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Invalid HPSS framing",
                "hpss_n_fft=" + std::to_string(config.hpss_n_fft) +
                " hpss_hop_length=" + std::to_string(config.hpss_hop_length));
        }
        if (config.hpss_kernel_size <= 0 || config.hpss_kernel_size % 2 == 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "HPSS kernel size must be a positive odd number");
        }
        if (config.hpss_power <= 0.0f || config.hpss_margin < 1.0f) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "HPSS power must be positive and margin >= 1");
        }

        if (config.n_mels <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "n_mels must be positive");
        }

        const float onset_windows[] = {config.onset_pre_max_s, config.onset_post_max_s,
                                       config.onset_pre_avg_s, config.onset_post_avg_s,
                                       config.onset_wait_s};
        for (float window : onset_windows) {
            if (!(window >= 0.0f) || !std::isfinite(window)) {
                return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                    "Onset peak-pick windows must be non-negative",
                    "window=" + std::to_string(window) + " s");
            }
        }
        if (!std::isfinite(config.onset_delta)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "onset_delta must be finite");
        }

        if (config.start_bpm <= 0.0f || config.std_bpm <= 0.0f ||
            config.max_tempo <= 0.0f || config.tempo_ac_size_s <= 0.0f) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Tempo prior parameters must be positive");
        }

        if (!(config.beat_tightness >= 0.0f) || !std::isfinite(config.beat_tightness)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "beat_tightness must be non-negative");
        }

        if (!(config.rolloff_percent > 0.0f && config.rolloff_percent <= 1.0f)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "rolloff_percent must be in (0, 1]");
        }

        const float nyquist = config.sample_rate / 2.0f;
        const FrequencyBand* bands[] = {&config.low_band, &config.mid_band, &config.high_band};
        for (const FrequencyBand* band : bands) {
            if (band->low_hz < 0.0f || band->high_hz <= band->low_hz) {
                return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                    "Frequency band edges must satisfy 0 <= low < high");
            }
            if (band->low_hz >= nyquist) {
                return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                    "Frequency band starts above Nyquist",
                    "band low=" + std::to_string(band->low_hz) +
                    " Hz, nyquist=" + std::to_string(nyquist) + " Hz");
            }
        }

        if (!(config.epsilon > 0.0) || !std::isfinite(config.epsilon)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "epsilon must be a small positive number");
        }

        return ErrorInfo::ok();
    }
};

}  // namespace audioprint

#endif  // AUDIOPRINT_CONFIG_HPP
