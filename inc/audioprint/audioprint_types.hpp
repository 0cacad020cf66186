#ifndef AUDIOPRINT_TYPES_HPP
#define AUDIOPRINT_TYPES_HPP

#include <string>
#include <vector>

namespace audioprint {

// =============================================================================
// Feature Category
// =============================================================================

enum class FeatureCategory {
    RHYTHM,         // tempo, onsets, syncopation
    HARMONY,        // chroma based tonal metrics
    ENERGY,         // RMS envelope dynamics
    SPECTRAL,       // centroid / rolloff / bandwidth
    FREQUENCY,      // low / mid / high band balance
};

inline const char* categoryToString(FeatureCategory category) {
    switch (category) {
        case FeatureCategory::RHYTHM:    return "rhythm";
        case FeatureCategory::HARMONY:   return "harmony";
        case FeatureCategory::ENERGY:    return "energy";
        case FeatureCategory::SPECTRAL:  return "spectral";
        case FeatureCategory::FREQUENCY: return "frequency";
        default:                         return "unknown";
    }
}

/// @brief Parse a category name ("rhythm", "harmony", ...)
/// @return false if the name is not a feature category
inline bool categoryFromString(const std::string& name, FeatureCategory& out) {
    if (name == "rhythm")    { out = FeatureCategory::RHYTHM;    return true; }
    if (name == "harmony")   { out = FeatureCategory::HARMONY;   return true; }
    if (name == "energy")    { out = FeatureCategory::ENERGY;    return true; }
    if (name == "spectral")  { out = FeatureCategory::SPECTRAL;  return true; }
    if (name == "frequency") { out = FeatureCategory::FREQUENCY; return true; }
    return false;
}

inline std::vector<FeatureCategory> allFeatureCategories() {
    return {
        FeatureCategory::RHYTHM,
        FeatureCategory::HARMONY,
        FeatureCategory::ENERGY,
        FeatureCategory::SPECTRAL,
        FeatureCategory::FREQUENCY,
    };
}

// =============================================================================
// Signal Component (which part of the prepared audio an extractor reads)
// =============================================================================

enum class SignalComponent {
    FULL,           // truncated mono waveform
    HARMONIC,       // tonal part after HPSS
    PERCUSSIVE,     // transient part after HPSS
};

inline const char* componentToString(SignalComponent component) {
    switch (component) {
        case SignalComponent::FULL:       return "full";
        case SignalComponent::HARMONIC:   return "harmonic";
        case SignalComponent::PERCUSSIVE: return "percussive";
        default:                          return "unknown";
    }
}

// =============================================================================
// Error Info
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // Configuration / argument errors (1xx)
    INVALID_CONFIG = 100,
    INVALID_ARGUMENT = 101,

    // Input errors (2xx)
    FILE_NOT_FOUND = 200,
    DECODE_FAILED = 201,
    EMPTY_AUDIO = 202,

    // Runtime errors (3xx)
    NOT_INITIALIZED = 300,
    ALREADY_INITIALIZED = 301,
    EXTRACTION_FAILED = 302,

    // Internal errors (4xx)
    INTERNAL_ERROR = 400,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                  return "OK";
        case ErrorCode::INVALID_CONFIG:      return "INVALID_CONFIG";
        case ErrorCode::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
        case ErrorCode::FILE_NOT_FOUND:      return "FILE_NOT_FOUND";
        case ErrorCode::DECODE_FAILED:       return "DECODE_FAILED";
        case ErrorCode::EMPTY_AUDIO:         return "EMPTY_AUDIO";
        case ErrorCode::NOT_INITIALIZED:     return "NOT_INITIALIZED";
        case ErrorCode::ALREADY_INITIALIZED: return "ALREADY_INITIALIZED";
        case ErrorCode::EXTRACTION_FAILED:   return "EXTRACTION_FAILED";
        case ErrorCode::INTERNAL_ERROR:      return "INTERNAL_ERROR";
        default:                             return "UNKNOWN";
    }
}

struct ErrorInfo {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    std::string detail;         // extra context for debugging (file path, decoder text)

    bool isOk() const { return code == ErrorCode::OK; }

    std::string toString() const {
        std::string s = std::string(errorCodeToString(code)) + ": " + message;
        if (!detail.empty()) {
            s += " (" + detail + ")";
        }
        return s;
    }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }
};

}  // namespace audioprint

#endif  // AUDIOPRINT_TYPES_HPP
