#include "audioprint/extractors/feature_extractor.hpp"

#include <exception>
#include <iostream>
#include <string>

namespace audioprint {

ErrorInfo BaseFeatureExtractor::initialize(const ExtractorConfig& config) {
    ErrorInfo err = ConfigValidator::validate(config);
    if (!err.isOk()) {
        return err;
    }
    config_ = config;
    initialized_ = true;
    return ErrorInfo::ok();
}

ErrorInfo BaseFeatureExtractor::extract(const AnalysisInput& input, FeatureRecord& record) {
    if (!initialized_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, getName() + " not initialized");
    }
    if (input.sample_rate <= 0 || !(input.duration > 0.0)) {
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            getName() + ": invalid analysis input",
            "sample_rate=" + std::to_string(input.sample_rate) +
            " duration=" + std::to_string(input.duration));
    }

    // Compute into a scratch record so a failure leaves the caller's untouched
    FeatureRecord partial;
    partial.metadata = record.metadata;
    try {
        compute(input, partial);
    } catch (const std::exception& e) {
        std::cerr << "[" << getName() << "] Extraction failed: " << e.what() << std::endl;
        return ErrorInfo::error(ErrorCode::EXTRACTION_FAILED,
            getName() + " failed", e.what());
    }

    record.mergeFrom(partial);
    return ErrorInfo::ok();
}

void BaseFeatureExtractor::logInfo(const std::string& message) const {
    if (config_.verbose) {
        std::cout << "[" << getName() << "] " << message << std::endl;
    }
}

}  // namespace audioprint
