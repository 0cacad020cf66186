#include "audioprint/audioprint_engine.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "audioprint/audioprint.hpp"

namespace audioprint {

// =============================================================================
// FeatureEngine Implementation
// =============================================================================

FeatureEngine::FeatureEngine() = default;

FeatureEngine::~FeatureEngine() {
    shutdown();
}

ErrorInfo FeatureEngine::initialize(const ExtractorConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_.load()) {
        return ErrorInfo::error(ErrorCode::ALREADY_INITIALIZED, "Engine already initialized");
    }

    // Validate config
    auto validation_error = ConfigValidator::validate(config);
    if (!validation_error.isOk()) {
        setLastError(validation_error);
        return validation_error;
    }

    config_ = config;

    // Create extractors
    std::vector<std::unique_ptr<IFeatureExtractor>> extractors;
    for (FeatureCategory category : allFeatureCategories()) {
        auto extractor = FeatureExtractorFactory::create(category);
        if (!extractor) {
            auto err = ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
                std::string("Failed to create extractor: ") + categoryToString(category));
            setLastError(err);
            return err;
        }
        auto err = extractor->initialize(config_);
        if (!err.isOk()) {
            setLastError(err);
            return err;
        }
        extractors.push_back(std::move(extractor));
    }
    extractors_ = std::move(extractors);

    initialized_.store(true);
    logInfo("Initialized with " + std::to_string(extractors_.size()) + " extractors (" +
            (config_.parallel_extractors ? "parallel" : "sequential") + ")");

    return ErrorInfo::ok();
}

void FeatureEngine::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    extractors_.clear();
    initialized_.store(false);
}

bool FeatureEngine::isInitialized() const {
    return initialized_.load();
}

void FeatureEngine::setCallback(std::unique_ptr<IExtractionCallback> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    shared_callback_.reset();
    owned_callback_ = std::move(callback);
    callback_ = owned_callback_.get();
}

void FeatureEngine::setCallback(IExtractionCallback* callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    owned_callback_.reset();  // Release owned callback if any
    shared_callback_.reset();
    callback_ = callback;
}

void FeatureEngine::setSharedCallback(std::shared_ptr<IExtractionCallback> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    owned_callback_.reset();
    shared_callback_ = std::move(callback);
    callback_ = shared_callback_.get();
}

// =============================================================================
// Pipeline Steps
// =============================================================================

ErrorInfo FeatureEngine::loadAudio(const std::string& file_path, AudioHandle& handle) {
    if (!initialized_.load()) {
        auto err = ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Engine not initialized");
        setLastError(err);
        return err;
    }

    AudioLoader loader(config_);
    auto err = loader.load(file_path, handle);
    if (!err.isOk()) {
        setLastError(err);
    }
    return err;
}

ErrorInfo FeatureEngine::prepareAudio(const AudioHandle& handle, double max_duration,
                                      PreparedAudio& prepared) {
    if (!initialized_.load()) {
        auto err = ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Engine not initialized");
        setLastError(err);
        return err;
    }

    ErrorInfo err;
    try {
        AudioPreparer preparer(config_);
        err = preparer.prepare(handle, max_duration, prepared);
    } catch (const std::exception& e) {
        err = ErrorInfo::error(ErrorCode::EXTRACTION_FAILED, "Audio preparation failed", e.what());
    }
    if (!err.isOk()) {
        setLastError(err);
    }
    return err;
}

// =============================================================================
// Extraction
// =============================================================================

ErrorInfo FeatureEngine::extractGlobalFeatures(const std::string& file_path, double max_duration,
                                               FeatureRecord& record) {
    notifyStart(file_path);

    AudioHandle handle;
    auto err = loadAudio(file_path, handle);
    if (err.isOk()) {
        err = extractInternal(handle, max_duration, record);
    }

    if (err.isOk()) {
        notifyResult(record);
        notifyComplete();
    } else {
        notifyError(err);
    }
    notifyClose();
    return err;
}

ErrorInfo FeatureEngine::extractGlobalFeatures(const AudioHandle& handle, double max_duration,
                                               FeatureRecord& record) {
    notifyStart(handle.file_path);

    ErrorInfo err;
    if (!initialized_.load()) {
        err = ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Engine not initialized");
        setLastError(err);
    } else {
        err = extractInternal(handle, max_duration, record);
    }

    if (err.isOk()) {
        notifyResult(record);
        notifyComplete();
    } else {
        notifyError(err);
    }
    notifyClose();
    return err;
}

ErrorInfo FeatureEngine::analyzeTrack(const std::string& file_path, double max_duration,
                                      TrackAnalysis& analysis) {
    auto start_time = std::chrono::steady_clock::now();
    notifyStart(file_path);

    TrackAnalysis result;
    result.file_path = file_path;

    AudioHandle handle;
    auto err = loadAudio(file_path, handle);
    if (err.isOk()) {
        err = extractInternal(handle, max_duration, result.features);
    }

    if (!err.isOk()) {
        notifyError(err);
        notifyClose();
        return err;
    }

    result.embedding = createEmbeddingVector(result.features);
    result.duration = result.features.metadata.duration;
    result.sample_rate = result.features.metadata.sample_rate;
    result.processing_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    logInfo("Analyzed " + file_path + " in " + std::to_string(result.processing_time_ms) + " ms");

    analysis = std::move(result);
    notifyResult(analysis.features);
    notifyComplete();
    notifyClose();
    return ErrorInfo::ok();
}

ErrorInfo FeatureEngine::extractInternal(const AudioHandle& handle, double max_duration,
                                         FeatureRecord& record) {
    PreparedAudio prepared;
    auto err = prepareAudio(handle, max_duration, prepared);
    if (!err.isOk()) {
        return err;
    }

    FeatureRecord result;
    result.metadata.duration = prepared.duration;
    result.metadata.sample_rate = prepared.sample_rate;

    err = runExtractors(prepared, result);
    if (!err.isOk()) {
        setLastError(err);
        return err;
    }

    record = std::move(result);
    return ErrorInfo::ok();
}

ErrorInfo FeatureEngine::runExtractors(const PreparedAudio& prepared, FeatureRecord& record) {
    const std::size_t count = extractors_.size();
    std::vector<FeatureRecord> partials(count);
    std::vector<ErrorInfo> results(count);

    auto run_one = [&](std::size_t i) {
        IFeatureExtractor& extractor = *extractors_[i];
        AnalysisInput input{prepared.component(extractor.getInputComponent()),
                            prepared.sample_rate, prepared.duration};
        partials[i].metadata = record.metadata;
        results[i] = extractor.extract(input, partials[i]);
    };

    if (config_.parallel_extractors) {
        // One thread per extractor, each writing only its own partial record
        std::vector<std::thread> workers;
        workers.reserve(count);
        try {
            for (std::size_t i = 0; i < count; ++i) {
                workers.emplace_back(run_one, i);
            }
        } catch (const std::exception& e) {
            for (auto& worker : workers) {
                worker.join();
            }
            return ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
                "Failed to start extractor threads", e.what());
        }
        for (auto& worker : workers) {
            worker.join();
        }
    } else {
        for (std::size_t i = 0; i < count; ++i) {
            run_one(i);
            if (!results[i].isOk()) {
                break;
            }
        }
    }

    // Merge in canonical order; the first failure wins
    for (std::size_t i = 0; i < count; ++i) {
        if (!results[i].isOk()) {
            return results[i];
        }
    }
    for (std::size_t i = 0; i < count; ++i) {
        record.mergeFrom(partials[i]);
        notifyStageComplete(extractors_[i]->getCategory());
    }

    return ErrorInfo::ok();
}

// =============================================================================
// Status
// =============================================================================

ErrorInfo FeatureEngine::getLastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

std::string FeatureEngine::getVersion() {
    return getVersionString();
}

void FeatureEngine::setLastError(const ErrorInfo& error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = error;
    std::cerr << "[FeatureEngine] " << error.toString() << std::endl;
}

void FeatureEngine::logInfo(const std::string& message) const {
    if (config_.verbose) {
        std::cout << "[FeatureEngine] " << message << std::endl;
    }
}

// =============================================================================
// Callback Notifications
// =============================================================================

void FeatureEngine::notifyStart(const std::string& file_path) {
    if (callback_) callback_->onStart(file_path);
}

void FeatureEngine::notifyStageComplete(FeatureCategory category) {
    if (callback_) callback_->onStageComplete(category);
}

void FeatureEngine::notifyResult(const FeatureRecord& record) {
    if (callback_) callback_->onResult(record);
}

void FeatureEngine::notifyError(const ErrorInfo& error) {
    if (callback_) callback_->onError(error);
}

void FeatureEngine::notifyComplete() {
    if (callback_) callback_->onComplete();
}

void FeatureEngine::notifyClose() {
    if (callback_) callback_->onClose();
}

}  // namespace audioprint
