#ifndef AUDIOPRINT_FEATURE_EXTRACTOR_HPP
#define AUDIOPRINT_FEATURE_EXTRACTOR_HPP

#include <memory>
#include <string>
#include <vector>

#include "../audioprint_config.hpp"
#include "../audioprint_types.hpp"
#include "../feature_record.hpp"

namespace audioprint {

// =============================================================================
// Analysis Input
// =============================================================================
//
// Everything an extractor may look at. The signal is one component of the
// prepared audio, chosen by the extractor's getInputComponent().
//

struct AnalysisInput {
    const std::vector<float>& signal;
    int sample_rate;
    double duration;            // seconds of the truncated track
};

// =============================================================================
// Feature Extractor Interface
// =============================================================================
//
// One implementation per feature category. Extractors are stateless between
// calls: extract() reads only its input and writes only its own block of the
// output record, so several extractors may run concurrently.
//
// Adding a category:
// 1. Derive from IFeatureExtractor
// 2. Implement the pure virtual functions
// 3. Register it in FeatureExtractorFactory
//

class IFeatureExtractor {
public:
    virtual ~IFeatureExtractor() = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Bind the extractor to a validated configuration
    virtual ErrorInfo initialize(const ExtractorConfig& config) = 0;

    virtual bool isInitialized() const = 0;

    // -------------------------------------------------------------------------
    // Info
    // -------------------------------------------------------------------------

    virtual FeatureCategory getCategory() const = 0;

    /// @brief Name used as the log tag
    virtual std::string getName() const = 0;

    /// @brief Which prepared signal this extractor consumes
    virtual SignalComponent getInputComponent() const = 0;

    // -------------------------------------------------------------------------
    // Extraction
    // -------------------------------------------------------------------------

    /// @brief Compute this category and store it in @p record
    /// @return EXTRACTION_FAILED if the computation threw; @p record is then untouched
    virtual ErrorInfo extract(const AnalysisInput& input, FeatureRecord& record) = 0;
};

// =============================================================================
// Base Extractor
// =============================================================================
//
// Shared lifecycle and logging. Subclasses implement compute(); extract()
// checks initialisation and turns exceptions into EXTRACTION_FAILED.
//

class BaseFeatureExtractor : public IFeatureExtractor {
public:
    ErrorInfo initialize(const ExtractorConfig& config) override;

    bool isInitialized() const override { return initialized_; }

    ErrorInfo extract(const AnalysisInput& input, FeatureRecord& record) override;

protected:
    ExtractorConfig config_;
    bool initialized_ = false;

    /// @brief Category computation; may throw
    virtual void compute(const AnalysisInput& input, FeatureRecord& record) = 0;

    void logInfo(const std::string& message) const;
};

// =============================================================================
// Extractor Factory
// =============================================================================

class FeatureExtractorFactory {
public:
    /// @brief Create an (uninitialised) extractor for @p category
    /// @return nullptr for an unknown category
    static std::unique_ptr<IFeatureExtractor> create(FeatureCategory category);

    /// @brief One extractor per category, in canonical order
    static std::vector<std::unique_ptr<IFeatureExtractor>> createAll();
};

}  // namespace audioprint

#endif  // AUDIOPRINT_FEATURE_EXTRACTOR_HPP
