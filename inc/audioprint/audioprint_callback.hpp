#ifndef AUDIOPRINT_CALLBACK_HPP
#define AUDIOPRINT_CALLBACK_HPP

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "audioprint_types.hpp"
#include "feature_record.hpp"

namespace audioprint {

// =============================================================================
// Extraction Callback Interface
// =============================================================================
//
// Two ways to receive progress:
// 1. Derive from this class and override the virtual functions
// 2. Use LambdaCallback::create() with lambdas
//
// All notifications are delivered on the thread that called the engine.
//

class IExtractionCallback {
public:
    virtual ~IExtractionCallback() = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief An extraction call started for @p file_path
    virtual void onStart(const std::string& file_path) {
        (void)file_path;
    }

    /// @brief One category block finished
    virtual void onStageComplete(FeatureCategory category) {
        (void)category;
    }

    /// @brief The call succeeded and the result was delivered
    virtual void onComplete() {}

    /// @brief Always the last notification of a call, success or not
    virtual void onClose() {}

    // -------------------------------------------------------------------------
    // Results
    // -------------------------------------------------------------------------

    /// @brief Complete feature record of the call
    virtual void onResult(const FeatureRecord& record) = 0;

    /// @brief The call failed; no onResult / onComplete follows
    virtual void onError(const ErrorInfo& error) = 0;
};

// =============================================================================
// Callback using std::function
// =============================================================================

using OnStartCallback = std::function<void(const std::string& file_path)>;
using OnStageCompleteCallback = std::function<void(FeatureCategory)>;
using OnCompleteCallback = std::function<void()>;
using OnCloseCallback = std::function<void()>;
using OnResultCallback = std::function<void(const FeatureRecord&)>;
using OnErrorCallback = std::function<void(const ErrorInfo&)>;

// =============================================================================
// Lambda Callback Adapter
// =============================================================================
//
//   auto callback = LambdaCallback::create()
//       .onResult([](const FeatureRecord& r) {
//           std::cout << "tempo: " << r.rhythm->tempo << std::endl;
//       })
//       .onError([](const ErrorInfo& e) {
//           std::cerr << "Error: " << e.message << std::endl;
//       })
//       .build();
//
//   engine.setCallback(std::move(callback));
//

class LambdaCallback : public IExtractionCallback {
public:
    class Builder {
    public:
        Builder& onStart(OnStartCallback cb) { on_start_ = std::move(cb); return *this; }
        Builder& onStageComplete(OnStageCompleteCallback cb) { on_stage_complete_ = std::move(cb); return *this; }
        Builder& onComplete(OnCompleteCallback cb) { on_complete_ = std::move(cb); return *this; }
        Builder& onClose(OnCloseCallback cb) { on_close_ = std::move(cb); return *this; }
        Builder& onResult(OnResultCallback cb) { on_result_ = std::move(cb); return *this; }
        Builder& onError(OnErrorCallback cb) { on_error_ = std::move(cb); return *this; }

        std::unique_ptr<LambdaCallback> build() {
            auto cb = std::make_unique<LambdaCallback>();
            cb->on_start_ = std::move(on_start_);
            cb->on_stage_complete_ = std::move(on_stage_complete_);
            cb->on_complete_ = std::move(on_complete_);
            cb->on_close_ = std::move(on_close_);
            cb->on_result_ = std::move(on_result_);
            cb->on_error_ = std::move(on_error_);
            return cb;
        }

    private:
        OnStartCallback on_start_;
        OnStageCompleteCallback on_stage_complete_;
        OnCompleteCallback on_complete_;
        OnCloseCallback on_close_;
        OnResultCallback on_result_;
        OnErrorCallback on_error_;
    };

    static Builder create() { return Builder(); }

    void onStart(const std::string& file_path) override { if (on_start_) on_start_(file_path); }
    void onStageComplete(FeatureCategory category) override {
        if (on_stage_complete_) on_stage_complete_(category);
    }
    void onComplete() override { if (on_complete_) on_complete_(); }
    void onClose() override { if (on_close_) on_close_(); }

    void onResult(const FeatureRecord& record) override {
        if (on_result_) on_result_(record);
    }

    void onError(const ErrorInfo& error) override {
        if (on_error_) on_error_(error);
    }

private:
    OnStartCallback on_start_;
    OnStageCompleteCallback on_stage_complete_;
    OnCompleteCallback on_complete_;
    OnCloseCallback on_close_;
    OnResultCallback on_result_;
    OnErrorCallback on_error_;
};

// =============================================================================
// Simple Callback (collects the last result, mainly for tests)
// =============================================================================

class SimpleCallback : public IExtractionCallback {
public:
    void onStageComplete(FeatureCategory category) override {
        stages_.push_back(category);
    }

    void onResult(const FeatureRecord& record) override {
        last_result_ = record;
        has_result_ = true;
    }

    void onError(const ErrorInfo& error) override {
        last_error_ = error;
        has_error_ = true;
    }

    void onClose() override { ++close_count_; }

    bool hasResult() const { return has_result_; }
    bool hasError() const { return has_error_; }
    int getCloseCount() const { return close_count_; }

    const FeatureRecord& getResult() const { return last_result_; }
    const ErrorInfo& getError() const { return last_error_; }
    const std::vector<FeatureCategory>& getStages() const { return stages_; }

    void reset() {
        has_result_ = false;
        has_error_ = false;
        close_count_ = 0;
        last_result_ = {};
        last_error_ = {};
        stages_.clear();
    }

private:
    bool has_result_ = false;
    bool has_error_ = false;
    int close_count_ = 0;
    FeatureRecord last_result_;
    ErrorInfo last_error_;
    std::vector<FeatureCategory> stages_;
};

}  // namespace audioprint

#endif  // AUDIOPRINT_CALLBACK_HPP
