/**
 * AudioPrint Python Bindings
 *
 * Exposes the feature engine, the embedding vectorizer, the feature filter
 * and the feedback builder to the Python storage / retrieval layer.
 * Embeddings are returned as float32 numpy arrays.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <pybind11/numpy.h>

#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "audioprint/audioprint.hpp"

namespace py = pybind11;

// =============================================================================
// Python Callback Wrapper
// =============================================================================

class PyExtractionCallback : public audioprint::IExtractionCallback {
public:
    using ResultCallback = std::function<void(const audioprint::FeatureRecord&)>;
    using ErrorCallback = std::function<void(const audioprint::ErrorInfo&)>;
    using StartCallback = std::function<void(const std::string&)>;
    using SimpleCallback = std::function<void()>;

    void setOnResult(ResultCallback cb) { on_result_ = std::move(cb); }
    void setOnError(ErrorCallback cb) { on_error_ = std::move(cb); }
    void setOnStart(StartCallback cb) { on_start_ = std::move(cb); }
    void setOnComplete(SimpleCallback cb) { on_complete_ = std::move(cb); }
    void setOnClose(SimpleCallback cb) { on_close_ = std::move(cb); }

    void onResult(const audioprint::FeatureRecord& record) override {
        if (on_result_) {
            py::gil_scoped_acquire acquire;
            on_result_(record);
        }
    }

    void onError(const audioprint::ErrorInfo& error) override {
        if (on_error_) {
            py::gil_scoped_acquire acquire;
            on_error_(error);
        }
    }

    void onStart(const std::string& file_path) override {
        if (on_start_) {
            py::gil_scoped_acquire acquire;
            on_start_(file_path);
        }
    }

    void onComplete() override {
        if (on_complete_) {
            py::gil_scoped_acquire acquire;
            on_complete_();
        }
    }

    void onClose() override {
        if (on_close_) {
            py::gil_scoped_acquire acquire;
            on_close_();
        }
    }

private:
    ResultCallback on_result_;
    ErrorCallback on_error_;
    StartCallback on_start_;
    SimpleCallback on_complete_;
    SimpleCallback on_close_;
};

namespace {

py::array_t<float> toNumpy(const audioprint::EmbeddingVector& vec) {
    py::array_t<float> out(static_cast<py::ssize_t>(vec.size()));
    auto view = out.mutable_unchecked<1>();
    for (std::size_t i = 0; i < vec.size(); ++i) {
        view(static_cast<py::ssize_t>(i)) = vec[i];
    }
    return out;
}

// Python callers may pass None for "no bound"
double durationBound(const py::object& max_duration) {
    if (max_duration.is_none()) {
        return INFINITY;
    }
    return max_duration.cast<double>();
}

}  // namespace

// =============================================================================
// Python Module Definition
// =============================================================================

PYBIND11_MODULE(_audioprint, m) {
    m.doc() = "AudioPrint audio feature extraction and embedding bindings";

    // -------------------------------------------------------------------------
    // Enums
    // -------------------------------------------------------------------------

    py::enum_<audioprint::FeatureCategory>(m, "FeatureCategory", "Feature categories")
        .value("RHYTHM", audioprint::FeatureCategory::RHYTHM)
        .value("HARMONY", audioprint::FeatureCategory::HARMONY)
        .value("ENERGY", audioprint::FeatureCategory::ENERGY)
        .value("SPECTRAL", audioprint::FeatureCategory::SPECTRAL)
        .value("FREQUENCY", audioprint::FeatureCategory::FREQUENCY)
        .export_values();

    py::enum_<audioprint::FeedbackCategory>(m, "FeedbackCategory", "Feedback object sections")
        .value("EQ", audioprint::FeedbackCategory::EQ)
        .value("ENERGY", audioprint::FeedbackCategory::ENERGY)
        .value("RHYTHM", audioprint::FeedbackCategory::RHYTHM)
        .value("ARRANGEMENT", audioprint::FeedbackCategory::ARRANGEMENT);

    py::enum_<audioprint::ErrorCode>(m, "ErrorCode", "Error codes")
        .value("OK", audioprint::ErrorCode::OK)
        .value("INVALID_CONFIG", audioprint::ErrorCode::INVALID_CONFIG)
        .value("INVALID_ARGUMENT", audioprint::ErrorCode::INVALID_ARGUMENT)
        .value("FILE_NOT_FOUND", audioprint::ErrorCode::FILE_NOT_FOUND)
        .value("DECODE_FAILED", audioprint::ErrorCode::DECODE_FAILED)
        .value("EMPTY_AUDIO", audioprint::ErrorCode::EMPTY_AUDIO)
        .value("NOT_INITIALIZED", audioprint::ErrorCode::NOT_INITIALIZED)
        .value("ALREADY_INITIALIZED", audioprint::ErrorCode::ALREADY_INITIALIZED)
        .value("EXTRACTION_FAILED", audioprint::ErrorCode::EXTRACTION_FAILED)
        .value("INTERNAL_ERROR", audioprint::ErrorCode::INTERNAL_ERROR)
        .export_values();

    // -------------------------------------------------------------------------
    // Error Info
    // -------------------------------------------------------------------------

    py::class_<audioprint::ErrorInfo>(m, "ErrorInfo", "Error information")
        .def(py::init<>())
        .def_readonly("code", &audioprint::ErrorInfo::code)
        .def_readonly("message", &audioprint::ErrorInfo::message)
        .def_readonly("detail", &audioprint::ErrorInfo::detail)
        .def("is_ok", &audioprint::ErrorInfo::isOk, "Check if no error")
        .def("__bool__", &audioprint::ErrorInfo::isOk)
        .def("__repr__", [](const audioprint::ErrorInfo& e) {
            if (e.isOk()) return std::string("ErrorInfo(OK)");
            return "ErrorInfo(" + e.toString() + ")";
        });

    // -------------------------------------------------------------------------
    // Config
    // -------------------------------------------------------------------------

    py::class_<audioprint::ExtractorConfig>(m, "ExtractorConfig", "Extraction configuration")
        .def(py::init<>())
        .def_readwrite("sample_rate", &audioprint::ExtractorConfig::sample_rate)
        .def_readwrite("n_fft", &audioprint::ExtractorConfig::n_fft)
        .def_readwrite("hop_length", &audioprint::ExtractorConfig::hop_length)
        .def_readwrite("hpss_kernel_size", &audioprint::ExtractorConfig::hpss_kernel_size)
        .def_readwrite("rolloff_percent", &audioprint::ExtractorConfig::rolloff_percent)
        .def_readwrite("parallel_extractors", &audioprint::ExtractorConfig::parallel_extractors)
        .def_readwrite("verbose", &audioprint::ExtractorConfig::verbose)
        .def_static("defaults", &audioprint::ExtractorConfig::defaults)
        .def("with_sample_rate", &audioprint::ExtractorConfig::withSampleRate, py::arg("rate"))
        .def("with_hop_length", &audioprint::ExtractorConfig::withHopLength, py::arg("hop"))
        .def("with_parallel_extraction", &audioprint::ExtractorConfig::withParallelExtraction,
            py::arg("enabled") = true)
        .def("quiet", &audioprint::ExtractorConfig::quiet, "Disable info logging");

    // -------------------------------------------------------------------------
    // Feature Record
    // -------------------------------------------------------------------------

    py::class_<audioprint::TrackMetadata>(m, "TrackMetadata")
        .def_readonly("duration", &audioprint::TrackMetadata::duration)
        .def_readonly("sample_rate", &audioprint::TrackMetadata::sample_rate);

    py::class_<audioprint::FeatureRecord>(m, "FeatureRecord", "Structured feature set of one track")
        .def(py::init<>())
        .def_readonly("metadata", &audioprint::FeatureRecord::metadata)
        .def("has_category", &audioprint::FeatureRecord::hasCategory, py::arg("category"))
        .def("categories", &audioprint::FeatureRecord::categories)
        .def("block", &audioprint::FeatureRecord::block, py::arg("category"))
        .def("to_dict", &audioprint::FeatureRecord::toMap,
            "Nested dict: metadata and every present category")
        .def("all_finite", &audioprint::FeatureRecord::allFinite);

    py::class_<audioprint::TrackAnalysis>(m, "TrackAnalysis", "Per-track storage bundle")
        .def_readonly("file_path", &audioprint::TrackAnalysis::file_path)
        .def_readonly("features", &audioprint::TrackAnalysis::features)
        .def_property_readonly("embedding", [](const audioprint::TrackAnalysis& a) {
            return toNumpy(a.embedding);
        })
        .def_readonly("duration", &audioprint::TrackAnalysis::duration)
        .def_readonly("sample_rate", &audioprint::TrackAnalysis::sample_rate)
        .def_readonly("processing_time_ms", &audioprint::TrackAnalysis::processing_time_ms);

    py::class_<audioprint::FeedbackObject>(m, "FeedbackObject", "Feedback-ready metric groups")
        .def_readonly("metadata", &audioprint::FeedbackObject::metadata)
        .def_readonly("categories", &audioprint::FeedbackObject::categories)
        .def("has_category", &audioprint::FeedbackObject::hasCategory, py::arg("name"))
        .def("to_json", &audioprint::FeedbackObject::toJson);

    // -------------------------------------------------------------------------
    // Feature Engine
    // -------------------------------------------------------------------------

    py::class_<audioprint::FeatureEngine>(m, "FeatureEngine", "Audio feature extraction engine")
        .def(py::init<>())
        .def("initialize", &audioprint::FeatureEngine::initialize,
            py::arg("config") = audioprint::ExtractorConfig::defaults(),
            "Initialize the engine with configuration")
        .def("shutdown", &audioprint::FeatureEngine::shutdown)
        .def("is_initialized", &audioprint::FeatureEngine::isInitialized)
        .def_property_readonly("config", &audioprint::FeatureEngine::getConfig)

        // Release GIL during decoding and analysis
        .def("extract_global_features", [](audioprint::FeatureEngine& self,
                                           const std::string& file_path,
                                           const py::object& max_duration) {
            const double bound = durationBound(max_duration);
            audioprint::FeatureRecord record;
            audioprint::ErrorInfo err;
            {
                py::gil_scoped_release release;
                err = self.extractGlobalFeatures(file_path, bound, record);
            }
            return py::make_tuple(err, record);
        }, py::arg("file_path"), py::arg("max_duration"),
            "Returns (ErrorInfo, FeatureRecord)")

        .def("analyze_track", [](audioprint::FeatureEngine& self,
                                 const std::string& file_path,
                                 const py::object& max_duration) {
            const double bound = durationBound(max_duration);
            audioprint::TrackAnalysis analysis;
            audioprint::ErrorInfo err;
            {
                py::gil_scoped_release release;
                err = self.analyzeTrack(file_path, bound, analysis);
            }
            return py::make_tuple(err, analysis);
        }, py::arg("file_path"), py::arg("max_duration"),
            "Returns (ErrorInfo, TrackAnalysis)")

        // The engine shares ownership, so the callback lives as long as it is installed
        .def("set_callback", [](audioprint::FeatureEngine& self, std::shared_ptr<PyExtractionCallback> cb) {
            self.setSharedCallback(std::move(cb));
        }, py::arg("callback"), "Set extraction callback (None clears it)")

        .def_property_readonly("last_error", &audioprint::FeatureEngine::getLastError)
        .def_static("get_version", &audioprint::FeatureEngine::getVersion, "Get library version");

    // -------------------------------------------------------------------------
    // Python Callback
    // -------------------------------------------------------------------------

    py::class_<PyExtractionCallback, std::shared_ptr<PyExtractionCallback>>(m, "ExtractionCallback",
            "Callback for extraction progress and results")
        .def(py::init<>())
        .def("on_result", &PyExtractionCallback::setOnResult, py::arg("callback"))
        .def("on_error", &PyExtractionCallback::setOnError, py::arg("callback"))
        .def("on_start", &PyExtractionCallback::setOnStart, py::arg("callback"))
        .def("on_complete", &PyExtractionCallback::setOnComplete, py::arg("callback"))
        .def("on_close", &PyExtractionCallback::setOnClose, py::arg("callback"));

    // -------------------------------------------------------------------------
    // Pure functions
    // -------------------------------------------------------------------------

    m.def("create_embedding_vector", [](const audioprint::FeatureRecord& record) {
        return toNumpy(audioprint::createEmbeddingVector(record));
    }, py::arg("record"), "19-dimensional float32 embedding");

    m.def("embedding_field_names", []() {
        std::vector<std::string> names;
        for (std::size_t i = 0; i < audioprint::kEmbeddingDimensions; ++i) {
            names.push_back(audioprint::embeddingFieldName(i));
        }
        return names;
    });

    m.def("filter_feature_set", &audioprint::filterFeatureSet,
        py::arg("record"),
        py::arg("exclude_categories") = std::vector<audioprint::FeatureCategory>{
            audioprint::FeatureCategory::SPECTRAL},
        "Copy of the record without the given categories");

    m.def("build_feedback_object",
        [](const audioprint::FeatureRecord& record, const std::vector<std::string>& categories) {
            return audioprint::buildFeedbackObject(record, categories);
        },
        py::arg("record"),
        py::arg("categories") = std::vector<std::string>{"eq", "energy", "rhythm"},
        "Group features into eq / energy / rhythm / arrangement sections");

    m.attr("__version__") = audioprint::getVersionString();
}
