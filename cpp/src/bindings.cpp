#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "fusionml/config.hpp"
#include "fusionml/engine.hpp"
#include "fusionml/features.hpp"
#include "fusionml/statistical_scorer.hpp"

namespace py = pybind11;

PYBIND11_MODULE(fusionml_python, m) {
    m.doc() = "Pybind11 bindings for the fusionml scoring engine.";

    py::class_<fusionml::EnsembleParams>(m, "EnsembleParams")
        .def(py::init<>())
        .def_readwrite("n_estimators", &fusionml::EnsembleParams::n_estimators)
        .def_readwrite("max_samples", &fusionml::EnsembleParams::max_samples)
        .def_readwrite("bootstrap", &fusionml::EnsembleParams::bootstrap)
        .def_readwrite("contamination", &fusionml::EnsembleParams::contamination)
        .def_readwrite("random_seed", &fusionml::EnsembleParams::random_seed)
        .def_readwrite("min_training_samples", &fusionml::EnsembleParams::min_training_samples);

    py::class_<fusionml::DetectorConfig>(m, "DetectorConfig")
        .def(py::init<>())
        .def_readwrite("buffer_size", &fusionml::DetectorConfig::buffer_size)
        .def_readwrite("anomaly_threshold", &fusionml::DetectorConfig::anomaly_threshold)
        .def_readwrite("history_size", &fusionml::DetectorConfig::history_size)
        .def_readwrite("min_training_samples", &fusionml::DetectorConfig::min_training_samples)
        .def_readwrite("model_weight", &fusionml::DetectorConfig::model_weight)
        .def_readwrite("background_retrain", &fusionml::DetectorConfig::background_retrain)
        .def_readwrite("ensemble", &fusionml::DetectorConfig::ensemble);

    py::enum_<fusionml::TrainingStatus>(m, "TrainingStatus")
        .value("TRAINED", fusionml::TrainingStatus::kTrained)
        .value("INSUFFICIENT_DATA", fusionml::TrainingStatus::kInsufficientData)
        .value("FAILED", fusionml::TrainingStatus::kFailed)
        .value("SUPERSEDED", fusionml::TrainingStatus::kSuperseded);

    py::enum_<fusionml::PredictionSource>(m, "PredictionSource")
        .value("REJECTED", fusionml::PredictionSource::kRejected)
        .value("COLD_START", fusionml::PredictionSource::kColdStart)
        .value("STATISTICAL", fusionml::PredictionSource::kStatistical)
        .value("ENSEMBLE", fusionml::PredictionSource::kEnsemble)
        .value("FALLBACK", fusionml::PredictionSource::kFallback);

    py::class_<fusionml::Prediction>(m, "Prediction")
        .def_readonly("score", &fusionml::Prediction::score)
        .def_readonly("source", &fusionml::Prediction::source);

    py::class_<fusionml::EngineStats>(m, "EngineStats")
        .def_readonly("is_trained", &fusionml::EngineStats::is_trained)
        .def_readonly("prediction_count", &fusionml::EngineStats::prediction_count)
        .def_readonly("anomaly_count", &fusionml::EngineStats::anomaly_count)
        .def_readonly("anomaly_rate", &fusionml::EngineStats::anomaly_rate)
        .def_readonly("buffer_size", &fusionml::EngineStats::buffer_size)
        .def_readonly("recent_avg_score", &fusionml::EngineStats::recent_avg_score)
        .def_readonly("threshold", &fusionml::EngineStats::threshold)
        .def_readonly("feature_count", &fusionml::EngineStats::feature_count)
        .def_readonly("model_generation", &fusionml::EngineStats::model_generation);

    py::class_<fusionml::AnomalyEngine, std::shared_ptr<fusionml::AnomalyEngine>>(m, "AnomalyEngine")
        .def(py::init([](const fusionml::DetectorConfig& config) {
                 return std::make_shared<fusionml::AnomalyEngine>(config);
             }),
             py::arg("config") = fusionml::DetectorConfig{})
        .def("predict", &fusionml::AnomalyEngine::predict)
        .def("predict_detailed", &fusionml::AnomalyEngine::predict_detailed)
        .def("update_model", &fusionml::AnomalyEngine::update_model)
        .def("reset", &fusionml::AnomalyEngine::reset)
        .def("get_statistics", &fusionml::AnomalyEngine::get_statistics)
        .def_property_readonly("is_trained", &fusionml::AnomalyEngine::is_trained)
        .def_property_readonly("feature_count", &fusionml::AnomalyEngine::feature_count)
        .def_property_readonly("buffer_size", &fusionml::AnomalyEngine::buffer_size);

    py::class_<fusionml::StatisticalScorer>(m, "StatisticalScorer")
        .def(py::init<std::size_t, double, double>(), py::arg("min_history") = 5, py::arg("epsilon") = 1e-6,
             py::arg("saturation_z") = 3.0)
        .def("score", &fusionml::StatisticalScorer::score);

    m.def("extract_features", &fusionml::extract_features_from_text, py::arg("payload"));
    m.attr("SENSOR_FEATURE_NAMES") = py::cast(std::vector<std::string>(fusionml::kSensorFeatureNames.begin(),
                                                                       fusionml::kSensorFeatureNames.end()));
}
