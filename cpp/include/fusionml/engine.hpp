#ifndef FUSIONML_ENGINE_HPP
#define FUSIONML_ENGINE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "fusionml/config.hpp"
#include "fusionml/ensemble.hpp"
#include "fusionml/feature_scaler.hpp"
#include "fusionml/logging.hpp"
#include "fusionml/sample_buffer.hpp"
#include "fusionml/statistical_scorer.hpp"

namespace fusionml {

struct ScoringModel {
    FeatureScaler scaler;
    std::shared_ptr<const PartitioningEnsemble> ensemble;
    std::uint64_t generation = 0;
    std::size_t training_size = 0;
};

enum class PredictionSource {
    kRejected,
    kColdStart,
    kStatistical,
    kEnsemble,
    kFallback,
};

enum class TrainingStatus {
    kTrained,
    kInsufficientData,
    kFailed,
    kSuperseded,
};

struct Prediction {
    double score = 0.0;
    PredictionSource source = PredictionSource::kRejected;
};

struct EngineStats {
    bool is_trained = false;
    std::uint64_t prediction_count = 0;
    std::uint64_t anomaly_count = 0;
    double anomaly_rate = 0.0;
    std::size_t buffer_size = 0;
    double recent_avg_score = 0.0;
    double threshold = 0.7;
    std::size_t feature_count = 0;
    std::uint64_t model_generation = 0;
};

std::string to_string(PredictionSource source);
std::string to_string(TrainingStatus status);

class AnomalyEngine {
public:
    explicit AnomalyEngine(DetectorConfig config = {},
                           std::shared_ptr<const EnsembleTrainer> trainer = nullptr,
                           Logger logger = get_logger("AnomalyEngine"));
    ~AnomalyEngine();

    AnomalyEngine(const AnomalyEngine&) = delete;
    AnomalyEngine& operator=(const AnomalyEngine&) = delete;

    // Always returns a score in [0, 1]; rejected input scores 0.0.
    double predict(const FeatureVector& features);
    Prediction predict_detailed(const FeatureVector& features);

    TrainingStatus update_model();

    std::shared_future<TrainingStatus> update_model_async();

    void reset();

    EngineStats get_statistics() const;
    bool is_trained() const;
    std::optional<std::size_t> feature_count() const;
    std::size_t buffer_size() const;
    std::shared_ptr<const ScoringModel> current_model() const;
    const DetectorConfig& config() const;

private:
    bool accept(const FeatureVector& features);
    double statistical_score(const FeatureVector& features) const;
    double model_score(const ScoringModel& model, const FeatureVector& features, double statistical) const;
    void record(double score);

    TrainingStatus train_snapshot(const std::vector<FeatureVector>& snapshot, std::uint64_t epoch);
    std::optional<std::uint64_t> publish(std::shared_ptr<ScoringModel> model, std::uint64_t epoch);

    DetectorConfig config_;
    std::shared_ptr<const EnsembleTrainer> trainer_;
    Logger logger_;
    StatisticalScorer statistics_;

    SampleBuffer buffer_;
    std::optional<std::size_t> feature_count_;
    std::deque<double> recent_scores_;
    std::uint64_t prediction_count_ = 0;
    std::uint64_t anomaly_count_ = 0;

    mutable std::mutex model_mutex_;
    std::shared_ptr<const ScoringModel> model_;
    std::uint64_t epoch_ = 0;
    std::uint64_t generation_ = 0;

    std::mutex pending_mutex_;
    std::vector<std::shared_future<TrainingStatus>> pending_;
};

}  // namespace fusionml

#endif  // FUSIONML_ENGINE_HPP
