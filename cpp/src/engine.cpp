#include "fusionml/engine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace fusionml {

namespace {

DetectorConfig checked(DetectorConfig config) {
    if (config.buffer_size <= 0) {
        throw std::invalid_argument("buffer_size must be positive");
    }
    if (config.history_size <= 0) {
        throw std::invalid_argument("history_size must be positive");
    }
    if (config.model_weight < 0.0 || config.model_weight > 1.0) {
        throw std::invalid_argument("model_weight must lie in [0, 1]");
    }
    config.ensemble.min_training_samples = config.min_training_samples;
    return config;
}

double bounded(double score) {
    if (std::isnan(score)) {
        return 0.0;
    }
    return std::clamp(score, 0.0, 1.0);
}

}  // namespace

std::string to_string(PredictionSource source) {
    switch (source) {
        case PredictionSource::kRejected:
            return "rejected";
        case PredictionSource::kColdStart:
            return "cold_start";
        case PredictionSource::kStatistical:
            return "statistical";
        case PredictionSource::kEnsemble:
            return "ensemble";
        case PredictionSource::kFallback:
            return "fallback";
    }
    return "unknown";
}

std::string to_string(TrainingStatus status) {
    switch (status) {
        case TrainingStatus::kTrained:
            return "trained";
        case TrainingStatus::kInsufficientData:
            return "insufficient_data";
        case TrainingStatus::kFailed:
            return "failed";
        case TrainingStatus::kSuperseded:
            return "superseded";
    }
    return "unknown";
}

AnomalyEngine::AnomalyEngine(DetectorConfig config, std::shared_ptr<const EnsembleTrainer> trainer, Logger logger)
    : config_(checked(std::move(config))),
      trainer_(trainer ? std::move(trainer) : std::make_shared<EnsembleTrainer>(config_.ensemble)),
      logger_(std::move(logger)),
      buffer_(static_cast<std::size_t>(config_.buffer_size)) {
    logger_.info("engine_initialized", {{"buffer_size", std::to_string(config_.buffer_size)},
                                        {"threshold", std::to_string(config_.anomaly_threshold)},
                                        {"n_estimators", std::to_string(config_.ensemble.n_estimators)}});
}

AnomalyEngine::~AnomalyEngine() {
    std::vector<std::shared_future<TrainingStatus>> pending;
    {
        std::lock_guard<std::mutex> guard(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& result : pending) {
        result.wait();
    }
}

double AnomalyEngine::predict(const FeatureVector& features) {
    return predict_detailed(features).score;
}

Prediction AnomalyEngine::predict_detailed(const FeatureVector& features) {
    ++prediction_count_;
    if (!accept(features)) {
        return Prediction{0.0, PredictionSource::kRejected};
    }

    buffer_.append(features);
    const double statistical = statistical_score(features);

    if (buffer_.size() < static_cast<std::size_t>(config_.min_training_samples)) {
        record(statistical);
        return Prediction{statistical, PredictionSource::kColdStart};
    }

    if (buffer_.full() && !is_trained()) {
        update_model();
    }

    const auto model = current_model();
    if (!model) {
        record(statistical);
        return Prediction{statistical, PredictionSource::kStatistical};
    }

    try {
        const double score = model_score(*model, features, statistical);
        if (score > config_.anomaly_threshold) {
            ++anomaly_count_;
        }
        record(score);
        return Prediction{score, PredictionSource::kEnsemble};
    } catch (const std::exception& exc) {
        logger_.error("prediction_failed", {{"error", exc.what()}, {"generation", std::to_string(model->generation)}});
        return Prediction{statistical, PredictionSource::kFallback};
    }
}

bool AnomalyEngine::accept(const FeatureVector& features) {
    if (features.empty()) {
        logger_.warn("empty_feature_vector");
        return false;
    }
    const bool finite = std::all_of(features.begin(), features.end(), [](double value) {
        return std::isfinite(value);
    });
    if (!finite) {
        logger_.warn("non_finite_feature_vector", {{"features", std::to_string(features.size())}});
        return false;
    }
    if (!feature_count_.has_value()) {
        feature_count_ = features.size();
        logger_.info("feature_dimension_locked", {{"features", std::to_string(features.size())}});
        return true;
    }
    if (features.size() != feature_count_.value()) {
        logger_.warn("feature_dimension_mismatch", {{"expected", std::to_string(feature_count_.value())},
                                                    {"got", std::to_string(features.size())}});
        return false;
    }
    return true;
}

double AnomalyEngine::statistical_score(const FeatureVector& features) const {
    return bounded(statistics_.score(features, buffer_.history()));
}

double AnomalyEngine::model_score(const ScoringModel& model, const FeatureVector& features,
                                  double statistical) const {
    const FeatureVector scaled = model.scaler.transform(features);
    const double decision = model.ensemble->decision_value(scaled);
    const double normalized = 1.0 / (1.0 + std::exp(-10.0 * (-decision)));
    const double blended = config_.model_weight * normalized + (1.0 - config_.model_weight) * statistical;
    if (!std::isfinite(blended)) {
        throw std::runtime_error("non-finite blended score");
    }
    return bounded(blended);
}

void AnomalyEngine::record(double score) {
    recent_scores_.push_back(score);
    while (recent_scores_.size() > static_cast<std::size_t>(config_.history_size)) {
        recent_scores_.pop_front();
    }
}

TrainingStatus AnomalyEngine::update_model() {
    if (buffer_.size() < static_cast<std::size_t>(config_.min_training_samples)) {
        logger_.warn("insufficient_training_data", {{"samples", std::to_string(buffer_.size())},
                                                    {"required", std::to_string(config_.min_training_samples)}});
        return TrainingStatus::kInsufficientData;
    }
    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> guard(model_mutex_);
        epoch = epoch_;
    }
    return train_snapshot(buffer_.snapshot(), epoch);
}

std::shared_future<TrainingStatus> AnomalyEngine::update_model_async() {
    if (buffer_.size() < static_cast<std::size_t>(config_.min_training_samples)) {
        logger_.warn("insufficient_training_data", {{"samples", std::to_string(buffer_.size())},
                                                    {"required", std::to_string(config_.min_training_samples)}});
        std::promise<TrainingStatus> refused;
        refused.set_value(TrainingStatus::kInsufficientData);
        return refused.get_future().share();
    }

    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> guard(model_mutex_);
        epoch = epoch_;
    }
    auto snapshot = buffer_.snapshot();
    std::shared_future<TrainingStatus> result =
        std::async(std::launch::async, [this, snapshot = std::move(snapshot), epoch]() {
            return train_snapshot(snapshot, epoch);
        }).share();

    std::lock_guard<std::mutex> guard(pending_mutex_);
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [](const std::shared_future<TrainingStatus>& pending) {
                                      return pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                  }),
                   pending_.end());
    pending_.push_back(result);
    return result;
}

TrainingStatus AnomalyEngine::train_snapshot(const std::vector<FeatureVector>& snapshot, std::uint64_t epoch) {
    logger_.info("model_training_started", {{"samples", std::to_string(snapshot.size())}});
    try {
        auto model = std::make_shared<ScoringModel>();
        model->scaler.fit(snapshot);
        const auto scaled = model->scaler.transform_all(snapshot);
        model->ensemble = trainer_->train(scaled);
        if (!model->ensemble) {
            logger_.error("model_training_failed", {{"error", "ensemble rejected the training snapshot"}});
            return TrainingStatus::kFailed;
        }
        model->training_size = snapshot.size();

        std::size_t flagged = 0;
        for (const auto& sample : scaled) {
            if (model->ensemble->decision_value(sample) < 0.0) {
                ++flagged;
            }
        }
        const double ratio = static_cast<double>(flagged) / static_cast<double>(scaled.size());

        const auto generation = publish(std::move(model), epoch);
        if (!generation.has_value()) {
            logger_.info("model_training_superseded", {{"samples", std::to_string(snapshot.size())}});
            return TrainingStatus::kSuperseded;
        }
        logger_.info("model_training_complete", {{"samples", std::to_string(snapshot.size())},
                                                 {"generation", std::to_string(generation.value())},
                                                 {"training_anomaly_ratio", std::to_string(ratio)}});
        return TrainingStatus::kTrained;
    } catch (const std::exception& exc) {
        logger_.error("model_training_failed", {{"error", exc.what()}});
        return TrainingStatus::kFailed;
    }
}

std::optional<std::uint64_t> AnomalyEngine::publish(std::shared_ptr<ScoringModel> model, std::uint64_t epoch) {
    std::lock_guard<std::mutex> guard(model_mutex_);
    if (epoch != epoch_) {
        return std::nullopt;
    }
    model->generation = ++generation_;
    const std::uint64_t generation = model->generation;
    model_ = std::move(model);
    return generation;
}

void AnomalyEngine::reset() {
    buffer_.clear();
    recent_scores_.clear();
    prediction_count_ = 0;
    anomaly_count_ = 0;
    feature_count_.reset();
    {
        std::lock_guard<std::mutex> guard(model_mutex_);
        model_.reset();
        generation_ = 0;
        ++epoch_;
    }
    logger_.info("engine_reset");
}

EngineStats AnomalyEngine::get_statistics() const {
    const auto model = current_model();
    EngineStats stats;
    stats.is_trained = model != nullptr;
    stats.prediction_count = prediction_count_;
    stats.anomaly_count = anomaly_count_;
    stats.anomaly_rate = prediction_count_ > 0
                             ? static_cast<double>(anomaly_count_) / static_cast<double>(prediction_count_)
                             : 0.0;
    stats.buffer_size = buffer_.size();
    stats.recent_avg_score =
        recent_scores_.empty()
            ? 0.0
            : std::accumulate(recent_scores_.begin(), recent_scores_.end(), 0.0) /
                  static_cast<double>(recent_scores_.size());
    stats.threshold = config_.anomaly_threshold;
    stats.feature_count = feature_count_.value_or(0);
    stats.model_generation = model ? model->generation : 0;
    return stats;
}

bool AnomalyEngine::is_trained() const {
    return current_model() != nullptr;
}

std::optional<std::size_t> AnomalyEngine::feature_count() const {
    return feature_count_;
}

std::size_t AnomalyEngine::buffer_size() const {
    return buffer_.size();
}

std::shared_ptr<const ScoringModel> AnomalyEngine::current_model() const {
    std::lock_guard<std::mutex> guard(model_mutex_);
    return model_;
}

const DetectorConfig& AnomalyEngine::config() const {
    return config_;
}

}  // namespace fusionml
