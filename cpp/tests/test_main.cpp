#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "fusionml/api.hpp"
#include "fusionml/config.hpp"
#include "fusionml/engine.hpp"
#include "fusionml/ensemble.hpp"
#include "fusionml/feature_scaler.hpp"
#include "fusionml/features.hpp"
#include "fusionml/logging.hpp"
#include "fusionml/observability.hpp"
#include "fusionml/sample_buffer.hpp"
#include "fusionml/service.hpp"
#include "fusionml/session.hpp"
#include "fusionml/statistical_scorer.hpp"
#include "fusionml/transport.hpp"
#include "fusionml/websocket_transport.hpp"

namespace {

int failures = 0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        failures += 1;
    }
}

void expect_near(double value, double expected, double tolerance, const std::string& message) {
    if (std::fabs(value - expected) > tolerance) {
        std::cerr << "FAIL: " << message << " (got " << value << ", expected " << expected << ")\n";
        failures += 1;
    }
}

bool wait_until(const std::function<bool()>& predicate, double timeout_s = 5.0) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::duration<double>(timeout_s);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// Tight gaussian cluster around the origin.
const fusionml::FeatureVector& cluster_point(int i) {
    static const std::vector<fusionml::FeatureVector> points = []() {
        std::mt19937 rng(7);
        std::normal_distribution<double> noise(0.0, 0.05);
        std::vector<fusionml::FeatureVector> generated;
        for (int n = 0; n < 100; ++n) {
            const double x = noise(rng);
            const double y = noise(rng);
            const double z = noise(rng);
            generated.push_back({x, y, z});
        }
        return generated;
    }();
    return points[static_cast<std::size_t>(i) % points.size()];
}

nlohmann::json sensor_payload(int i) {
    return {
        {"timestamp", "2024-01-01T00:00:" + std::to_string(i % 60)},
        {"orientation", {{"w", 1.0}, {"x", 0.0}, {"y", 0.0}, {"z", 0.0}}},
        {"raw_acceleration", {{"x", 0.1 * std::sin(i * 0.7)}, {"y", 0.1 * std::cos(i * 0.4)}, {"z", 9.81}}},
        {"raw_gyroscope", {{"x", 0.01 * std::sin(i * 1.1)}, {"y", 0.0}, {"z", 0.02 * std::cos(i)}}},
        {"euler_degrees", {1.0 + std::sin(i), 2.0, 90.0 + std::cos(i * 0.3)}},
        {"velocity", {{"x", 3.0}, {"y", 4.0}, {"z", 0.0}}},
        {"gps_speed", 5.0 + 0.1 * std::sin(i * 0.2)},
        {"gps_heading", 180.0},
        {"confidence", 0.95},
        {"system_health", 1.0},
    };
}

double metric_value(const std::vector<std::pair<std::string, double>>& metrics, const std::string& name) {
    for (const auto& [key, value] : metrics) {
        if (key == name) {
            return value;
        }
    }
    return std::numeric_limits<double>::quiet_NaN();
}

// Scripted in-process transport. Each script entry is one connect() call:
// std::nullopt refuses the connection, otherwise a channel delivering the
// given frames is opened. A drained channel either waits or reports a peer
// close; fail_when_drained turns the close into a transport error.
struct ChannelScript {
    std::vector<std::string> frames;
    bool hold_open = true;
    bool fail_when_drained = false;
    double close_delay_s = 0.0;
    double send_delay_s = 0.0;
};

struct FakeLink {
    std::mutex mutex;
    std::condition_variable ready;
    std::deque<std::string> inbound;
    std::vector<std::string> sent;
    bool closed = false;
    bool hold_open = true;
    bool fail_when_drained = false;
    double close_delay_s = 0.0;
    double send_delay_s = 0.0;

    std::vector<std::string> sent_frames() {
        std::lock_guard<std::mutex> guard(mutex);
        return sent;
    }
};

class FakeChannel : public fusionml::MessageChannel {
public:
    explicit FakeChannel(std::shared_ptr<FakeLink> link) : link_(std::move(link)) {}

    std::optional<std::string> receive() override {
        std::unique_lock<std::mutex> lock(link_->mutex);
        link_->ready.wait(lock, [this]() { return readable(); });
        return take_locked();
    }

    std::optional<std::string> receive_for(double timeout_s) override {
        std::unique_lock<std::mutex> lock(link_->mutex);
        const auto limit = std::chrono::duration<double>(timeout_s);
        if (!link_->ready.wait_for(lock, limit, [this]() { return readable(); })) {
            throw fusionml::TransportError("receive timed out");
        }
        return take_locked();
    }

    void send(const std::string& frame) override {
        std::this_thread::sleep_for(std::chrono::duration<double>(link_->send_delay_s));
        std::lock_guard<std::mutex> guard(link_->mutex);
        if (link_->closed) {
            throw fusionml::TransportError("channel closed");
        }
        link_->sent.push_back(frame);
    }

    // A polite close waits close_delay_s for the peer's acknowledgement.
    void close() override {
        std::this_thread::sleep_for(std::chrono::duration<double>(link_->close_delay_s));
        abort();
    }

    void abort() override {
        {
            std::lock_guard<std::mutex> guard(link_->mutex);
            link_->closed = true;
        }
        link_->ready.notify_all();
    }

private:
    bool readable() const {
        return !link_->inbound.empty() || link_->closed || !link_->hold_open || link_->fail_when_drained;
    }

    std::optional<std::string> take_locked() {
        if (link_->closed) {
            return std::nullopt;
        }
        if (link_->inbound.empty()) {
            if (link_->fail_when_drained) {
                throw fusionml::TransportError("connection reset by peer");
            }
            return std::nullopt;
        }
        std::string frame = std::move(link_->inbound.front());
        link_->inbound.pop_front();
        return frame;
    }

    std::shared_ptr<FakeLink> link_;
};

class FakeTransport : public fusionml::Transport {
public:
    explicit FakeTransport(std::vector<std::optional<ChannelScript>> script) : script_(script.begin(), script.end()) {}

    std::unique_ptr<fusionml::MessageChannel> connect(const std::string& url) override {
        std::lock_guard<std::mutex> guard(mutex_);
        ++connects_;
        if (script_.empty()) {
            throw fusionml::TransportError("connection refused: " + url);
        }
        auto next = std::move(script_.front());
        script_.pop_front();
        if (!next.has_value()) {
            throw fusionml::TransportError("connection refused: " + url);
        }
        auto link = std::make_shared<FakeLink>();
        link->inbound.assign(next->frames.begin(), next->frames.end());
        link->hold_open = next->hold_open;
        link->fail_when_drained = next->fail_when_drained;
        link->close_delay_s = next->close_delay_s;
        link->send_delay_s = next->send_delay_s;
        links_.push_back(link);
        return std::make_unique<FakeChannel>(link);
    }

    std::shared_ptr<FakeLink> link(std::size_t index) {
        std::lock_guard<std::mutex> guard(mutex_);
        return index < links_.size() ? links_[index] : nullptr;
    }

    int connects() {
        std::lock_guard<std::mutex> guard(mutex_);
        return connects_;
    }

private:
    std::mutex mutex_;
    std::deque<std::optional<ChannelScript>> script_;
    std::vector<std::shared_ptr<FakeLink>> links_;
    int connects_ = 0;
};

class NullTrainer : public fusionml::EnsembleTrainer {
public:
    using fusionml::EnsembleTrainer::EnsembleTrainer;

    std::shared_ptr<const fusionml::PartitioningEnsemble> train(
        const std::vector<fusionml::FeatureVector>&) const override {
        return nullptr;
    }
};

class ThrowingTrainer : public fusionml::EnsembleTrainer {
public:
    using fusionml::EnsembleTrainer::EnsembleTrainer;

    std::shared_ptr<const fusionml::PartitioningEnsemble> train(
        const std::vector<fusionml::FeatureVector>&) const override {
        throw std::runtime_error("numerical failure");
    }
};

void test_sample_buffer() {
    fusionml::SampleBuffer buffer(3);
    expect_true(buffer.empty(), "buffer starts empty");
    for (int i = 0; i < 5; ++i) {
        buffer.append({static_cast<double>(i)});
    }
    expect_true(buffer.size() == 3, "buffer bounded by capacity");
    expect_true(buffer.full(), "buffer full");
    auto snapshot = buffer.snapshot();
    expect_near(snapshot.front()[0], 2.0, 1e-12, "buffer evicts oldest first");
    expect_near(buffer.latest()[0], 4.0, 1e-12, "buffer latest");
    expect_true(buffer.history().size() == 2, "history excludes latest");

    bool threw = false;
    try {
        fusionml::SampleBuffer invalid(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect_true(threw, "zero capacity rejected");
}

void test_statistical_scorer() {
    fusionml::StatisticalScorer scorer;
    std::vector<fusionml::FeatureVector> history(4, fusionml::FeatureVector{1.0, 2.0});
    expect_near(scorer.score({50.0, 50.0}, history), 0.0, 1e-12, "scorer needs five history samples");

    history = {{0.0}, {2.0}, {0.0}, {2.0}, {0.0}, {2.0}};
    // mean 1, population stddev 1: z of 4.0 is 3 and saturates.
    expect_near(scorer.score({4.0}, history), 1.0, 1e-5, "scorer saturates at three sigma");
    expect_near(scorer.score({2.5}, history), 0.5, 1e-5, "scorer scales z by three");
}

void test_engine_scoring_example() {
    fusionml::AnomalyEngine engine;
    for (int i = 0; i < 25; ++i) {
        const double score = engine.predict({0.0, 0.0, 0.0});
        if (i < 20) {
            expect_true(score <= 0.7, "steady stream stays below threshold");
        }
    }
    expect_near(engine.predict({100.0, 100.0, 100.0}), 1.0, 1e-9, "spike after flat stream scores 1.0");
    auto stats = engine.get_statistics();
    expect_true(stats.prediction_count == 26, "prediction count");
    expect_true(!stats.is_trained, "not trained below capacity");
}

void test_engine_cold_start_matches_statistics() {
    fusionml::AnomalyEngine engine;
    fusionml::StatisticalScorer scorer;
    std::vector<fusionml::FeatureVector> seen;
    for (int i = 0; i < 19; ++i) {
        auto sample = cluster_point(i);
        auto prediction = engine.predict_detailed(sample);
        expect_true(prediction.source == fusionml::PredictionSource::kColdStart, "cold start source");
        expect_near(prediction.score, scorer.score(sample, seen), 1e-12, "cold start uses statistical score");
        seen.push_back(sample);
    }
    auto next = engine.predict_detailed(cluster_point(19));
    expect_true(next.source == fusionml::PredictionSource::kStatistical, "statistical source until trained");
}

void test_engine_dimension_lock() {
    fusionml::AnomalyEngine engine;
    expect_near(engine.predict({1.0, 2.0, 3.0}), 0.0, 1e-12, "first vector scores zero");
    expect_true(engine.feature_count().value_or(0) == 3, "dimension locked");

    auto mismatch = engine.predict_detailed({1.0, 2.0});
    expect_true(mismatch.source == fusionml::PredictionSource::kRejected, "mismatched dimension rejected");
    expect_near(mismatch.score, 0.0, 1e-12, "rejected scores zero");
    expect_true(engine.predict_detailed({}).source == fusionml::PredictionSource::kRejected, "empty rejected");
    expect_true(engine.predict_detailed({1.0, std::nan(""), 3.0}).source == fusionml::PredictionSource::kRejected,
                "non-finite rejected");

    auto stats = engine.get_statistics();
    expect_true(stats.buffer_size == 1, "rejected vectors not buffered");
    expect_true(stats.prediction_count == 4, "rejected calls still counted");
}

void test_engine_training_gate() {
    fusionml::AnomalyEngine engine;
    for (int i = 0; i < 10; ++i) {
        engine.predict(cluster_point(i));
    }
    expect_true(engine.update_model() == fusionml::TrainingStatus::kInsufficientData, "refuses below 20 samples");
    expect_true(!engine.is_trained(), "still untrained");
}

void test_engine_detects_outlier_after_training() {
    fusionml::AnomalyEngine engine;
    for (int i = 0; i < 40; ++i) {
        engine.predict(cluster_point(i));
    }
    expect_true(engine.update_model() == fusionml::TrainingStatus::kTrained, "trains on 40 samples");
    expect_true(engine.is_trained(), "trained after update");

    auto inlier = engine.predict_detailed({0.01, -0.02, 0.0});
    expect_true(inlier.source == fusionml::PredictionSource::kEnsemble, "ensemble source once trained");
    expect_true(inlier.score < 0.7, "inlier below threshold");

    auto outlier = engine.predict_detailed({100.0, 100.0, 100.0});
    expect_true(outlier.score > 0.7, "outlier above threshold");
    expect_true(engine.get_statistics().anomaly_count == 1, "anomaly counted");
}

void test_engine_inline_training_at_capacity() {
    fusionml::AnomalyEngine engine;
    for (int i = 0; i < 49; ++i) {
        engine.predict(cluster_point(i));
    }
    expect_true(!engine.is_trained(), "untrained before buffer fills");
    engine.predict(cluster_point(49));
    expect_true(engine.is_trained(), "trains when buffer fills");
    expect_true(engine.get_statistics().model_generation == 1, "first generation");
}

void test_engine_trainer_failures() {
    std::vector<std::shared_ptr<const fusionml::EnsembleTrainer>> trainers = {
        std::make_shared<NullTrainer>(),
        std::make_shared<ThrowingTrainer>(),
    };
    for (const auto& trainer : trainers) {
        fusionml::AnomalyEngine engine(fusionml::DetectorConfig{}, trainer);
        bool bounded = true;
        for (int i = 0; i < 60; ++i) {
            auto sample = cluster_point(i);
            if (i == 55) {
                sample = {50.0, -50.0, 50.0};
            }
            const double score = engine.predict(sample);
            bounded = bounded && score >= 0.0 && score <= 1.0;
        }
        expect_true(bounded, "scores bounded while training fails");
        expect_true(!engine.is_trained(), "failed training leaves engine untrained");
        expect_true(engine.update_model() == fusionml::TrainingStatus::kFailed, "failed training reported");
    }
}

void test_engine_reset() {
    std::vector<fusionml::FeatureVector> sequence;
    for (int i = 0; i < 60; ++i) {
        sequence.push_back(i == 57 ? fusionml::FeatureVector{3.0, 3.0, 3.0} : cluster_point(i));
    }

    fusionml::AnomalyEngine used;
    for (int i = 0; i < 55; ++i) {
        used.predict({static_cast<double>(i), 1.0});
    }
    used.reset();
    used.reset();
    expect_true(!used.is_trained(), "reset drops model");
    expect_true(!used.feature_count().has_value(), "reset forgets dimension");

    fusionml::AnomalyEngine fresh;
    bool identical = true;
    for (const auto& sample : sequence) {
        identical = identical && std::fabs(used.predict(sample) - fresh.predict(sample)) < 1e-12;
    }
    expect_true(identical, "reset engine scores like a fresh one");

    auto a = used.get_statistics();
    auto b = fresh.get_statistics();
    expect_true(a.prediction_count == b.prediction_count, "reset prediction count");
    expect_true(a.anomaly_count == b.anomaly_count, "reset anomaly count");
    expect_true(a.buffer_size == b.buffer_size, "reset buffer size");
    expect_true(a.is_trained == b.is_trained, "reset trained flag");
    expect_true(a.model_generation == b.model_generation, "reset generation");
    expect_near(a.recent_avg_score, b.recent_avg_score, 1e-12, "reset recent average");
}

void test_engine_async_retrain() {
    fusionml::DetectorConfig config;
    config.background_retrain = true;
    fusionml::AnomalyEngine engine(config);
    for (int i = 0; i < 30; ++i) {
        engine.predict(cluster_point(i));
    }

    auto first = engine.update_model_async();
    expect_true(first.get() == fusionml::TrainingStatus::kTrained, "async round trains");
    auto model = engine.current_model();
    expect_true(model != nullptr, "model published");
    if (model) {
        expect_true(model->scaler.feature_count() == model->ensemble->feature_count(),
                    "scaler and ensemble published together");
        expect_true(model->generation == 1, "first async generation");
    }

    for (int i = 30; i < 40; ++i) {
        engine.predict(cluster_point(i));
    }
    expect_true(engine.update_model_async().get() == fusionml::TrainingStatus::kTrained, "second async round");
    auto second = engine.current_model();
    expect_true(second && model && second->generation > model->generation, "generation increases");
    if (model) {
        expect_true(model->training_size == 30, "earlier model untouched by later round");
    }

    auto racing = engine.update_model_async();
    engine.reset();
    const auto status = racing.get();
    expect_true(status == fusionml::TrainingStatus::kTrained || status == fusionml::TrainingStatus::kSuperseded,
                "racing round trained or superseded");
    expect_true(!engine.is_trained(), "reset wins over in-flight training");
}

void test_engine_predict_during_async_retrain() {
    fusionml::DetectorConfig config;
    config.background_retrain = true;
    config.ensemble.n_estimators = 25;
    fusionml::AnomalyEngine engine(config);

    std::atomic<bool> done{false};
    std::atomic<int> mismatched{0};
    std::atomic<int> regressions{0};
    std::atomic<int> observed{0};
    std::thread observer([&]() {
        std::uint64_t last_generation = 0;
        while (!done) {
            const auto model = engine.current_model();
            if (model) {
                ++observed;
                if (!model->ensemble || model->scaler.feature_count() != model->ensemble->feature_count() ||
                    model->training_size != model->ensemble->training_size()) {
                    ++mismatched;
                }
                if (model->generation < last_generation) {
                    ++regressions;
                }
                last_generation = model->generation;
            }
            std::this_thread::yield();
        }
    });

    std::vector<std::shared_future<fusionml::TrainingStatus>> rounds;
    int out_of_range = 0;
    for (int i = 0; i < 200; ++i) {
        const auto point = i % 25 == 24 ? fusionml::FeatureVector{3.0, -3.0, 3.0} : cluster_point(i);
        const auto prediction = engine.predict_detailed(point);
        if (!(prediction.score >= 0.0 && prediction.score <= 1.0)) {
            ++out_of_range;
        }
        if (i >= 30 && i % 10 == 0) {
            rounds.push_back(engine.update_model_async());
        }
    }
    int trained = 0;
    for (auto& round : rounds) {
        if (round.get() == fusionml::TrainingStatus::kTrained) {
            ++trained;
        }
    }
    done = true;
    observer.join();

    expect_true(out_of_range == 0, "scores stay in [0, 1] while rounds are in flight");
    expect_true(trained == static_cast<int>(rounds.size()), "every background round publishes");
    expect_true(observed.load() > 0, "observer saw a published model");
    expect_true(mismatched.load() == 0, "published scaler, ensemble and size always agree");
    expect_true(regressions.load() == 0, "published generation never goes backwards");
    const auto last = engine.current_model();
    expect_true(last && last->generation >= rounds.size(), "every round bumped the generation");
}

void test_ensemble() {
    std::vector<fusionml::FeatureVector> cluster;
    for (int i = 0; i < 40; ++i) {
        auto point = cluster_point(i);
        cluster.push_back({point[0], point[1]});
    }

    fusionml::PartitioningEnsemble small;
    expect_true(!small.fit(std::vector<fusionml::FeatureVector>(cluster.begin(), cluster.begin() + 19)),
                "ensemble refuses 19 samples");
    expect_true(!small.trained(), "refused ensemble untrained");

    auto poisoned = cluster;
    poisoned[5][1] = std::nan("");
    fusionml::PartitioningEnsemble nan_ensemble;
    expect_true(!nan_ensemble.fit(poisoned), "ensemble refuses non-finite input");

    fusionml::PartitioningEnsemble constant;
    constant.fit(std::vector<fusionml::FeatureVector>(30, fusionml::FeatureVector{1.0, 1.0}));
    if (constant.trained()) {
        expect_true(std::isfinite(constant.score({1.0, 1.0})), "constant data scores finite");
    }

    fusionml::PartitioningEnsemble ensemble;
    expect_true(ensemble.fit(cluster), "ensemble fits cluster");
    expect_true(ensemble.tree_count() == 100, "default tree count");
    expect_true(ensemble.score({10.0, 10.0}) > ensemble.score({0.0, 0.0}), "outlier scores above inlier");
    expect_true(ensemble.decision_value({10.0, 10.0}) < 0.0, "outlier decision negative");

    fusionml::PartitioningEnsemble again;
    again.fit(cluster);
    expect_near(again.score({0.05, 0.05}), ensemble.score({0.05, 0.05}), 1e-12, "seeded fit is reproducible");

    expect_near(fusionml::average_path_length(1), 0.0, 1e-12, "c(1)");
    expect_near(fusionml::average_path_length(2), 1.0, 1e-12, "c(2)");
}

void test_ensemble_structure() {
    std::vector<fusionml::FeatureVector> cluster;
    for (int i = 0; i < 64; ++i) {
        cluster.push_back(cluster_point(i));
    }

    std::vector<std::size_t> indices(32);
    for (std::size_t i = 0; i < indices.size(); ++i) {
        indices[i] = i;
    }
    std::mt19937 rng(3);
    const int max_depth = static_cast<int>(std::ceil(std::log2(32.0)));
    const auto tree = fusionml::IsolationTree::build(cluster, indices, max_depth, rng);
    expect_true(tree.height() <= max_depth, "tree height bounded by ceil(log2(psi))");
    expect_true(tree.node_count() >= 1 && tree.node_count() <= 63, "tree node count within a full binary tree");
    expect_true(tree.path_length(cluster_point(0)) <= max_depth + fusionml::average_path_length(32),
                "path length bounded by height plus leaf correction");

    fusionml::EnsembleParams params;
    params.n_estimators = 30;
    params.max_samples = 16;
    fusionml::EnsembleTrainer trainer(params);
    expect_true(trainer.params().n_estimators == 30, "trainer keeps its parameters");
    const auto ensemble = trainer.train(cluster);
    expect_true(ensemble != nullptr, "trainer fits cluster");
    if (ensemble) {
        expect_true(ensemble->params().max_samples.value_or(0) == 16, "ensemble keeps its parameters");
        expect_true(ensemble->training_size() == 64, "training size is the whole snapshot");
        expect_true(ensemble->subsample_size() == 16, "subsample capped by max_samples");
        expect_true(ensemble->tree_count() == 30, "tree count");
        expect_true(ensemble->offset() > 0.0 && ensemble->offset() <= 1.0, "contamination offset in (0, 1]");
    }

    params.contamination = std::nullopt;
    fusionml::PartitioningEnsemble automatic(params);
    expect_true(automatic.fit(cluster), "auto contamination fits");
    expect_near(automatic.offset(), 0.5, 1e-12, "auto contamination offset");

    fusionml::StatisticalScorer scorer;
    expect_true(scorer.min_history() == 5, "default minimum history");
    expect_true(fusionml::get_logger("ensemble_test").name() == "ensemble_test", "logger keeps its name");
}

void test_feature_scaler() {
    fusionml::FeatureScaler scaler;
    bool threw = false;
    try {
        scaler.transform({1.0});
    } catch (const std::logic_error&) {
        threw = true;
    }
    expect_true(threw, "unfitted scaler throws");

    scaler.fit({{1.0, 5.0}, {2.0, 5.0}, {3.0, 5.0}});
    expect_near(scaler.means()[0], 2.0, 1e-12, "scaler mean");
    expect_near(scaler.stddevs()[1], fusionml::FeatureScaler::kMinStddev, 1e-24, "zero variance floored");
    auto scaled = scaler.transform({3.0, 5.0});
    expect_near(scaled[0], std::sqrt(1.5), 1e-9, "scaled value");
    expect_near(scaled[1], 0.0, 1e-12, "constant column scales to zero");
}

void test_feature_extraction() {
    auto features = fusionml::extract_features(sensor_payload(0));
    expect_true(features.size() == fusionml::kSensorFeatureCount, "fourteen features");
    expect_near(features[2], 9.81, 1e-12, "accel z");
    expect_near(features[6], 1.0, 1e-12, "roll");
    expect_near(features[9], 5.0, 1e-12, "velocity norm");
    expect_near(features[11], 180.0, 1e-12, "gps heading");
    expect_near(features[12], 0.95, 1e-12, "confidence");

    auto defaults = fusionml::extract_features(nlohmann::json{{"timestamp", "t"}, {"orientation", nullptr}});
    expect_near(defaults[0], 0.0, 1e-12, "absent accel defaults");
    expect_near(defaults[12], 1.0, 1e-12, "confidence defaults to 1");
    expect_near(defaults[13], 1.0, 1e-12, "system health defaults to 1");

    auto short_euler = fusionml::extract_features(nlohmann::json{{"euler_degrees", {10.0, 20.0}}});
    expect_near(short_euler[6], 0.0, 1e-12, "short euler array ignored");

    auto broken = fusionml::extract_features(nlohmann::json{{"raw_acceleration", "fast"}, {"confidence", 0.5}});
    bool zeros = broken.size() == fusionml::kSensorFeatureCount;
    for (double value : broken) {
        zeros = zeros && value == 0.0;
    }
    expect_true(zeros, "structural failure yields zeros");

    auto garbage = fusionml::extract_features_from_text("not json");
    expect_true(garbage.size() == fusionml::kSensorFeatureCount && garbage[12] == 0.0, "unparseable text zeros");
}

void test_config() {
    const auto path = std::filesystem::temp_directory_path() / "fusionml_test_config.toml";
    {
        std::ofstream file(path);
        file << "[logging]\n"
             << "level = \"ERROR\"\n"
             << "json = false\n"
             << "[metrics]\n"
             << "enabled = false\n"
             << "port = 9100\n"
             << "[detector]\n"
             << "buffer_size = 80  # samples\n"
             << "anomaly_threshold = 0.8\n"
             << "n_estimators = 50\n"
             << "max_samples = 64\n"
             << "contamination = auto\n"
             << "random_seed = 7\n"
             << "background_retrain = true\n"
             << "unknown_key = 3\n"
             << "[stream]\n"
             << "url = \"ws://10.0.0.2:9000/sensors\"\n"
             << "reconnect_interval_s = 1.5\n"
             << "connect_timeout_s = 2.5\n"
             << "[service]\n"
             << "model_update_interval = 25\n"
             << "heartbeat_interval_s = 10\n"
             << "progress_interval = 5\n";
    }
    auto settings = fusionml::ServiceSettings::from_toml(path.string());
    expect_true(settings.logging.level == "ERROR" && !settings.logging.json, "logging section");
    expect_true(!settings.metrics.enabled && settings.metrics.port == 9100, "metrics section");
    expect_true(settings.detector.buffer_size == 80, "buffer size");
    expect_near(settings.detector.anomaly_threshold, 0.8, 1e-12, "threshold");
    expect_true(settings.detector.ensemble.n_estimators == 50, "estimators");
    expect_true(settings.detector.ensemble.max_samples.value_or(0) == 64, "max samples");
    expect_true(!settings.detector.ensemble.contamination.has_value(), "auto contamination");
    expect_true(settings.detector.ensemble.random_seed == 7, "seed");
    expect_true(settings.detector.background_retrain, "background retrain");
    expect_true(settings.stream.url == "ws://10.0.0.2:9000/sensors", "stream url");
    expect_near(settings.stream.reconnect_interval_s, 1.5, 1e-12, "reconnect interval");
    expect_near(settings.stream.connect_timeout_s, 2.5, 1e-12, "connect timeout");
    expect_true(settings.service.model_update_interval == 25, "update interval");
    expect_near(settings.service.heartbeat_interval_s, 10.0, 1e-12, "heartbeat interval");
    expect_true(settings.service.progress_interval == 5, "progress interval");

    {
        std::ofstream file(path);
        file << "[detector]\nbuffer_size = many\n";
    }
    bool threw = false;
    try {
        fusionml::ServiceSettings::from_toml(path.string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "malformed integer rejected");
    std::filesystem::remove(path);

    threw = false;
    try {
        fusionml::ServiceSettings::from_toml("/nonexistent/fusionml.toml");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "missing file rejected");

    fusionml::ServiceSettings defaults;
    defaults.validate();
    expect_true(defaults.stream.url == "ws://127.0.0.1:8080", "default url");

    auto invalid = defaults;
    invalid.detector.anomaly_threshold = 1.5;
    threw = false;
    try {
        invalid.validate();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "threshold out of range rejected");

    invalid = defaults;
    invalid.stream.url = "wss://secure.example";
    threw = false;
    try {
        invalid.validate();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "non ws url rejected");

    invalid = defaults;
    invalid.stream.connect_timeout_s = 0.0;
    threw = false;
    try {
        invalid.validate();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "zero connect timeout rejected");
}

void test_websocket_url() {
    auto endpoint = fusionml::parse_websocket_url("ws://localhost:8080/stream");
    expect_true(endpoint.host == "localhost" && endpoint.port == "8080" && endpoint.target == "/stream",
                "full websocket url");
    auto bare = fusionml::parse_websocket_url("ws://example.org");
    expect_true(bare.port == "80" && bare.target == "/", "default port and target");

    for (const std::string url : {"http://example.org", "wss://example.org", "ws://:80", "ws://host:abc"}) {
        bool threw = false;
        try {
            fusionml::parse_websocket_url(url);
        } catch (const fusionml::TransportError&) {
            threw = true;
        }
        expect_true(threw, "rejects url " + url);
    }
}

void test_session_reconnect_sequence() {
    ChannelScript channel;
    channel.frames = {R"({"type":"connection","status":"connected"})", "garbage{",
                      sensor_payload(1).dump()};
    auto transport = std::make_shared<FakeTransport>(
        std::vector<std::optional<ChannelScript>>{std::nullopt, channel});

    fusionml::StreamConfig config;
    config.reconnect_interval_s = 0.01;
    auto session = std::make_shared<fusionml::StreamSession>(transport, config);

    std::mutex states_mutex;
    std::vector<fusionml::SessionState> states;
    session->set_state_listener([&](fusionml::SessionState state) {
        std::lock_guard<std::mutex> guard(states_mutex);
        states.push_back(state);
    });
    std::atomic<int> handled{0};
    session->set_data_handler([&](const nlohmann::json& payload) {
        expect_true(payload.contains("orientation"), "handler receives sensor payload");
        session->send_prediction(0.25);
        ++handled;
    });

    std::thread runner([&]() { session->run(); });
    expect_true(wait_until([&]() { return handled.load() == 1; }), "sensor frame dispatched");
    expect_true(session->state() == fusionml::SessionState::kConnected, "connected after greeting");

    session->disconnect();
    runner.join();

    std::vector<fusionml::SessionState> expected = {
        fusionml::SessionState::kConnecting, fusionml::SessionState::kReconnectWaiting,
        fusionml::SessionState::kConnecting, fusionml::SessionState::kConnected,
        fusionml::SessionState::kClosed,
    };
    {
        std::lock_guard<std::mutex> guard(states_mutex);
        expect_true(states == expected, "session state sequence");
    }

    auto stats = session->stats();
    expect_true(stats.connect_attempts == 2, "two connect attempts");
    expect_true(stats.reconnect_count == 1, "one reconnect");
    expect_true(stats.messages_received == 2, "greeting not counted, garbage counted");
    expect_true(stats.messages_sent == 1, "one prediction sent");

    auto link = transport->link(0);
    expect_true(link != nullptr, "channel opened");
    if (link) {
        auto sent = link->sent_frames();
        expect_true(sent.size() == 1, "one frame on the wire");
        if (!sent.empty()) {
            auto message = nlohmann::json::parse(sent.front());
            expect_true(message.value("type", "") == "anomaly_prediction", "prediction message type");
            expect_near(message.value("score", -1.0), 0.25, 1e-12, "prediction message score");
            expect_true(message.value("timestamp", "").find("+00:00") != std::string::npos, "utc timestamp");
        }
    }

    session->send_heartbeat();
    expect_true(session->stats().messages_sent == 1, "no sends after close");
}

void test_session_reconnects_after_peer_close() {
    for (const bool reset : {false, true}) {
        const std::string label = reset ? " (transport error)" : " (peer close)";
        ChannelScript first;
        first.frames = {R"({"type":"connection","status":"connected"})", sensor_payload(1).dump()};
        first.hold_open = false;
        first.fail_when_drained = reset;
        ChannelScript second;
        second.frames = {R"({"type":"connection","status":"connected"})"};
        auto transport =
            std::make_shared<FakeTransport>(std::vector<std::optional<ChannelScript>>{first, second});

        fusionml::StreamConfig config;
        config.reconnect_interval_s = 0.01;
        fusionml::StreamSession session(transport, config);

        std::mutex states_mutex;
        std::vector<fusionml::SessionState> states;
        session.set_state_listener([&](fusionml::SessionState state) {
            std::lock_guard<std::mutex> guard(states_mutex);
            states.push_back(state);
        });
        std::atomic<int> handled{0};
        session.set_data_handler([&](const nlohmann::json&) { ++handled; });

        std::thread runner([&]() { session.run(); });
        expect_true(wait_until([&]() {
                        return transport->link(1) != nullptr &&
                               session.state() == fusionml::SessionState::kConnected;
                    }),
                    "second channel connected" + label);
        session.disconnect();
        runner.join();

        const std::vector<fusionml::SessionState> expected = {
            fusionml::SessionState::kConnecting,       fusionml::SessionState::kConnected,
            fusionml::SessionState::kReconnectWaiting, fusionml::SessionState::kConnecting,
            fusionml::SessionState::kConnected,        fusionml::SessionState::kClosed,
        };
        {
            std::lock_guard<std::mutex> guard(states_mutex);
            expect_true(states == expected, "state sequence across reconnect" + label);
        }
        const auto stats = session.stats();
        expect_true(stats.connect_attempts == 2, "two connect attempts" + label);
        expect_true(stats.reconnect_count == 1, "one reconnect" + label);
        expect_true(stats.messages_received == 1, "frame before the drop counted" + label);
        expect_true(handled.load() == 1, "frame before the drop dispatched" + label);
        auto dropped = transport->link(0);
        if (dropped) {
            std::lock_guard<std::mutex> guard(dropped->mutex);
            expect_true(dropped->closed, "dropped channel released" + label);
        }
    }
}

void test_session_greeting_timeout() {
    ChannelScript silent;
    ChannelScript greeting;
    greeting.frames = {R"({"type":"connection","status":"connected"})"};
    auto transport =
        std::make_shared<FakeTransport>(std::vector<std::optional<ChannelScript>>{silent, greeting});

    fusionml::StreamConfig config;
    config.reconnect_interval_s = 0.01;
    config.connect_timeout_s = 0.05;
    fusionml::StreamSession session(transport, config);

    std::mutex states_mutex;
    std::vector<fusionml::SessionState> states;
    session.set_state_listener([&](fusionml::SessionState state) {
        std::lock_guard<std::mutex> guard(states_mutex);
        states.push_back(state);
    });

    std::thread runner([&]() { session.run(); });
    expect_true(wait_until([&]() {
                    return transport->link(1) != nullptr && session.state() == fusionml::SessionState::kConnected;
                }),
                "connected after a silent peer");
    session.disconnect();
    runner.join();

    const std::vector<fusionml::SessionState> expected = {
        fusionml::SessionState::kConnecting, fusionml::SessionState::kReconnectWaiting,
        fusionml::SessionState::kConnecting, fusionml::SessionState::kConnected,
        fusionml::SessionState::kClosed,
    };
    {
        std::lock_guard<std::mutex> guard(states_mutex);
        expect_true(states == expected, "silent peer counts as a failed connect");
    }
    auto silent_link = transport->link(0);
    if (silent_link) {
        std::lock_guard<std::mutex> guard(silent_link->mutex);
        expect_true(silent_link->closed, "silent channel released");
    }
}

void test_session_slow_channel_does_not_block_control() {
    ChannelScript slow;
    slow.frames = {R"({"type":"connection","status":"connected"})"};
    slow.close_delay_s = 1.0;
    slow.send_delay_s = 1.0;
    auto transport = std::make_shared<FakeTransport>(std::vector<std::optional<ChannelScript>>{slow});
    fusionml::StreamSession session(transport, fusionml::StreamConfig{});

    std::thread runner([&]() { session.run(); });
    expect_true(wait_until([&]() { return session.state() == fusionml::SessionState::kConnected; }),
                "connected to slow peer");

    std::thread sender([&]() { session.send_heartbeat(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto started = std::chrono::steady_clock::now();
    const auto during_send = session.stats();
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    expect_true(elapsed < 0.5, "stats not blocked by an in-flight send");
    expect_true(during_send.connected, "still connected during send");

    started = std::chrono::steady_clock::now();
    session.disconnect();
    elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    expect_true(elapsed < 0.5, "disconnect does not wait for the polite close");

    sender.join();
    runner.join();
    expect_true(session.state() == fusionml::SessionState::kClosed, "closed after disconnect");
    expect_true(session.stats().messages_sent == 0, "heartbeat cut off by disconnect is not counted");
}

void test_session_disconnect_interrupts_backoff() {
    auto transport = std::make_shared<FakeTransport>(std::vector<std::optional<ChannelScript>>{});
    fusionml::StreamConfig config;
    config.reconnect_interval_s = 30.0;
    fusionml::StreamSession session(transport, config);

    std::thread runner([&]() { session.run(); });
    expect_true(wait_until([&]() { return session.state() == fusionml::SessionState::kReconnectWaiting; }),
                "waiting for reconnect");

    const auto started = std::chrono::steady_clock::now();
    session.disconnect();
    runner.join();
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    expect_true(elapsed < 2.0, "disconnect interrupts backoff");
    expect_true(session.state() == fusionml::SessionState::kClosed, "closed after disconnect");
    expect_true(transport->connects() == 1, "no reconnect after close");
}

void test_session_disconnect_before_run() {
    auto transport = std::make_shared<FakeTransport>(std::vector<std::optional<ChannelScript>>{ChannelScript{}});
    fusionml::StreamSession session(transport, fusionml::StreamConfig{});
    session.disconnect();
    session.run();
    expect_true(session.stats().connect_attempts == 0, "closed session never connects");
    expect_true(transport->connects() == 0, "transport untouched");
}

void test_session_dispatch_and_idle_sends() {
    auto transport = std::make_shared<FakeTransport>(std::vector<std::optional<ChannelScript>>{});
    fusionml::StreamSession session(transport, fusionml::StreamConfig{});
    int handled = 0;
    session.set_data_handler([&](const nlohmann::json&) { ++handled; });

    session.handle_message("{not json");
    session.handle_message("[1, 2, 3]");
    session.handle_message(R"({"type":"connection","status":"ok"})");
    session.handle_message(R"({"timestamp":"t"})");
    session.handle_message(R"({"timestamp":"t","orientation":{"w":1}})");
    expect_true(handled == 1, "only sensor payloads dispatched");
    expect_true(session.stats().messages_received == 5, "every frame counted");

    session.send_prediction(0.5);
    session.send_command("calibrate", {{"axis", "x"}});
    session.send_heartbeat();
    expect_true(session.stats().messages_sent == 0, "sends are no-ops while disconnected");
    expect_true(transport->connects() == 0, "sends never connect");

    fusionml::StreamSession throwing(transport, fusionml::StreamConfig{});
    throwing.set_data_handler([](const nlohmann::json&) { throw std::runtime_error("handler failure"); });
    bool propagated = false;
    try {
        throwing.handle_message(R"({"timestamp":"t","orientation":{}})");
    } catch (const std::exception&) {
        propagated = true;
    }
    expect_true(!propagated, "handler failures contained");
}

void test_service_periodic_retrain() {
    auto transport = std::make_shared<FakeTransport>(std::vector<std::optional<ChannelScript>>{});
    auto session = std::make_shared<fusionml::StreamSession>(transport, fusionml::StreamConfig{});
    auto engine = std::make_shared<fusionml::AnomalyEngine>();
    auto health = std::make_shared<fusionml::HealthMonitor>(10.0);

    fusionml::ServiceConfig config;
    config.model_update_interval = 30;
    config.progress_interval = 10;
    fusionml::ServiceLoop service(engine, session, config, fusionml::get_logger("ServiceLoop"), health);

    for (int i = 0; i < 29; ++i) {
        service.process_sensor_data(sensor_payload(i));
    }
    expect_true(!engine->is_trained(), "untrained before update interval");
    service.process_sensor_data(sensor_payload(29));
    expect_true(engine->is_trained(), "retrained at update interval");
    expect_true(service.sample_count() == 30, "sample count");
    expect_true(engine->feature_count().value_or(0) == fusionml::kSensorFeatureCount, "sensor dimension");

    service.process_sensor_data(nlohmann::json("not an object"));
    expect_true(service.sample_count() == 31, "malformed payload still processed");

    auto metrics = service.metrics();
    expect_near(metric_value(metrics, "samples_processed"), 31.0, 1e-12, "samples metric");
    expect_near(metric_value(metrics, "model_trained"), 1.0, 1e-12, "trained metric");
    expect_true(health->status().ok, "health marked by samples");
}

void test_service_background_retrain() {
    auto transport = std::make_shared<FakeTransport>(std::vector<std::optional<ChannelScript>>{});
    auto session = std::make_shared<fusionml::StreamSession>(transport, fusionml::StreamConfig{});
    fusionml::DetectorConfig detector;
    detector.background_retrain = true;
    auto engine = std::make_shared<fusionml::AnomalyEngine>(detector);

    fusionml::ServiceConfig config;
    config.model_update_interval = 25;
    fusionml::ServiceLoop service(engine, session, config);
    for (int i = 0; i < 25; ++i) {
        service.process_sensor_data(sensor_payload(i));
    }
    expect_true(wait_until([&]() { return engine->is_trained(); }), "background round publishes model");
}

void test_service_end_to_end() {
    ChannelScript channel;
    channel.frames.push_back(R"({"type":"connection","status":"connected"})");
    for (int i = 0; i < 25; ++i) {
        channel.frames.push_back(sensor_payload(i).dump());
    }
    auto transport = std::make_shared<FakeTransport>(std::vector<std::optional<ChannelScript>>{channel});

    fusionml::ServiceSettings settings;
    settings.logging.level = "ERROR";
    settings.metrics.enabled = false;
    settings.stream.reconnect_interval_s = 0.01;
    auto runtime = fusionml::build_service(settings, transport);

    std::thread runner([&]() { runtime.service->run(); });
    expect_true(wait_until([&]() {
                    auto link = transport->link(0);
                    return link && link->sent_frames().size() >= 25;
                }),
                "predictions published for every sample");
    runtime.service->stop();
    runner.join();

    expect_true(runtime.service->sample_count() == 25, "all samples processed");
    auto link = transport->link(0);
    if (link) {
        bool valid = true;
        for (const auto& frame : link->sent_frames()) {
            auto message = nlohmann::json::parse(frame);
            if (message.value("type", "") == "anomaly_prediction") {
                const double score = message.value("score", -1.0);
                valid = valid && score >= 0.0 && score <= 1.0;
            }
        }
        expect_true(valid, "published scores bounded");
    }
    auto metrics = runtime.service->metrics();
    expect_near(metric_value(metrics, "messages_received_total"), 25.0, 1e-12, "received metric");
    expect_true(runtime.health->status().samples == 25, "health sample count");
    expect_true(runtime.session->state() == fusionml::SessionState::kClosed, "session closed on stop");
}

void test_health_monitor() {
    fusionml::HealthMonitor monitor(10.0);
    expect_true(!monitor.status().ok, "no samples yet");
    monitor.mark_sample();
    auto status = monitor.status();
    expect_true(status.ok && status.samples == 1, "fresh sample healthy");

    fusionml::HealthMonitor stale(-1.0);
    stale.mark_sample();
    expect_true(!stale.status().ok, "outside freshness window");
}

void test_metrics_exporter_stop_right_after_start() {
    fusionml::HealthMonitor monitor(10.0);
    for (int i = 0; i < 20; ++i) {
        fusionml::MetricsExporter exporter([]() { return std::vector<std::pair<std::string, double>>{}; },
                                           monitor);
        const auto started = std::chrono::steady_clock::now();
        exporter.start("127.0.0.1", 0);
        exporter.stop();
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        expect_true(elapsed < 2.0, "exporter stops immediately after start");
    }
}

}  // namespace

int main() {
    fusionml::LoggingConfig logging;
    logging.level = "ERROR";
    fusionml::configure_logging(logging);

    try {
        test_sample_buffer();
        test_statistical_scorer();
        test_engine_scoring_example();
        test_engine_cold_start_matches_statistics();
        test_engine_dimension_lock();
        test_engine_training_gate();
        test_engine_detects_outlier_after_training();
        test_engine_inline_training_at_capacity();
        test_engine_trainer_failures();
        test_engine_reset();
        test_engine_async_retrain();
        test_engine_predict_during_async_retrain();
        test_ensemble();
        test_ensemble_structure();
        test_feature_scaler();
        test_feature_extraction();
        test_config();
        test_websocket_url();
        test_session_reconnect_sequence();
        test_session_reconnects_after_peer_close();
        test_session_greeting_timeout();
        test_session_slow_channel_does_not_block_control();
        test_session_disconnect_interrupts_backoff();
        test_session_disconnect_before_run();
        test_session_dispatch_and_idle_sends();
        test_service_periodic_retrain();
        test_service_background_retrain();
        test_service_end_to_end();
        test_health_monitor();
        test_metrics_exporter_stop_right_after_start();
    } catch (const std::exception& exc) {
        std::cerr << "Unhandled exception: " << exc.what() << "\n";
        return 1;
    }

    if (failures > 0) {
        std::cerr << failures << " test(s) failed.\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
