#include "fusionml/service.hpp"

#include <chrono>
#include <exception>
#include <sstream>
#include <stdexcept>

#include "fusionml/common.hpp"
#include "fusionml/features.hpp"

namespace fusionml {

namespace {

std::string format_score(double score) {
    std::ostringstream out;
    out.precision(4);
    out << std::fixed << score;
    return out.str();
}

std::string payload_timestamp(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return "";
    }
    auto it = payload.find("timestamp");
    if (it == payload.end() || it->is_null()) {
        return "";
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

}  // namespace

ServiceLoop::ServiceLoop(std::shared_ptr<AnomalyEngine> engine, std::shared_ptr<StreamSession> session,
                         ServiceConfig config, Logger logger, std::shared_ptr<HealthMonitor> health)
    : engine_(std::move(engine)),
      session_(std::move(session)),
      config_(config),
      logger_(std::move(logger)),
      health_(std::move(health)),
      last_heartbeat_(seconds_since_epoch()) {
    if (!engine_ || !session_) {
        throw std::invalid_argument("ServiceLoop requires an engine and a session");
    }
    if (config_.model_update_interval <= 0 || config_.progress_interval <= 0) {
        throw std::invalid_argument("service intervals must be positive");
    }
    session_->set_data_handler([this](const nlohmann::json& payload) { process_sensor_data(payload); });
    refresh_metrics();
}

void ServiceLoop::run() {
    logger_.info("service_started", {{"model_update_interval", std::to_string(config_.model_update_interval)},
                                     {"heartbeat_interval_s", std::to_string(config_.heartbeat_interval_s)}});
    session_->run();
    logger_.info("service_stopped", {{"samples", std::to_string(sample_count_.load())}});
}

void ServiceLoop::stop() {
    session_->disconnect();
}

void ServiceLoop::process_sensor_data(const nlohmann::json& payload) {
    try {
        const std::uint64_t samples = ++sample_count_;
        const auto features = extract_features(payload);
        const double score = engine_->predict(features);

        if (score > engine_->config().anomaly_threshold) {
            logger_.warn("anomaly_detected", {{"score", format_score(score)},
                                              {"timestamp", payload_timestamp(payload)}});
        }

        if (samples % static_cast<std::uint64_t>(config_.model_update_interval) == 0) {
            maybe_retrain();
        }

        session_->send_prediction(score);
        maybe_send_heartbeat();

        if (health_) {
            health_->mark_sample();
        }
        refresh_metrics();

        if (samples % static_cast<std::uint64_t>(config_.progress_interval) == 0) {
            const auto stats = engine_->get_statistics();
            logger_.info("processing_progress", {{"samples", std::to_string(samples)},
                                                 {"trained", stats.is_trained ? "true" : "false"},
                                                 {"anomaly_rate", format_score(stats.anomaly_rate)},
                                                 {"recent_avg_score", format_score(stats.recent_avg_score)}});
        }
    } catch (const std::exception& exc) {
        logger_.error("sensor_processing_failed", {{"error", exc.what()}});
    }
}

void ServiceLoop::maybe_retrain() {
    if (!engine_->config().background_retrain) {
        const auto status = engine_->update_model();
        logger_.debug("periodic_retrain", {{"status", to_string(status)}});
        return;
    }
    if (pending_retrain_ &&
        pending_retrain_->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        logger_.debug("periodic_retrain_skipped", {{"reason", "round_pending"}});
        return;
    }
    pending_retrain_ = engine_->update_model_async();
}

void ServiceLoop::maybe_send_heartbeat() {
    const double now = seconds_since_epoch();
    if (now - last_heartbeat_ < config_.heartbeat_interval_s) {
        return;
    }
    session_->send_heartbeat();
    last_heartbeat_ = now;
}

void ServiceLoop::refresh_metrics() {
    const auto engine = engine_->get_statistics();
    const auto session = session_->stats();
    std::vector<std::pair<std::string, double>> values = {
        {"samples_processed", static_cast<double>(sample_count_.load())},
        {"predictions_total", static_cast<double>(engine.prediction_count)},
        {"anomalies_total", static_cast<double>(engine.anomaly_count)},
        {"anomaly_rate", engine.anomaly_rate},
        {"recent_avg_score", engine.recent_avg_score},
        {"buffer_size", static_cast<double>(engine.buffer_size)},
        {"model_trained", engine.is_trained ? 1.0 : 0.0},
        {"model_generation", static_cast<double>(engine.model_generation)},
        {"session_connected", session.connected ? 1.0 : 0.0},
        {"messages_received_total", static_cast<double>(session.messages_received)},
        {"messages_sent_total", static_cast<double>(session.messages_sent)},
        {"reconnects_total", static_cast<double>(session.reconnect_count)},
    };
    std::lock_guard<std::mutex> guard(metrics_mutex_);
    metrics_ = std::move(values);
}

std::uint64_t ServiceLoop::sample_count() const {
    return sample_count_.load();
}

std::vector<std::pair<std::string, double>> ServiceLoop::metrics() const {
    std::lock_guard<std::mutex> guard(metrics_mutex_);
    return metrics_;
}

}  // namespace fusionml
