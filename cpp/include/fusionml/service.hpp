#ifndef FUSIONML_SERVICE_HPP
#define FUSIONML_SERVICE_HPP

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "fusionml/config.hpp"
#include "fusionml/engine.hpp"
#include "fusionml/logging.hpp"
#include "fusionml/observability.hpp"
#include "fusionml/session.hpp"

namespace fusionml {

class ServiceLoop {
public:
    ServiceLoop(std::shared_ptr<AnomalyEngine> engine, std::shared_ptr<StreamSession> session,
                ServiceConfig config, Logger logger = get_logger("ServiceLoop"),
                std::shared_ptr<HealthMonitor> health = nullptr);

    ServiceLoop(const ServiceLoop&) = delete;
    ServiceLoop& operator=(const ServiceLoop&) = delete;

    void run();
    void stop();

    void process_sensor_data(const nlohmann::json& payload);

    std::uint64_t sample_count() const;
    std::vector<std::pair<std::string, double>> metrics() const;

private:
    void maybe_retrain();
    void maybe_send_heartbeat();
    void refresh_metrics();

    std::shared_ptr<AnomalyEngine> engine_;
    std::shared_ptr<StreamSession> session_;
    ServiceConfig config_;
    Logger logger_;
    std::shared_ptr<HealthMonitor> health_;

    std::atomic<std::uint64_t> sample_count_{0};
    double last_heartbeat_ = 0.0;
    std::optional<std::shared_future<TrainingStatus>> pending_retrain_;

    mutable std::mutex metrics_mutex_;
    std::vector<std::pair<std::string, double>> metrics_;
};

}  // namespace fusionml

#endif  // FUSIONML_SERVICE_HPP
