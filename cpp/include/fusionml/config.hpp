#ifndef FUSIONML_CONFIG_HPP
#define FUSIONML_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace fusionml {

struct LoggingConfig {
    std::string level = "INFO";
    bool json = true;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 1'000'000;
    int backup_count = 3;
};

struct MetricsConfig {
    bool enabled = true;
    std::string host = "127.0.0.1";
    int port = 8001;
    double freshness_window_s = 10.0;
};

struct EnsembleParams {
    int n_estimators = 100;
    std::optional<int> max_samples = std::nullopt;
    bool bootstrap = false;
    std::optional<double> contamination = 0.1;
    std::uint32_t random_seed = 42;
    int min_training_samples = 20;
};

struct DetectorConfig {
    int buffer_size = 50;
    double anomaly_threshold = 0.7;
    int history_size = 100;
    int min_training_samples = 20;
    double model_weight = 0.7;
    bool background_retrain = false;
    EnsembleParams ensemble{};
};

struct StreamConfig {
    std::string url = "ws://127.0.0.1:8080";
    double reconnect_interval_s = 5.0;
    double connect_timeout_s = 10.0;
};

struct ServiceConfig {
    int model_update_interval = 100;
    double heartbeat_interval_s = 30.0;
    int progress_interval = 50;
};

struct ServiceSettings {
    LoggingConfig logging{};
    MetricsConfig metrics{};
    DetectorConfig detector{};
    StreamConfig stream{};
    ServiceConfig service{};

    static ServiceSettings from_toml(const std::string& path);

    void validate() const;
};

}  // namespace fusionml

#endif  // FUSIONML_CONFIG_HPP
