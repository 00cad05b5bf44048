#ifndef FUSIONML_OBSERVABILITY_HPP
#define FUSIONML_OBSERVABILITY_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "fusionml/logging.hpp"

namespace fusionml {

struct HealthStatus {
    double last_sample = 0.0;
    std::uint64_t samples = 0;
    bool ok = false;
};

class HealthMonitor {
public:
    explicit HealthMonitor(double freshness_window = 10.0);

    void mark_sample();
    HealthStatus status() const;

private:
    double freshness_window_ = 10.0;
    mutable std::mutex mutex_;
    std::optional<double> last_sample_;
    std::uint64_t samples_ = 0;
};

using MetricsSource = std::function<std::vector<std::pair<std::string, double>>()>;

class MetricsExporter {
public:
    MetricsExporter(MetricsSource source, HealthMonitor& health, Logger logger = get_logger("MetricsExporter"));
    ~MetricsExporter();

    void start(const std::string& host, int port);
    void stop();

private:
    void serve(const std::string& host, int port);
    std::string respond(const std::string& path, std::string& status, std::string& content_type) const;

    MetricsSource source_;
    HealthMonitor& health_;
    Logger logger_;
    std::atomic<bool> running_{false};
    std::atomic<int> server_fd_{-1};
    std::thread thread_;
};

}  // namespace fusionml

#endif  // FUSIONML_OBSERVABILITY_HPP
