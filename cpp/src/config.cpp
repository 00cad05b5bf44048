#include "fusionml/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include "fusionml/common.hpp"

namespace fusionml {

namespace {

bool parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw std::runtime_error("invalid boolean: " + value);
}

int parse_int(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("invalid integer for " + key + ": " + value);
    }
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number for " + key + ": " + value);
    }
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    if (stripped == "null" || stripped == "none") {
        return std::nullopt;
    }
    return stripped;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error("invalid configuration: " + message);
    }
}

}  // namespace

ServiceSettings ServiceSettings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open config file: " + path);
    }

    ServiceSettings settings;
    std::string current_section;
    std::string line;

    while (std::getline(file, line)) {
        auto hash_pos = line.find('#');
        if (hash_pos != std::string::npos) {
            line = line.substr(0, hash_pos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        if (current_section == "logging") {
            if (key == "level") {
                settings.logging.level = strip_quotes(value);
            } else if (key == "json") {
                settings.logging.json = parse_bool(value);
            } else if (key == "log_file") {
                settings.logging.log_file = parse_optional_string(value);
            } else if (key == "max_bytes") {
                settings.logging.max_bytes = parse_int(key, value);
            } else if (key == "backup_count") {
                settings.logging.backup_count = parse_int(key, value);
            }
        } else if (current_section == "metrics") {
            if (key == "enabled") {
                settings.metrics.enabled = parse_bool(value);
            } else if (key == "host") {
                settings.metrics.host = strip_quotes(value);
            } else if (key == "port") {
                settings.metrics.port = parse_int(key, value);
            } else if (key == "freshness_window_s") {
                settings.metrics.freshness_window_s = parse_double(key, value);
            }
        } else if (current_section == "detector") {
            auto& detector = settings.detector;
            if (key == "buffer_size") {
                detector.buffer_size = parse_int(key, value);
            } else if (key == "anomaly_threshold") {
                detector.anomaly_threshold = parse_double(key, value);
            } else if (key == "history_size") {
                detector.history_size = parse_int(key, value);
            } else if (key == "background_retrain") {
                detector.background_retrain = parse_bool(value);
            } else if (key == "n_estimators") {
                detector.ensemble.n_estimators = parse_int(key, value);
            } else if (key == "max_samples") {
                auto parsed = parse_optional_string(value);
                if (parsed.has_value() && parsed.value() != "auto") {
                    detector.ensemble.max_samples = parse_int(key, parsed.value());
                } else {
                    detector.ensemble.max_samples = std::nullopt;
                }
            } else if (key == "bootstrap") {
                detector.ensemble.bootstrap = parse_bool(value);
            } else if (key == "contamination") {
                auto parsed = parse_optional_string(value);
                if (parsed.has_value() && parsed.value() != "auto") {
                    detector.ensemble.contamination = parse_double(key, parsed.value());
                } else {
                    detector.ensemble.contamination = std::nullopt;
                }
            } else if (key == "random_seed") {
                detector.ensemble.random_seed = static_cast<std::uint32_t>(parse_int(key, value));
            }
        } else if (current_section == "stream") {
            if (key == "url") {
                settings.stream.url = strip_quotes(value);
            } else if (key == "reconnect_interval_s") {
                settings.stream.reconnect_interval_s = parse_double(key, value);
            } else if (key == "connect_timeout_s") {
                settings.stream.connect_timeout_s = parse_double(key, value);
            }
        } else if (current_section == "service") {
            if (key == "model_update_interval") {
                settings.service.model_update_interval = parse_int(key, value);
            } else if (key == "heartbeat_interval_s") {
                settings.service.heartbeat_interval_s = parse_double(key, value);
            } else if (key == "progress_interval") {
                settings.service.progress_interval = parse_int(key, value);
            }
        }
    }

    settings.validate();
    return settings;
}

void ServiceSettings::validate() const {
    require(detector.buffer_size >= detector.min_training_samples,
            "detector.buffer_size must be at least " + std::to_string(detector.min_training_samples));
    require(detector.anomaly_threshold >= 0.0 && detector.anomaly_threshold <= 1.0,
            "detector.anomaly_threshold must lie in [0, 1]");
    require(detector.history_size > 0, "detector.history_size must be positive");
    require(detector.ensemble.n_estimators > 0, "detector.n_estimators must be positive");
    require(!detector.ensemble.max_samples.has_value() || detector.ensemble.max_samples.value() > 1,
            "detector.max_samples must exceed 1");
    require(!detector.ensemble.contamination.has_value() ||
                (detector.ensemble.contamination.value() > 0.0 && detector.ensemble.contamination.value() <= 0.5),
            "detector.contamination must lie in (0, 0.5] or be auto");
    require(stream.reconnect_interval_s >= 0.0, "stream.reconnect_interval_s must not be negative");
    require(stream.connect_timeout_s > 0.0, "stream.connect_timeout_s must be positive");
    require(stream.url.rfind("ws://", 0) == 0, "stream.url must be a ws:// URL");
    require(service.model_update_interval > 0, "service.model_update_interval must be positive");
    require(service.progress_interval > 0, "service.progress_interval must be positive");
    require(metrics.port > 0 && metrics.port < 65536, "metrics.port out of range");
}

}  // namespace fusionml
