#include "fusionml/logging.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>

#include "fusionml/common.hpp"

namespace fusionml {

namespace {

struct LoggingState {
    LogLevel level = LogLevel::kInfo;
    bool json = true;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 0;
    int backup_count = 0;
    std::unique_ptr<std::ostream> file_stream;
    std::mutex mutex;
};

LoggingState& state() {
    static LoggingState instance;
    return instance;
}

LogLevel parse_level(const std::string& level) {
    if (level == "DEBUG") {
        return LogLevel::kDebug;
    }
    if (level == "WARN" || level == "WARNING") {
        return LogLevel::kWarn;
    }
    if (level == "ERROR") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "DEBUG";
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarn:
            return "WARN";
        case LogLevel::kError:
            return "ERROR";
    }
    return "INFO";
}

void rotate_logs(LoggingState& log_state) {
    if (!log_state.log_file.has_value()) {
        return;
    }
    if (log_state.max_bytes <= 0 || log_state.backup_count <= 0) {
        return;
    }

    const std::filesystem::path base_path(*log_state.log_file);
    std::error_code ec;
    if (!std::filesystem::exists(base_path, ec)) {
        return;
    }

    const auto size = std::filesystem::file_size(base_path, ec);
    if (ec || size < static_cast<std::uintmax_t>(log_state.max_bytes)) {
        return;
    }

    log_state.file_stream.reset();

    for (int index = log_state.backup_count - 1; index >= 1; --index) {
        std::filesystem::path source = base_path;
        source += "." + std::to_string(index);
        if (!std::filesystem::exists(source, ec)) {
            continue;
        }
        std::filesystem::path destination = base_path;
        destination += "." + std::to_string(index + 1);
        std::filesystem::rename(source, destination, ec);
    }

    std::filesystem::path rotated = base_path;
    rotated += ".1";
    std::filesystem::rename(base_path, rotated, ec);
    log_state.file_stream = std::make_unique<std::ofstream>(base_path, std::ios::app);
}

std::string format_json(LogLevel level, const std::string& name, const std::string& message,
                        const LogFields& extra) {
    nlohmann::json record = {
        {"ts", iso8601_utc_now()},
        {"level", level_name(level)},
        {"name", name},
        {"message", message},
    };
    for (const auto& [key, value] : extra) {
        record[key] = value;
    }
    // Replace invalid UTF-8 instead of throwing from inside the logger.
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string format_plain(LogLevel level, const std::string& name, const std::string& message,
                         const LogFields& extra) {
    std::string line = iso8601_utc_now() + " " + level_name(level) + " " + name + " " + message;
    if (!extra.empty()) {
        line += " |";
        for (const auto& [key, value] : extra) {
            line += " " + key + "=" + value;
        }
    }
    return line;
}

}  // namespace

Logger::Logger(std::string name) : name_(std::move(name)) {}

bool Logger::enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(state().level);
}

const std::string& Logger::name() const {
    return name_;
}

void Logger::log(LogLevel level, const std::string& message, const LogFields& extra) const {
    if (!enabled(level)) {
        return;
    }
    auto& log_state = state();
    const std::string line = log_state.json ? format_json(level, name_, message, extra)
                                            : format_plain(level, name_, message, extra);

    std::lock_guard<std::mutex> guard(log_state.mutex);
    rotate_logs(log_state);
    std::ostream* output = level >= LogLevel::kWarn ? &std::cerr : &std::cout;
    if (log_state.file_stream) {
        output = log_state.file_stream.get();
    }
    *output << line << '\n';
    output->flush();
}

void Logger::debug(const std::string& message, const LogFields& extra) const {
    log(LogLevel::kDebug, message, extra);
}

void Logger::info(const std::string& message, const LogFields& extra) const {
    log(LogLevel::kInfo, message, extra);
}

void Logger::warn(const std::string& message, const LogFields& extra) const {
    log(LogLevel::kWarn, message, extra);
}

void Logger::error(const std::string& message, const LogFields& extra) const {
    log(LogLevel::kError, message, extra);
}

void configure_logging(const LoggingConfig& config) {
    auto& log_state = state();
    std::lock_guard<std::mutex> guard(log_state.mutex);
    log_state.level = parse_level(config.level);
    log_state.json = config.json;
    log_state.log_file = config.log_file;
    log_state.max_bytes = config.max_bytes;
    log_state.backup_count = config.backup_count;
    log_state.file_stream.reset();

    if (config.log_file.has_value()) {
        auto stream = std::make_unique<std::ofstream>(*config.log_file, std::ios::app);
        if (stream->is_open()) {
            log_state.file_stream = std::move(stream);
        }
    }
}

Logger get_logger(const std::string& name) {
    return Logger(name);
}

}  // namespace fusionml
