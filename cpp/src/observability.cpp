#include "fusionml/observability.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include <nlohmann/json.hpp>

#include "fusionml/common.hpp"

namespace fusionml {

HealthMonitor::HealthMonitor(double freshness_window) : freshness_window_(freshness_window) {}

void HealthMonitor::mark_sample() {
    std::lock_guard<std::mutex> guard(mutex_);
    last_sample_ = seconds_since_epoch();
    ++samples_;
}

HealthStatus HealthMonitor::status() const {
    std::lock_guard<std::mutex> guard(mutex_);
    const double now = seconds_since_epoch();
    const double last_sample = last_sample_.value_or(0.0);
    const bool ok = last_sample_.has_value() && (now - last_sample <= freshness_window_);
    return HealthStatus{last_sample, samples_, ok};
}

MetricsExporter::MetricsExporter(MetricsSource source, HealthMonitor& health, Logger logger)
    : source_(std::move(source)), health_(health), logger_(std::move(logger)) {}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start(const std::string& host, int port) {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&MetricsExporter::serve, this, host, port);
}

void MetricsExporter::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    const int fd = server_fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::string MetricsExporter::respond(const std::string& path, std::string& status, std::string& content_type) const {
    status = "200 OK";
    content_type = "text/plain";
    if (path == "/metrics") {
        std::ostringstream response;
        if (source_) {
            for (const auto& [key, value] : source_()) {
                response << "fusionml_" << key << " " << value << "\n";
            }
        }
        return response.str();
    }
    if (path == "/health") {
        const auto health = health_.status();
        const nlohmann::json body = {
            {"ok", health.ok},
            {"last_sample", health.last_sample},
            {"samples", health.samples},
        };
        content_type = "application/json";
        if (!health.ok) {
            status = "503 Service Unavailable";
        }
        return body.dump();
    }
    status = "404 Not Found";
    return "";
}

void MetricsExporter::serve(const std::string& host, int port) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        logger_.error("metrics_socket_failed", {{"error", std::strerror(errno)}});
        return;
    }

    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        logger_.error("metrics_bad_host", {{"host", host}});
        ::close(fd);
        return;
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(fd, 4) < 0) {
        logger_.error("metrics_bind_failed", {{"host", host}, {"port", std::to_string(port)},
                                              {"error", std::strerror(errno)}});
        ::close(fd);
        return;
    }
    server_fd_ = fd;
    // stop() may have run before the descriptor was published.
    if (!running_) {
        server_fd_ = -1;
        ::close(fd);
        return;
    }
    logger_.info("metrics_listening", {{"host", host}, {"port", std::to_string(port)}});

    while (running_) {
        sockaddr_in client{};
        socklen_t len = sizeof(client);
        const int client_fd = ::accept(fd, reinterpret_cast<sockaddr*>(&client), &len);
        if (client_fd < 0) {
            continue;
        }

        char buffer[1024] = {0};
        const ssize_t read_bytes = ::read(client_fd, buffer, sizeof(buffer) - 1);
        if (read_bytes <= 0) {
            ::close(client_fd);
            continue;
        }

        std::string request(buffer, static_cast<size_t>(read_bytes));
        auto first_line_end = request.find("\r\n");
        std::string first_line = first_line_end == std::string::npos ? request : request.substr(0, first_line_end);
        auto parts = split(first_line, ' ');
        std::string path = parts.size() >= 2 ? parts[1] : "/";

        std::string status;
        std::string content_type;
        const std::string body = respond(path, status, content_type);

        std::ostringstream header;
        header << "HTTP/1.1 " << status << "\r\n"
               << "Content-Type: " << content_type << "\r\n"
               << "Content-Length: " << body.size() << "\r\n"
               << "Connection: close\r\n\r\n";

        const std::string response = header.str() + body;
        if (::send(client_fd, response.c_str(), response.size(), MSG_NOSIGNAL) < 0) {
            logger_.debug("metrics_send_failed", {{"error", std::strerror(errno)}});
        }
        ::close(client_fd);
    }

    server_fd_ = -1;
    ::close(fd);
}

}  // namespace fusionml
