#include "fusionml/session.hpp"

#include <chrono>
#include <optional>
#include <utility>

#include "fusionml/common.hpp"

namespace fusionml {

namespace {

constexpr std::size_t kLoggedFrameChars = 100;
constexpr std::uint64_t kReceiveProgressEvery = 100;
constexpr std::uint64_t kSendProgressEvery = 50;

std::string excerpt(const std::string& frame) {
    return frame.substr(0, kLoggedFrameChars);
}

}  // namespace

std::string to_string(SessionState state) {
    switch (state) {
        case SessionState::kDisconnected:
            return "disconnected";
        case SessionState::kConnecting:
            return "connecting";
        case SessionState::kConnected:
            return "connected";
        case SessionState::kReconnectWaiting:
            return "reconnect_waiting";
        case SessionState::kClosed:
            return "closed";
    }
    return "unknown";
}

StreamSession::StreamSession(std::shared_ptr<Transport> transport, StreamConfig config, Logger logger)
    : transport_(std::move(transport)), config_(std::move(config)), logger_(std::move(logger)) {
    if (!transport_) {
        throw std::invalid_argument("StreamSession requires a transport");
    }
    logger_.info("session_initialized", {{"url", config_.url}});
}

StreamSession::~StreamSession() {
    std::shared_ptr<MessageChannel> channel;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        channel = channel_;
    }
    if (channel) {
        channel->abort();
    }
}

void StreamSession::set_data_handler(DataHandler handler) {
    data_handler_ = std::move(handler);
}

void StreamSession::set_state_listener(StateListener listener) {
    state_listener_ = std::move(listener);
}

bool StreamSession::transition(SessionState next) {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (state_ == SessionState::kClosed) {
            return false;
        }
        state_ = next;
    }
    logger_.debug("session_state", {{"state", to_string(next)}});
    if (state_listener_) {
        state_listener_(next);
    }
    return true;
}

void StreamSession::run() {
    if (!transition(SessionState::kConnecting)) {
        return;
    }
    while (true) {
        if (connect_once()) {
            std::shared_ptr<MessageChannel> channel;
            {
                std::lock_guard<std::mutex> guard(mutex_);
                channel = channel_;
            }
            if (channel && transition(SessionState::kConnected)) {
                logger_.info("session_connected", {{"url", config_.url}});
                receive_loop(channel);
            }
        }
        release_channel();

        if (!transition(SessionState::kReconnectWaiting)) {
            break;
        }
        wait_backoff();
        if (!transition(SessionState::kConnecting)) {
            break;
        }
    }
    logger_.info("session_stopped", {{"url", config_.url}});
}

bool StreamSession::connect_once() {
    std::uint64_t attempt = 0;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        attempt = ++connect_attempts_;
    }
    logger_.info("session_connecting", {{"url", config_.url}, {"attempt", std::to_string(attempt)}});

    std::shared_ptr<MessageChannel> channel;
    try {
        channel = transport_->connect(config_.url);
    } catch (const std::exception& exc) {
        logger_.error("session_connect_failed", {{"url", config_.url}, {"error", exc.what()}});
        return false;
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (state_ == SessionState::kClosed) {
            lock.unlock();
            channel->close();
            return false;
        }
        channel_ = channel;
    }

    try {
        const auto greeting = channel->receive_for(config_.connect_timeout_s);
        if (!greeting.has_value()) {
            logger_.warn("session_closed_before_greeting", {{"url", config_.url}});
            return false;
        }
        logger_.info("session_greeting", {{"frame", excerpt(greeting.value())}});
        return true;
    } catch (const std::exception& exc) {
        logger_.error("session_greeting_failed", {{"error", exc.what()}});
        return false;
    }
}

void StreamSession::receive_loop(const std::shared_ptr<MessageChannel>& channel) {
    while (true) {
        std::optional<std::string> frame;
        try {
            frame = channel->receive();
        } catch (const std::exception& exc) {
            if (state() != SessionState::kClosed) {
                logger_.warn("session_transport_error", {{"error", exc.what()}});
            }
            return;
        }
        if (!frame.has_value()) {
            if (state() != SessionState::kClosed) {
                logger_.warn("session_connection_closed", {{"url", config_.url}});
            }
            return;
        }
        if (state() == SessionState::kClosed) {
            return;
        }
        handle_message(frame.value());
    }
}

void StreamSession::release_channel() {
    std::shared_ptr<MessageChannel> channel;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        channel = std::move(channel_);
    }
    if (channel) {
        channel->close();
    }
}

void StreamSession::wait_backoff() {
    std::unique_lock<std::mutex> lock(mutex_);
    const std::uint64_t attempt = ++reconnect_count_;
    lock.unlock();
    logger_.info("session_reconnect_scheduled", {{"attempt", std::to_string(attempt)},
                                                 {"delay_s", std::to_string(config_.reconnect_interval_s)}});
    lock.lock();
    wakeup_.wait_for(lock, std::chrono::duration<double>(config_.reconnect_interval_s),
                     [this]() { return state_ == SessionState::kClosed; });
}

void StreamSession::disconnect() {
    SessionStats final_stats;
    std::shared_ptr<MessageChannel> channel;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (state_ == SessionState::kClosed) {
            return;
        }
        state_ = SessionState::kClosed;
        channel = channel_;
        final_stats.messages_received = messages_received_;
        final_stats.messages_sent = messages_sent_;
        final_stats.reconnect_count = reconnect_count_;
    }
    wakeup_.notify_all();
    if (channel) {
        channel->abort();
    }
    logger_.info("session_closed", {{"messages_received", std::to_string(final_stats.messages_received)},
                                    {"messages_sent", std::to_string(final_stats.messages_sent)},
                                    {"reconnect_count", std::to_string(final_stats.reconnect_count)}});
    if (state_listener_) {
        state_listener_(SessionState::kClosed);
    }
}

void StreamSession::handle_message(const std::string& frame) {
    std::uint64_t received = 0;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        received = ++messages_received_;
    }
    if (received % kReceiveProgressEvery == 0) {
        logger_.info("messages_received", {{"count", std::to_string(received)}});
    }

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(frame);
    } catch (const nlohmann::json::parse_error& exc) {
        logger_.error("message_decode_failed", {{"error", exc.what()}, {"frame", excerpt(frame)}});
        return;
    }

    if (!data.is_object()) {
        logger_.debug("unrecognized_message", {{"frame", excerpt(frame)}});
        return;
    }

    const auto type = data.find("type");
    if (type != data.end() && type->is_string() && type->get<std::string>() == "connection") {
        const auto status = data.find("status");
        const std::string text = status == data.end() ? "" : (status->is_string() ? status->get<std::string>()
                                                                                  : status->dump());
        logger_.info("connection_status", {{"status", text}});
        return;
    }

    if (data.contains("timestamp") && data.contains("orientation")) {
        if (!data_handler_) {
            return;
        }
        try {
            data_handler_(data);
        } catch (const std::exception& exc) {
            logger_.error("message_handling_failed", {{"error", exc.what()}});
        }
        return;
    }

    logger_.debug("unrecognized_message", {{"frame", excerpt(frame)}});
}

bool StreamSession::send_message(const nlohmann::json& message, const char* kind) {
    const std::string frame = message.dump();
    std::shared_ptr<MessageChannel> channel;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (state_ == SessionState::kConnected) {
            channel = channel_;
        }
    }
    if (!channel) {
        logger_.debug("send_skipped_not_connected", {{"kind", kind}});
        return false;
    }
    try {
        std::lock_guard<std::mutex> send_guard(send_mutex_);
        channel->send(frame);
    } catch (const std::exception& exc) {
        logger_.error("send_failed", {{"kind", kind}, {"error", exc.what()}});
        return false;
    }
    std::uint64_t sent = 0;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        sent = ++messages_sent_;
    }
    if (sent % kSendProgressEvery == 0) {
        logger_.debug("messages_sent", {{"count", std::to_string(sent)}});
    }
    return true;
}

void StreamSession::send_prediction(double score) {
    send_message({{"type", "anomaly_prediction"}, {"score", score}, {"timestamp", iso8601_utc_now()}},
                 "anomaly_prediction");
}

void StreamSession::send_command(const std::string& action, const nlohmann::json& parameters) {
    const nlohmann::json message = {
        {"type", "command"},
        {"action", action},
        {"parameters", parameters.is_null() ? nlohmann::json::object() : parameters},
        {"timestamp", iso8601_utc_now()},
    };
    if (send_message(message, "command")) {
        logger_.info("command_sent", {{"action", action}});
    }
}

void StreamSession::send_heartbeat() {
    send_message({{"type", "heartbeat"}, {"timestamp", iso8601_utc_now()}}, "heartbeat");
}

SessionState StreamSession::state() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return state_;
}

SessionStats StreamSession::stats() const {
    std::lock_guard<std::mutex> guard(mutex_);
    SessionStats stats;
    stats.state = state_;
    stats.connected = state_ == SessionState::kConnected;
    stats.messages_received = messages_received_;
    stats.messages_sent = messages_sent_;
    stats.reconnect_count = reconnect_count_;
    stats.connect_attempts = connect_attempts_;
    stats.url = config_.url;
    return stats;
}

}  // namespace fusionml
