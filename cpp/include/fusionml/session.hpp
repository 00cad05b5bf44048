#ifndef FUSIONML_SESSION_HPP
#define FUSIONML_SESSION_HPP

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "fusionml/config.hpp"
#include "fusionml/logging.hpp"
#include "fusionml/transport.hpp"

namespace fusionml {

enum class SessionState {
    kDisconnected,
    kConnecting,
    kConnected,
    kReconnectWaiting,
    kClosed,
};

std::string to_string(SessionState state);

struct SessionStats {
    SessionState state = SessionState::kDisconnected;
    bool connected = false;
    std::uint64_t messages_received = 0;
    std::uint64_t messages_sent = 0;
    std::uint64_t reconnect_count = 0;
    std::uint64_t connect_attempts = 0;
    std::string url;
};

// run() owns the calling thread until disconnect(). Other members are thread-safe.
class StreamSession {
public:
    using DataHandler = std::function<void(const nlohmann::json&)>;
    using StateListener = std::function<void(SessionState)>;

    StreamSession(std::shared_ptr<Transport> transport, StreamConfig config,
                  Logger logger = get_logger("StreamSession"));
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    void set_data_handler(DataHandler handler);
    void set_state_listener(StateListener listener);

    void run();
    void disconnect();

    void handle_message(const std::string& frame);

    void send_prediction(double score);
    void send_command(const std::string& action, const nlohmann::json& parameters = nlohmann::json::object());
    void send_heartbeat();

    SessionState state() const;
    SessionStats stats() const;

private:
    bool transition(SessionState next);
    bool connect_once();
    void receive_loop(const std::shared_ptr<MessageChannel>& channel);
    void release_channel();
    void wait_backoff();
    bool send_message(const nlohmann::json& message, const char* kind);

    std::shared_ptr<Transport> transport_;
    StreamConfig config_;
    Logger logger_;
    DataHandler data_handler_;
    StateListener state_listener_;

    mutable std::mutex mutex_;
    std::mutex send_mutex_;
    std::condition_variable wakeup_;
    SessionState state_ = SessionState::kDisconnected;
    std::shared_ptr<MessageChannel> channel_;
    std::uint64_t messages_received_ = 0;
    std::uint64_t messages_sent_ = 0;
    std::uint64_t reconnect_count_ = 0;
    std::uint64_t connect_attempts_ = 0;
};

}  // namespace fusionml

#endif  // FUSIONML_SESSION_HPP
