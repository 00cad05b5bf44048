#include "fusionml/websocket_transport.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "fusionml/common.hpp"

namespace fusionml {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// Every stream operation runs on io_thread_, which acts as the stream's strand.
class WebSocketChannel : public MessageChannel {
public:
    WebSocketChannel(Logger logger, double timeout_s)
        : logger_(std::move(logger)), timeout_s_(timeout_s), io_thread_([this]() { ioc_.run(); }) {}

    ~WebSocketChannel() override {
        close();
        work_.reset();
        ioc_.stop();
        io_thread_.join();
    }

    void open(const WebSocketEndpoint& endpoint, const std::string& user_agent) {
        beast::error_code ec;
        tcp::resolver resolver(ioc_);
        const auto results = resolver.resolve(endpoint.host, endpoint.port, ec);
        if (ec) {
            throw TransportError("resolve " + endpoint.host + ":" + endpoint.port + " failed: " + ec.message());
        }

        ec = run_with_deadline(
            [&](auto handler) { net::async_connect(ws_.next_layer(), results, std::move(handler)); }, timeout_s_);
        if (ec) {
            throw TransportError("connect " + endpoint.host + ":" + endpoint.port + " failed: " + ec.message());
        }

        const auto host = endpoint.host + ":" + endpoint.port;
        ec = run_with_deadline(
            [&](auto handler) {
                ws_.set_option(websocket::stream_base::decorator([user_agent](websocket::request_type& request) {
                    request.set(beast::http::field::user_agent, user_agent);
                }));
                ws_.text(true);
                ws_.async_handshake(host, endpoint.target, std::move(handler));
            },
            timeout_s_);
        if (ec) {
            throw TransportError("websocket handshake failed: " + ec.message());
        }
    }

    std::optional<std::string> receive() override {
        return read_frame(0.0);
    }

    std::optional<std::string> receive_for(double timeout_s) override {
        return read_frame(timeout_s);
    }

    void send(const std::string& frame) override {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (closed_ || aborted_) {
            throw TransportError("websocket write on a closed channel");
        }
        const auto ec = run_with_deadline(
            [&](auto handler) { ws_.async_write(net::buffer(frame), std::move(handler)); }, timeout_s_);
        if (ec) {
            throw TransportError("websocket write failed: " + ec.message());
        }
    }

    void close() override {
        if (closed_.exchange(true)) {
            return;
        }
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!aborted_) {
            const auto ec = run_with_deadline(
                [this](auto handler) {
                    if (ws_.is_open()) {
                        ws_.async_close(websocket::close_code::normal, std::move(handler));
                    } else {
                        handler(beast::error_code{});
                    }
                },
                timeout_s_);
            if (ec) {
                logger_.debug("websocket_close_failed", {{"error", ec.message()}});
            }
        }
        run_with_deadline(
            [this](auto handler) {
                close_socket();
                handler(beast::error_code{});
            },
            0.0);
    }

    void abort() override {
        if (aborted_.exchange(true)) {
            return;
        }
        net::post(ioc_, [this]() { close_socket(); });
    }

private:
    std::optional<std::string> read_frame(double timeout_s) {
        beast::flat_buffer buffer;
        const auto ec =
            run_with_deadline([&](auto handler) { ws_.async_read(buffer, std::move(handler)); }, timeout_s);
        if (ec == websocket::error::closed) {
            return std::nullopt;
        }
        if (ec) {
            if (aborted_ || closed_) {
                return std::nullopt;
            }
            if (ec == beast::error::timeout) {
                throw TransportError("websocket read timed out");
            }
            throw TransportError("websocket read failed: " + ec.message());
        }
        return beast::buffers_to_string(buffer.data());
    }

    // Starts an operation on the I/O thread and waits for it. On expiry the
    // socket is closed, the operation drains, and beast::error::timeout is returned.
    // A timeout of zero waits without limit.
    template <typename Start>
    beast::error_code run_with_deadline(Start&& start, double timeout_s) {
        auto done = std::make_shared<std::promise<beast::error_code>>();
        auto result = done->get_future();
        net::post(ioc_, [&start, done]() {
            start([done](beast::error_code ec, auto&&...) { done->set_value(ec); });
        });
        if (timeout_s > 0.0) {
            const auto limit = std::chrono::milliseconds(static_cast<long long>(timeout_s * 1000.0));
            if (result.wait_for(limit) != std::future_status::ready) {
                net::post(ioc_, [this]() { close_socket(); });
                result.wait();
                return beast::error::timeout;
            }
        }
        return result.get();
    }

    void close_socket() {
        beast::error_code ec;
        if (ws_.next_layer().is_open()) {
            ws_.next_layer().shutdown(tcp::socket::shutdown_both, ec);
            ws_.next_layer().close(ec);
        }
    }

    Logger logger_;
    double timeout_s_;
    net::io_context ioc_;
    net::executor_work_guard<net::io_context::executor_type> work_{net::make_work_guard(ioc_)};
    websocket::stream<tcp::socket> ws_{ioc_};
    std::mutex write_mutex_;
    std::atomic<bool> aborted_{false};
    std::atomic<bool> closed_{false};
    std::thread io_thread_;
};

}  // namespace

WebSocketEndpoint parse_websocket_url(const std::string& url) {
    const std::string scheme = "ws://";
    if (url.rfind(scheme, 0) != 0) {
        throw TransportError("unsupported websocket url (only ws:// is supported): " + url);
    }
    std::string rest = url.substr(scheme.size());

    WebSocketEndpoint endpoint;
    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        endpoint.target = rest.substr(slash);
        rest = rest.substr(0, slash);
    }
    const auto parts = split(rest, ':');
    if (parts.size() > 2 || trim(parts[0]).empty()) {
        throw TransportError("malformed websocket url: " + url);
    }
    endpoint.host = trim(parts[0]);
    if (parts.size() == 2) {
        endpoint.port = trim(parts[1]);
        if (endpoint.port.empty() ||
            endpoint.port.find_first_not_of("0123456789") != std::string::npos) {
            throw TransportError("malformed websocket port in url: " + url);
        }
    }
    return endpoint;
}

WebSocketTransport::WebSocketTransport(double timeout_s, std::string user_agent, Logger logger)
    : timeout_s_(timeout_s), user_agent_(std::move(user_agent)), logger_(std::move(logger)) {
    if (timeout_s_ <= 0.0) {
        throw std::invalid_argument("websocket timeout must be positive");
    }
}

std::unique_ptr<MessageChannel> WebSocketTransport::connect(const std::string& url) {
    const auto endpoint = parse_websocket_url(url);
    auto channel = std::make_unique<WebSocketChannel>(logger_, timeout_s_);
    channel->open(endpoint, user_agent_);
    logger_.debug("websocket_connected", {{"host", endpoint.host}, {"port", endpoint.port},
                                          {"target", endpoint.target}});
    return channel;
}

}  // namespace fusionml
