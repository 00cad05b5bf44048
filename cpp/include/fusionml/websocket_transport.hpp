#ifndef FUSIONML_WEBSOCKET_TRANSPORT_HPP
#define FUSIONML_WEBSOCKET_TRANSPORT_HPP

#include <memory>
#include <string>

#include "fusionml/logging.hpp"
#include "fusionml/transport.hpp"

namespace fusionml {

struct WebSocketEndpoint {
    std::string host;
    std::string port = "80";
    std::string target = "/";
};

WebSocketEndpoint parse_websocket_url(const std::string& url);

class WebSocketTransport : public Transport {
public:
    explicit WebSocketTransport(double timeout_s = 10.0, std::string user_agent = "fusionml",
                                Logger logger = get_logger("WebSocketTransport"));

    std::unique_ptr<MessageChannel> connect(const std::string& url) override;

private:
    double timeout_s_;
    std::string user_agent_;
    Logger logger_;
};

}  // namespace fusionml

#endif  // FUSIONML_WEBSOCKET_TRANSPORT_HPP
