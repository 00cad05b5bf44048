#ifndef FUSIONML_TRANSPORT_HPP
#define FUSIONML_TRANSPORT_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace fusionml {

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    // std::nullopt means the peer closed the channel.
    virtual std::optional<std::string> receive() = 0;
    virtual std::optional<std::string> receive_for(double timeout_s) = 0;
    virtual void send(const std::string& frame) = 0;

    // Owning thread only; bounded by the channel's timeout.
    virtual void close() = 0;

    // Any thread, never blocks. Wakes a pending receive() with std::nullopt.
    virtual void abort() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual std::unique_ptr<MessageChannel> connect(const std::string& url) = 0;
};

}  // namespace fusionml

#endif  // FUSIONML_TRANSPORT_HPP
