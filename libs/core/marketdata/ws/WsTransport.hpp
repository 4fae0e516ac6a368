#pragma once
#include "../StreamError.hpp"
#include <functional>
#include <optional>
#include <string>

struct EndpointAddress {
    std::string host;
    std::string port = "443";
    std::string target = "/";
};

enum class FrameKind { Text, Binary, Ping, Pong, Close, Error };

struct Frame {
    FrameKind   kind = FrameKind::Text;
    std::string payload; // message body, close reason or error text
};

// Pure transport interface (no provider logic). One instance carries one
// connection; reconnecting means building a fresh transport.
class WsTransport {
public:
    using FrameCb = std::function<void(Frame)>; // own the data to avoid dangling views
    using DoneCb  = std::function<void(std::optional<StreamError>)>;

    WsTransport() = default;
    virtual ~WsTransport() = default;

    virtual void connect(EndpointAddress address, DoneCb done) = 0;
    virtual void send(std::string msg, DoneCb done) = 0; // serialized by implementation, FIFO
    virtual void close() = 0;

    // Set before connect(). Close and Error are terminal: nothing follows them.
    virtual void onFrame(FrameCb cb) = 0;

    WsTransport(const WsTransport&) = delete;
    WsTransport& operator=(const WsTransport&) = delete;
};
