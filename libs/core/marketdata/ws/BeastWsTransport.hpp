#pragma once
#include "WsTransport.hpp"
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>  // ensure tcp_stream is declared
#include <boost/asio/ip/tcp.hpp>
#include <deque>
#include <memory>
#include <string>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

class BeastWsTransport : public WsTransport, public std::enable_shared_from_this<BeastWsTransport> {
public:
    // Keepalive ping interval; the service drops idle sockets.
    static constexpr std::chrono::seconds kPingInterval{25};

    BeastWsTransport(net::io_context& ioc, ssl::context& sslCtx)
        : strand_(net::make_strand(ioc))
        , resolver_(strand_)
        , ws_(strand_, sslCtx)
        , pingTimer_(strand_)
    {}

    void connect(EndpointAddress address, DoneCb done) override;
    void close() override;
    void send(std::string msg, DoneCb done) override;

    void onFrame(FrameCb cb) override { onFrame_ = std::move(cb); }

private:
    struct PendingWrite {
        std::string text;
        DoneCb      done;
    };

    // Callbacks
    FrameCb onFrame_;
    DoneCb  onConnected_;

    // Beast state
    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
    beast::flat_buffer buf_;
    net::steady_timer pingTimer_;
    std::deque<PendingWrite> writeQueue_;

    // State
    EndpointAddress address_;
    bool open_    = false;
    bool closing_ = false;
    bool ended_   = false; // terminal frame delivered

    // Handlers
    void onResolve(beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type);
    void onSslHandshake(beast::error_code ec);
    void onWsHandshake(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void doWrite();
    void schedulePing();

    void failConnect(const std::string& what);
    void terminate(FrameKind kind, std::string reason);
    void emit(Frame frame);
};
