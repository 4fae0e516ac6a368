#include "BeastWsTransport.hpp"
#include "Log.hpp"
#include <boost/beast/core.hpp>  // covers buffers, flat_buffer, etc.
#include <boost/asio/post.hpp>
#include <openssl/err.h>
#include <string_view>
#include <utility>

void BeastWsTransport::connect(EndpointAddress address, DoneCb done) {
    net::post(strand_, [self = shared_from_this(), a = std::move(address), d = std::move(done)]() mutable {
        self->address_ = std::move(a);
        self->onConnected_ = std::move(d);
        if (self->closing_) { self->failConnect("closed before connecting"); return; }
        LOG_D("ws", "resolving {}:{}", self->address_.host, self->address_.port);
        self->resolver_.async_resolve(self->address_.host, self->address_.port,
            [self](beast::error_code ec, tcp::resolver::results_type results){
                self->onResolve(ec, results);
            });
    });
}

void BeastWsTransport::close() {
    net::post(strand_, [self = shared_from_this()]{
        if (self->closing_) return;
        self->closing_ = true;
        self->ended_ = true; // a requested close reports nothing
        self->pingTimer_.cancel();
        self->resolver_.cancel();
        if (self->open_) {
            self->ws_.async_close(websocket::close_code::normal, [self](beast::error_code ec){
                self->open_ = false;
                if (ec) LOG_D("ws", "close {}: {}", self->address_.host, ec.message());
            });
        } else {
            beast::get_lowest_layer(self->ws_).cancel();
        }
    });
}

void BeastWsTransport::send(std::string msg, DoneCb done) {
    net::post(strand_, [self = shared_from_this(), m = std::move(msg), d = std::move(done)]() mutable {
        if (!self->open_ || self->closing_) {
            if (d) d(StreamError(ErrorKind::Connection, "send on a transport that is not open"));
            return;
        }
        self->writeQueue_.push_back(PendingWrite{std::move(m), std::move(d)});
        if (self->writeQueue_.size() == 1) {
            self->doWrite();
        }
    });
}

void BeastWsTransport::failConnect(const std::string& what) {
    LOG_W("ws", "connect to {} failed: {}", address_.host, what);
    beast::get_lowest_layer(ws_).close();
    if (auto done = std::exchange(onConnected_, nullptr)) {
        done(StreamError(ErrorKind::Connection, "connect to " + address_.host + " failed: " + what));
    }
}

void BeastWsTransport::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) { failConnect(ec.message()); return; }
    if (closing_) { failConnect("closed while resolving"); return; }
    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(ws_).async_connect(results,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type ep){
            self->onConnect(ec, ep);
        });
}

void BeastWsTransport::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) { failConnect(ec.message()); return; }
    if (closing_) { failConnect("closed while connecting"); return; }
    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), address_.host.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        failConnect(ssl_ec.message());
        return;
    }
    if (!SSL_set1_host(ws_.next_layer().native_handle(), address_.host.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        failConnect(ssl_ec.message());
        return;
    }
    ws_.next_layer().set_verify_mode(ssl::verify_peer);
    ws_.next_layer().async_handshake(ssl::stream_base::client,
        [self = shared_from_this()](beast::error_code ec){ self->onSslHandshake(ec); });
}

void BeastWsTransport::onSslHandshake(beast::error_code ec) {
    if (ec) { failConnect(ec.message()); return; }
    if (closing_) { failConnect("closed during TLS handshake"); return; }
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.async_handshake(address_.host, address_.target,
        [self = shared_from_this()](beast::error_code ec){ self->onWsHandshake(ec); });
}

void BeastWsTransport::onWsHandshake(beast::error_code ec) {
    if (ec) { failConnect(ec.message()); return; }
    if (closing_) { failConnect("closed during websocket handshake"); return; }
    open_ = true;

    // Beast answers pings itself; surface control frames so the reader can see them.
    std::weak_ptr<BeastWsTransport> weak = shared_from_this();
    ws_.control_callback([weak](websocket::frame_type kind, beast::string_view payload){
        auto self = weak.lock();
        if (!self) return;
        switch (kind) {
            case websocket::frame_type::ping:
                self->emit(Frame{FrameKind::Ping, std::string(payload)});
                break;
            case websocket::frame_type::pong:
                self->emit(Frame{FrameKind::Pong, std::string(payload)});
                break;
            case websocket::frame_type::close:
                break; // reported once by the failing read
        }
    });

    LOG_I("ws", "connected to {}{}", address_.host, address_.target);
    if (auto done = std::exchange(onConnected_, nullptr)) {
        done(std::nullopt);
    }
    doRead();
    schedulePing();
}

void BeastWsTransport::doRead() {
    ws_.async_read(buf_, [self = shared_from_this()](beast::error_code ec, std::size_t bytes){
        self->onRead(ec, bytes);
    });
}

void BeastWsTransport::onRead(beast::error_code ec, std::size_t) {
    if (ec) {
        open_ = false;
        if (ec == websocket::error::closed) {
            const auto& reason = ws_.reason();
            terminate(FrameKind::Close, std::string(reason.reason.c_str()));
        } else {
            terminate(FrameKind::Error, ec.message());
        }
        return;
    }

    auto b = buf_.data();
    std::string payload(static_cast<const char*>(b.data()), b.size());
    buf_.consume(buf_.size());
    emit(Frame{ws_.got_binary() ? FrameKind::Binary : FrameKind::Text, std::move(payload)});

    doRead();
}

void BeastWsTransport::doWrite() {
    if (writeQueue_.empty()) return;
    const auto& front = writeQueue_.front();
    ws_.text(true);
    ws_.async_write(net::buffer(front.text), [self = shared_from_this()](beast::error_code ec, std::size_t){
        auto done = std::move(self->writeQueue_.front().done);
        self->writeQueue_.pop_front();
        if (ec) {
            LOG_W("ws", "write to {} failed: {}", self->address_.host, ec.message());
            if (done) done(StreamError(ErrorKind::Connection, "write failed: " + ec.message()));
            // The stream is unusable after a failed write; fail everything queued behind it.
            while (!self->writeQueue_.empty()) {
                auto pending = std::move(self->writeQueue_.front().done);
                self->writeQueue_.pop_front();
                if (pending) pending(StreamError(ErrorKind::Connection, "write aborted: " + ec.message()));
            }
            return;
        }
        if (done) done(std::nullopt);
        if (!self->writeQueue_.empty()) self->doWrite();
    });
}

void BeastWsTransport::schedulePing() {
    pingTimer_.expires_after(kPingInterval);
    pingTimer_.async_wait([self = shared_from_this()](beast::error_code ec){
        if (ec || !self->open_ || self->closing_) return;
        self->ws_.async_ping({}, [self](beast::error_code ec2){
            if (ec2) {
                LOG_D("ws", "ping to {} failed: {}", self->address_.host, ec2.message());
                return; // the pending read reports the failure
            }
            self->schedulePing();
        });
    });
}

void BeastWsTransport::terminate(FrameKind kind, std::string reason) {
    pingTimer_.cancel();
    if (ended_) return;
    LOG_W("ws", "{} {}: {}", kind == FrameKind::Close ? "closed by" : "lost", address_.host, reason);
    emit(Frame{kind, std::move(reason)});
    ended_ = true;
}

void BeastWsTransport::emit(Frame frame) {
    if (ended_ || !onFrame_) return;
    onFrame_(std::move(frame));
}
