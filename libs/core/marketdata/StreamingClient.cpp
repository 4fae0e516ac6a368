#include "StreamingClient.hpp"
#include "Log.hpp"
#include "Cpp20Utils.hpp"
#include "dispatch/MessageDispatcher.hpp"
#include "ws/BeastWsTransport.hpp"
#include <boost/asio/post.hpp>
#include <fmt/ranges.h>

namespace {

void complete(const CompletionCb& done, std::optional<StreamError> err) {
    if (!done) {
        if (err) LOG_W("client", "unobserved {} error: {}", toString(err->kind()), err->what());
        return;
    }
    try {
        done(std::move(err));
    } catch (const std::exception& ex) {
        LOG_E("client", "completion handler threw: {}", ex.what());
    }
}

} // namespace

StreamingClient::StreamingClient(net::io_context& ioc,
                                 ClientConfig config,
                                 TransportFactory transports,
                                 std::shared_ptr<IAuthenticator> auth)
    : m_config(std::move(config))
    , m_auth(std::move(auth))
    , m_transports(std::move(transports))
    , m_strand(net::make_strand(ioc))
{
    m_config.validate();
    if (!m_transports) {
        throw StreamError(ErrorKind::Caller, "StreamingClient: a transport factory is required");
    }

    for (EndpointKind kind : kAllEndpoints) {
        if (!m_config.isEnabled(kind)) continue;
        const auto i = indexOf(kind);
        m_limiters[i] = std::make_unique<RateLimiter>(m_config.rateLimit.maxTokens, m_config.rateLimit.refillRate);
        m_connections[i] = std::make_unique<EndpointConnection>(
            kind, m_config.address(kind), m_config.reconnect, m_strand, m_transports);
        m_connections[i]->onReconnected([this](EndpointKind k) { replaySubscriptions(k); });
        m_connections[i]->onFatal([this](EndpointKind k, const StreamError& e) { reportFatal(k, e); });
    }

    if (m_config.enableUser && !m_auth) {
        LOG_W("client", "user endpoint enabled without an authenticator; user channels will be rejected");
    }
    LOG_I("client", "StreamingClient initialized (public={}, user={})", m_config.enablePublic, m_config.enableUser);
}

TransportFactory StreamingClient::beastTransports(net::io_context& ioc, ssl::context& sslCtx) {
    return [&ioc, &sslCtx](EndpointKind) -> std::shared_ptr<WsTransport> {
        return std::make_shared<BeastWsTransport>(ioc, sslCtx);
    };
}

void StreamingClient::requireEnabled(EndpointKind kind, const char* what) const {
    if (!m_config.isEnabled(kind)) {
        throw StreamError(ErrorKind::Caller, fmt::format("{}: the {} endpoint is disabled", what, toString(kind)));
    }
}

void StreamingClient::connect(CompletionCb done) {
    net::post(m_strand, [this, done = std::move(done)]() mutable {
        struct Pending {
            std::size_t remaining = 0;
            std::optional<StreamError> firstError;
            CompletionCb done;
        };
        auto pending = std::make_shared<Pending>();
        pending->done = std::move(done);
        for (EndpointKind kind : kAllEndpoints) {
            if (m_config.isEnabled(kind)) ++pending->remaining;
        }

        for (EndpointKind kind : kAllEndpoints) {
            if (!m_config.isEnabled(kind)) continue;
            connection(kind).open([pending, kind](std::optional<StreamError> err) {
                if (err && !pending->firstError) {
                    pending->firstError = StreamError(ErrorKind::Connection,
                        fmt::format("{} endpoint: {}", toString(kind), err->what()));
                }
                if (--pending->remaining == 0) {
                    complete(pending->done, std::move(pending->firstError));
                }
            });
        }
    });
}

void StreamingClient::subscribe(Channel channel, std::vector<std::string> productIds, CompletionCb done) {
    request(ControlAction::Subscribe, channel, std::move(productIds), std::move(done));
}

void StreamingClient::unsubscribe(Channel channel, std::vector<std::string> productIds, CompletionCb done) {
    request(ControlAction::Unsubscribe, channel, std::move(productIds), std::move(done));
}

void StreamingClient::request(ControlAction action, Channel channel,
                              std::vector<std::string> productIds, CompletionCb done) {
    const auto kind = endpointFor(channel);
    if (!m_config.isEnabled(kind)) {
        throw StreamError(ErrorKind::Caller, fmt::format("cannot {} {}: the {} endpoint is disabled",
                                                         toString(action), toString(channel), toString(kind)));
    }
    if (kind == EndpointKind::User && !m_auth) {
        throw StreamError(ErrorKind::Authentication, fmt::format("cannot {} {}: no authenticator configured",
                                                                 toString(action), toString(channel)));
    }

    net::post(m_strand, [this, action, channel, ids = std::move(productIds), done = std::move(done)]() mutable {
        sendControl(action, channel, std::move(ids), std::move(done));
    });
}

void StreamingClient::sendControl(ControlAction action, Channel channel,
                                  std::vector<std::string> productIds, CompletionCb done) {
    const auto kind = endpointFor(channel);
    if (!connection(kind).connected()) {
        const auto state = connection(kind).state();
        if (state == EndpointState::Connecting || state == EndpointState::Reconnecting) {
            complete(done, StreamError(ErrorKind::Connection,
                                       fmt::format("{} endpoint is {}; retry once connected", toString(kind), toString(state))));
        } else {
            complete(done, StreamError(ErrorKind::Caller,
                                       fmt::format("{} endpoint is not connected; connect first", toString(kind))));
        }
        return;
    }

    m_limiters[indexOf(kind)]->asyncConsume(m_strand,
        [this, action, channel, ids = std::move(productIds), done = std::move(done)]() mutable {
            writeControl(action, channel, std::move(ids), std::move(done));
        });
}

void StreamingClient::writeControl(ControlAction action, Channel channel,
                                   std::vector<std::string> productIds, CompletionCb done) {
    const auto kind = endpointFor(channel);

    std::string text;
    if (kind == EndpointKind::Public) {
        text = ControlMessage::buildPublic(action, channel, productIds, Cpp20Utils::unixSecondsNow());
    } else {
        std::string jwt;
        try {
            jwt = m_auth->createJwt();
        } catch (const std::exception& ex) {
            complete(done, StreamError(ErrorKind::Authentication, fmt::format("signing failed: {}", ex.what())));
            return;
        }
        text = ControlMessage::buildUser(action, channel, productIds, jwt);
    }

    LOG_D("client", "{} {} [{}] on {}", toString(action), toString(channel),
          fmt::join(productIds, ","), toString(kind));

    connection(kind).send(std::move(text),
        [this, action, kind, channel, ids = std::move(productIds), done = std::move(done)](std::optional<StreamError> err) {
            if (err) {
                complete(done, StreamError(ErrorKind::Connection,
                                           fmt::format("{} {} failed: {}", toString(action), toString(channel), err->what())));
                return;
            }
            if (action == ControlAction::Subscribe) {
                m_registry.add(kind, channel, ids);
            } else {
                m_registry.remove(kind, channel, ids);
            }
            complete(done, std::nullopt);
        });
}

void StreamingClient::replaySubscriptions(EndpointKind kind) {
    const auto snapshot = m_registry.snapshot(kind);
    LOG_I("client", "replaying {} subscription(s) on {} endpoint", snapshot.size(), toString(kind));
    for (const auto& [channel, ids] : snapshot) {
        sendControl(ControlAction::Subscribe, channel, ids, [kind, channel = channel](std::optional<StreamError> err) {
            if (err) {
                LOG_W("client", "resubscribe {} on {} failed: {}", toString(channel), toString(kind), err->what());
            }
        });
    }
}

void StreamingClient::listen(std::vector<EndpointKind> kinds, MessageCb onMessage, FatalCb onFatal) {
    for (EndpointKind kind : kinds) {
        requireEnabled(kind, "listen");
    }
    net::post(m_strand, [this, kinds = std::move(kinds), onMessage = std::move(onMessage), onFatal = std::move(onFatal)]() mutable {
        for (EndpointKind kind : kinds) {
            m_onMessage[indexOf(kind)] = onMessage;
            m_onFatal[indexOf(kind)] = onFatal;
            connection(kind).attach([this](EndpointKind k, Frame f) { handleFrame(k, std::move(f)); });
            LOG_D("client", "listening on {} endpoint", toString(kind));
        }
    });
}

void StreamingClient::listen(MessageCb onMessage, FatalCb onFatal) {
    std::vector<EndpointKind> kinds;
    for (EndpointKind kind : kAllEndpoints) {
        if (m_config.isEnabled(kind)) kinds.push_back(kind);
    }
    listen(std::move(kinds), std::move(onMessage), std::move(onFatal));
}

void StreamingClient::handleFrame(EndpointKind kind, Frame frame) {
    switch (frame.kind) {
        case FrameKind::Ping:
        case FrameKind::Pong:
            LOG_T("client", "{} on {} endpoint", frame.kind == FrameKind::Ping ? "ping" : "pong", toString(kind));
            return;
        case FrameKind::Close:
        case FrameKind::Error:
            return; // handled by the connection
        case FrameKind::Text:
        case FrameKind::Binary:
            break;
    }

    const MessageResult result = MessageDispatcher::parse(frame.payload);
    if (const auto* err = std::get_if<StreamError>(&result)) {
        LOG_EVERY_N(WARN, 100, "client", "{} endpoint: {}", toString(kind), err->what());
    }

    const auto& cb = m_onMessage[indexOf(kind)];
    if (!cb) return;
    try {
        cb(result);
    } catch (const std::exception& ex) {
        LOG_E("client", "message handler threw: {}", ex.what());
    }
}

void StreamingClient::reportFatal(EndpointKind kind, const StreamError& error) {
    const auto& cb = m_onFatal[indexOf(kind)];
    if (!cb) return;
    try {
        cb(kind, error);
    } catch (const std::exception& ex) {
        LOG_E("client", "fatal handler threw: {}", ex.what());
    }
}

void StreamingClient::watchCandles(std::vector<std::string> productIds,
                                   CandleWatcher::CandleCb onCandle,
                                   CompletionCb done,
                                   FatalCb onFatal,
                                   CandleWatcher::WallClock clock) {
    auto watcher = std::make_shared<CandleWatcher>(std::move(onCandle), std::move(clock));
    listen({EndpointKind::Public},
           [watcher](const MessageResult& result) { watcher->onMessage(result); },
           std::move(onFatal));

    subscribe(Channel::Heartbeats, {},
        [this, ids = std::move(productIds), done = std::move(done)](std::optional<StreamError> err) mutable {
            if (err) {
                complete(done, std::move(err));
                return;
            }
            subscribe(Channel::Candles, std::move(ids), std::move(done));
        });
}

void StreamingClient::stop() {
    net::post(m_strand, [this] {
        LOG_I("client", "stopping");
        for (auto& conn : m_connections) {
            if (conn) conn->close();
        }
    });
}

EndpointState StreamingClient::state(EndpointKind kind) const {
    const auto& conn = m_connections[indexOf(kind)];
    return conn ? conn->state() : EndpointState::Closed;
}

RateLimiter& StreamingClient::rateLimiter(EndpointKind kind) {
    requireEnabled(kind, "rateLimiter");
    return *m_limiters[indexOf(kind)];
}
