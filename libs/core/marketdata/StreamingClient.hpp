#pragma once
/*
Slipstream — StreamingClient
Role: Owns the Public and User endpoint connections; subscribe/unsubscribe, a merged listen loop, and reconnect-with-resubscribe.
Inputs/Outputs: Control calls in; parsed Messages (or per-frame errors), fatal endpoint errors and completions out via callbacks.
Threading: All state lives on one strand of the caller's io_context. Public methods may be called from any thread.
Performance: Control frames are gated by one token bucket per endpoint; inbound frames are parsed once on the strand.
Integration: Apps build it from a ClientConfig, a TransportFactory and an optional IAuthenticator, then run the io_context.
Observability: Logs connection lifecycle, control traffic and replay under the "client" category.
Related: StreamingClient.cpp, EndpointConnection.hpp, SubscriptionRegistry.hpp, RateLimiter.hpp, CandleWatcher.hpp.
Assumptions: The client outlives the io_context run; call stop() and let the loop drain before destroying it.
*/
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ssl/context.hpp>
#include "EndpointConnection.hpp"
#include "CandleWatcher.hpp"
#include "StreamError.hpp"
#include "auth/IAuthenticator.hpp"
#include "config/ClientConfig.hpp"
#include "dispatch/Channels.hpp"
#include "dispatch/Message.hpp"
#include "ws/ControlMessage.hpp"
#include "ws/RateLimiter.hpp"
#include "ws/SubscriptionRegistry.hpp"

namespace net = boost::asio;
namespace ssl = net::ssl;

class StreamingClient {
public:
    using MessageCb = std::function<void(const MessageResult&)>;
    using FatalCb   = std::function<void(EndpointKind, const StreamError&)>;

    /// Throws StreamError(Caller) when the configuration enables no endpoint.
    StreamingClient(net::io_context& ioc,
                    ClientConfig config,
                    TransportFactory transports,
                    std::shared_ptr<IAuthenticator> auth = nullptr);

    /// Transports backed by Boost.Beast over TLS. Both references must outlive the client.
    static TransportFactory beastTransports(net::io_context& ioc, ssl::context& sslCtx);

    /// Opens every enabled endpoint. `done` fires once all have finished.
    void connect(CompletionCb done);

    /// Throws StreamError(Caller) if the channel's endpoint is disabled, and
    /// StreamError(Authentication) for a user channel without an authenticator.
    /// Everything else is reported through `done`.
    void subscribe(Channel channel, std::vector<std::string> productIds, CompletionCb done = {});
    void unsubscribe(Channel channel, std::vector<std::string> productIds, CompletionCb done = {});

    /// Routes frames of `kinds` to `onMessage`. Frames received before this call are replayed first.
    void listen(std::vector<EndpointKind> kinds, MessageCb onMessage, FatalCb onFatal = {});
    /// Same, for every enabled endpoint.
    void listen(MessageCb onMessage, FatalCb onFatal = {});

    /// Listens on Public with a CandleWatcher, then subscribes heartbeats and candles for `productIds`.
    void watchCandles(std::vector<std::string> productIds,
                      CandleWatcher::CandleCb onCandle,
                      CompletionCb done = {},
                      FatalCb onFatal = {},
                      CandleWatcher::WallClock clock = {});

    /// Closes every endpoint. No fatal callback fires for a requested stop.
    void stop();

    [[nodiscard]] bool isEnabled(EndpointKind kind) const { return m_config.isEnabled(kind); }
    /// Disabled endpoints report Closed.
    [[nodiscard]] EndpointState state(EndpointKind kind) const;
    [[nodiscard]] const SubscriptionRegistry& subscriptions() const { return m_registry; }
    [[nodiscard]] RateLimiter& rateLimiter(EndpointKind kind);
    [[nodiscard]] const ClientConfig& config() const { return m_config; }

    StreamingClient(const StreamingClient&) = delete;
    StreamingClient& operator=(const StreamingClient&) = delete;

private:
    void request(ControlAction action, Channel channel, std::vector<std::string> productIds, CompletionCb done);
    void sendControl(ControlAction action, Channel channel, std::vector<std::string> productIds, CompletionCb done);
    void writeControl(ControlAction action, Channel channel, std::vector<std::string> productIds, CompletionCb done);
    void replaySubscriptions(EndpointKind kind);
    void handleFrame(EndpointKind kind, Frame frame);
    void reportFatal(EndpointKind kind, const StreamError& error);
    void requireEnabled(EndpointKind kind, const char* what) const;

    EndpointConnection& connection(EndpointKind kind) { return *m_connections[indexOf(kind)]; }

    ClientConfig                    m_config;
    std::shared_ptr<IAuthenticator> m_auth;
    TransportFactory                m_transports;
    EndpointConnection::Strand      m_strand;

    SubscriptionRegistry m_registry;
    std::array<std::unique_ptr<RateLimiter>, kAllEndpoints.size()>        m_limiters;
    std::array<std::unique_ptr<EndpointConnection>, kAllEndpoints.size()> m_connections;

    // Strand-only.
    std::array<MessageCb, kAllEndpoints.size()> m_onMessage;
    std::array<FatalCb, kAllEndpoints.size()>   m_onFatal;
};
