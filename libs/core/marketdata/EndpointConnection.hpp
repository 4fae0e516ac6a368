/*
Slipstream — EndpointConnection
Role: One logical connection (Public or User): owns the live transport, buffers frames until a listener attaches, and reconnects on its own.
Inputs/Outputs: Frames in from the transport; frames out to the attached handler; reconnected/fatal notifications to the owner.
Threading: Every member function runs on the owner's strand; transport callbacks are re-posted onto it.
Performance: One transport per endpoint; frames are moved, never copied, on the hot path.
Integration: Owned by StreamingClient, one per enabled EndpointKind.
Observability: Logs drops, reconnect attempts and exhaustion under the "ws" category.
Related: EndpointConnection.cpp, StreamingClient.hpp, WsTransport.hpp, ReconnectPolicy.hpp.
Assumptions: The owner outlives every pending timer and transport callback.
*/
#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include "StreamError.hpp"
#include "dispatch/Channels.hpp"
#include "ws/ReconnectPolicy.hpp"
#include "ws/WsTransport.hpp"

namespace net = boost::asio;

enum class EndpointState { Disconnected, Connecting, Connected, Reconnecting, Closed };

inline constexpr const char* toString(EndpointState s) {
    switch (s) {
        case EndpointState::Disconnected: return "disconnected";
        case EndpointState::Connecting:   return "connecting";
        case EndpointState::Connected:    return "connected";
        case EndpointState::Reconnecting: return "reconnecting";
        case EndpointState::Closed:       return "closed";
    }
    return "unknown";
}

using TransportFactory = std::function<std::shared_ptr<WsTransport>(EndpointKind)>;
using CompletionCb     = std::function<void(std::optional<StreamError>)>;

class EndpointConnection {
public:
    using Strand       = net::strand<net::io_context::executor_type>;
    using FrameHandler = std::function<void(EndpointKind, Frame)>;
    using FatalHandler = std::function<void(EndpointKind, const StreamError&)>;
    using ReconnectedHandler = std::function<void(EndpointKind)>;

    EndpointConnection(EndpointKind kind,
                       EndpointAddress address,
                       ReconnectPolicy policy,
                       Strand& strand,
                       TransportFactory& factory);

    /// Opens a fresh transport, replacing any prior one. A refused attempt is retried on the
    /// reconnect schedule; `done` sees the error only once retries run out or reconnect is off.
    /// Reopening an endpoint that was connected before replays through onReconnected.
    void open(CompletionCb done);

    /// Frames held for a listener that has not attached yet; later arrivals are dropped.
    static constexpr std::size_t kMaxBufferedFrames = 4096;

    /// Delivers buffered frames in arrival order, then every later frame, to `handler`.
    void attach(FrameHandler handler);

    /// Writes one text frame; `done` runs on the strand. Fails with Connection when not connected.
    void send(std::string text, CompletionCb done);

    /// Terminal. Cancels any reconnect cycle; no fatal notification follows.
    void close();

    void onReconnected(ReconnectedHandler h) { m_onReconnected = std::move(h); }
    void onFatal(FatalHandler h) { m_onFatal = std::move(h); }

    EndpointKind kind() const { return m_kind; }
    EndpointState state() const { return m_state.load(); }
    bool connected() const { return m_state.load() == EndpointState::Connected && m_transport != nullptr; }
    bool attached() const { return static_cast<bool>(m_handler); }
    std::size_t bufferedFrames() const { return m_pending.size(); }
    uint64_t droppedFrames() const { return m_droppedFrames; }

    EndpointConnection(const EndpointConnection&) = delete;
    EndpointConnection& operator=(const EndpointConnection&) = delete;

private:
    void openTransport(CompletionCb done);
    void attemptOpen();
    void attemptSucceeded();
    void attemptFailed(StreamError error);
    void finishOpen(std::optional<StreamError> err);
    void handleFrame(uint64_t generation, Frame frame);
    void handleDrop(StreamError error);
    void scheduleAttempt();
    void fail(StreamError error);
    void dropTransport();

    const EndpointKind    m_kind;
    const EndpointAddress m_address;
    const ReconnectPolicy m_policy;
    Strand&               m_strand;
    TransportFactory&     m_factory;

    std::shared_ptr<WsTransport> m_transport;
    uint64_t                     m_generation = 0; // frames from older transports are ignored
    std::atomic<EndpointState>   m_state{EndpointState::Disconnected};

    FrameHandler       m_handler;
    std::deque<Frame>  m_pending;
    uint64_t           m_droppedFrames = 0;

    net::steady_timer  m_reconnectTimer;
    uint32_t           m_backoffAttempt = 0; // index into the delay schedule
    uint32_t           m_cycleAttempts  = 0; // retries in the current connect or reconnect cycle
    CompletionCb       m_openDone;           // pending connect() caller, if any
    bool               m_everConnected = false;

    ReconnectedHandler m_onReconnected;
    FatalHandler       m_onFatal;
};
