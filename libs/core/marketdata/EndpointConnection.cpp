#include "EndpointConnection.hpp"
#include "Log.hpp"
#include <boost/asio/post.hpp>
#include <utility>

EndpointConnection::EndpointConnection(EndpointKind kind,
                                       EndpointAddress address,
                                       ReconnectPolicy policy,
                                       Strand& strand,
                                       TransportFactory& factory)
    : m_kind(kind)
    , m_address(std::move(address))
    , m_policy(policy)
    , m_strand(strand)
    , m_factory(factory)
    , m_reconnectTimer(strand)
{}

void EndpointConnection::open(CompletionCb done) {
    if (m_state.load() == EndpointState::Closed) {
        if (done) done(StreamError(ErrorKind::Caller, fmt::format("{} endpoint is closed", toString(m_kind))));
        return;
    }
    finishOpen(StreamError(ErrorKind::Connection, fmt::format("{} endpoint: connect superseded", toString(m_kind))));
    m_openDone = std::move(done);

    m_reconnectTimer.cancel();
    m_state.store(EndpointState::Connecting);
    m_cycleAttempts = 0;
    if (m_policy.backoffReset == BackoffReset::PerReconnect) {
        m_backoffAttempt = 0;
    }
    attemptOpen();
}

void EndpointConnection::attemptOpen() {
    const uint64_t gen = m_generation + 1; // assigned by openTransport
    openTransport([this, gen](std::optional<StreamError> err) {
        if (gen != m_generation) return; // closed or reopened while this attempt was in flight
        if (err) {
            attemptFailed(std::move(*err));
        } else {
            attemptSucceeded();
        }
    });
}

void EndpointConnection::attemptSucceeded() {
    const bool replay = m_everConnected;
    m_everConnected = true;
    m_state.store(EndpointState::Connected);
    if (m_cycleAttempts > 0) {
        LOG_I("ws", "{} endpoint connected after {} retry attempt(s)", toString(m_kind), m_cycleAttempts);
    }
    if (replay && m_onReconnected) m_onReconnected(m_kind);
    finishOpen(std::nullopt);
}

void EndpointConnection::attemptFailed(StreamError error) {
    if (m_state.load() == EndpointState::Connecting && !m_policy.enabled()) {
        m_state.store(EndpointState::Disconnected);
        LOG_W("ws", "{} endpoint: initial connect failed: {}", toString(m_kind), error.what());
        finishOpen(std::move(error));
        return;
    }
    LOG_W("ws", "{} endpoint: attempt {} failed: {}", toString(m_kind), m_cycleAttempts + 1, error.what());
    scheduleAttempt();
}

void EndpointConnection::finishOpen(std::optional<StreamError> err) {
    if (auto done = std::exchange(m_openDone, nullptr)) {
        done(std::move(err));
    }
}

void EndpointConnection::openTransport(CompletionCb done) {
    dropTransport();
    const uint64_t gen = ++m_generation;

    auto transport = m_factory(m_kind);
    if (!transport) {
        done(StreamError(ErrorKind::Connection, fmt::format("no transport available for {} endpoint", toString(m_kind))));
        return;
    }
    m_transport = transport;

    transport->onFrame([this, gen](Frame frame) {
        net::post(m_strand, [this, gen, f = std::move(frame)]() mutable {
            handleFrame(gen, std::move(f));
        });
    });

    LOG_D("ws", "{} endpoint: connecting to {}:{}{} (generation {})",
          toString(m_kind), m_address.host, m_address.port, m_address.target, gen);
    transport->connect(m_address, [this, gen, done = std::move(done)](std::optional<StreamError> err) mutable {
        net::post(m_strand, [this, gen, done = std::move(done), err = std::move(err)]() mutable {
            if (gen != m_generation) {
                done(StreamError(ErrorKind::Connection, "connection attempt superseded"));
                return;
            }
            if (err) {
                m_transport.reset();
                done(std::move(err));
                return;
            }
            LOG_I("ws", "{} endpoint connected", toString(m_kind));
            done(std::nullopt);
        });
    });
}

void EndpointConnection::attach(FrameHandler handler) {
    m_handler = std::move(handler);
    while (m_handler && !m_pending.empty()) {
        Frame f = std::move(m_pending.front());
        m_pending.pop_front();
        m_handler(m_kind, std::move(f));
    }
}

void EndpointConnection::send(std::string text, CompletionCb done) {
    if (!connected()) {
        done(StreamError(ErrorKind::Connection, fmt::format("{} endpoint is not connected", toString(m_kind))));
        return;
    }
    m_transport->send(std::move(text), [this, done = std::move(done)](std::optional<StreamError> err) mutable {
        net::post(m_strand, [done = std::move(done), err = std::move(err)]() mutable {
            done(std::move(err));
        });
    });
}

void EndpointConnection::close() {
    m_state.store(EndpointState::Closed);
    m_reconnectTimer.cancel();
    ++m_generation;
    dropTransport();
    m_pending.clear();
    finishOpen(StreamError(ErrorKind::Connection, fmt::format("{} endpoint closed while connecting", toString(m_kind))));
}

void EndpointConnection::dropTransport() {
    if (auto old = std::exchange(m_transport, nullptr)) {
        old->close();
    }
}

void EndpointConnection::handleFrame(uint64_t generation, Frame frame) {
    if (generation != m_generation) {
        LOG_T("ws", "{} endpoint: dropping frame from stale transport", toString(m_kind));
        return;
    }

    if (frame.kind == FrameKind::Close || frame.kind == FrameKind::Error) {
        const char* what = frame.kind == FrameKind::Close ? "closed by peer" : "transport error";
        handleDrop(StreamError(ErrorKind::Connection,
                               fmt::format("{} endpoint {}: {}", toString(m_kind), what, frame.payload)));
        return;
    }

    if (m_handler) {
        m_handler(m_kind, std::move(frame));
    } else if (m_pending.size() < kMaxBufferedFrames) {
        m_pending.push_back(std::move(frame));
    } else {
        ++m_droppedFrames;
        LOG_EVERY_N(WARN, 1000, "ws", "{} endpoint: no listener attached, buffer full ({} frames); dropped {} so far",
                    toString(m_kind), kMaxBufferedFrames, m_droppedFrames);
    }
}

void EndpointConnection::handleDrop(StreamError error) {
    if (m_state.load() != EndpointState::Connected) return;

    LOG_W("ws", "{}", error.what());
    ++m_generation;
    dropTransport();

    if (!m_policy.enabled()) {
        fail(StreamError(ErrorKind::Connection, fmt::format("{} (reconnect disabled)", error.what())));
        return;
    }

    m_state.store(EndpointState::Reconnecting);
    m_cycleAttempts = 0;
    if (m_policy.backoffReset == BackoffReset::PerReconnect) {
        m_backoffAttempt = 0;
    }
    scheduleAttempt();
}

void EndpointConnection::scheduleAttempt() {
    if (m_cycleAttempts >= m_policy.maxRetries) {
        if (m_openDone) {
            // A caller is waiting on connect(): the failure is theirs, not a fatal.
            m_state.store(EndpointState::Disconnected);
            auto error = StreamError(ErrorKind::Connection,
                fmt::format("{} endpoint: connect failed after {} retry attempt(s)", toString(m_kind), m_cycleAttempts));
            LOG_W("ws", "{}", error.what());
            finishOpen(std::move(error));
        } else {
            fail(StreamError(ErrorKind::Connection,
                             fmt::format("{} endpoint: reconnect failed after {} attempts", toString(m_kind), m_cycleAttempts)));
        }
        return;
    }
    ++m_cycleAttempts;
    ++m_backoffAttempt;
    const auto delay = m_policy.delayFor(m_backoffAttempt);

    LOG_I("ws", "{} endpoint: retry {}/{} in {}ms",
          toString(m_kind), m_cycleAttempts, m_policy.maxRetries, delay.count());
    const uint64_t armed = m_generation;
    m_reconnectTimer.expires_after(delay);
    m_reconnectTimer.async_wait([this, armed](const boost::system::error_code& ec) {
        if (ec || armed != m_generation) return;
        const auto state = m_state.load();
        if (state != EndpointState::Connecting && state != EndpointState::Reconnecting) return;
        attemptOpen();
    });
}

void EndpointConnection::fail(StreamError error) {
    m_state.store(EndpointState::Closed);
    m_reconnectTimer.cancel();
    LOG_E("ws", "{}", error.what());
    if (m_onFatal) m_onFatal(m_kind, error);
}
