#pragma once
/*
Slipstream — RateLimiter
Role: Token bucket gating outbound subscribe/unsubscribe frames for one traffic class.
Inputs/Outputs: asyncConsume() completes a handler once a token has been deducted.
Threading: Refill-and-consume is a single critical section; safe from any thread.
Performance: Waiting callers park on a steady_timer; no thread ever sleeps.
Integration: StreamingClient owns one instance per EndpointKind.
Observability: None; a wait is latency, not an error.
Related: RateLimiter.cpp, StreamingClient.hpp.
Assumptions: The limiter outlives every pending asyncConsume() on its executor.
*/
#include <boost/asio/any_io_executor.hpp>
#include <chrono>
#include <functional>
#include <mutex>

namespace net = boost::asio;

class RateLimiter {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    // Streaming limits published by the service: 750 frames/s per connection class.
    static constexpr double kStreamingMaxTokens  = 750.0;
    static constexpr double kStreamingRefillRate = 750.0;

    /// Bucket starts full. `clock` defaults to steady_clock::now.
    RateLimiter(double maxTokens, double refillRate, Clock clock = {});

    /// One refill-then-consume attempt. Returns zero when a token was taken,
    /// otherwise the exact wait until the next token.
    [[nodiscard]] std::chrono::nanoseconds tryConsume();

    /// Waits (asynchronously) for a token, deducts it, then posts `onToken` to `ex`.
    void asyncConsume(net::any_io_executor ex, std::function<void()> onToken);

    /// Tokens currently in the bucket, refilled up to now.
    [[nodiscard]] double available();

    double maxTokens() const { return m_maxTokens; }
    double refillRate() const { return m_refillRate; }

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

private:
    void refillLocked(std::chrono::steady_clock::time_point now);

    const double m_maxTokens;
    const double m_refillRate;
    Clock        m_clock;

    std::mutex   m_mx;
    double       m_tokens;
    std::chrono::steady_clock::time_point m_lastRefill;
};
