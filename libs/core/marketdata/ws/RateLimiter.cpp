#include "RateLimiter.hpp"
#include "Log.hpp"
#include "../StreamError.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <memory>

RateLimiter::RateLimiter(double maxTokens, double refillRate, Clock clock)
    : m_maxTokens(maxTokens)
    , m_refillRate(refillRate)
    , m_clock(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
    , m_tokens(maxTokens)
{
    if (m_maxTokens < 1.0) {
        throw StreamError(ErrorKind::Caller, "RateLimiter: max tokens must be at least 1");
    }
    if (m_refillRate <= 0.0) {
        throw StreamError(ErrorKind::Caller, "RateLimiter: refill rate must be positive");
    }
    m_lastRefill = m_clock();
}

void RateLimiter::refillLocked(std::chrono::steady_clock::time_point now) {
    if (now > m_lastRefill) {
        const std::chrono::duration<double> elapsed = now - m_lastRefill;
        m_tokens = std::min(m_maxTokens, m_tokens + elapsed.count() * m_refillRate);
    }
    m_lastRefill = now;
}

std::chrono::nanoseconds RateLimiter::tryConsume() {
    std::lock_guard<std::mutex> lock(m_mx);
    refillLocked(m_clock());

    if (m_tokens >= 1.0) {
        m_tokens -= 1.0;
        return std::chrono::nanoseconds::zero();
    }

    const std::chrono::duration<double> wait((1.0 - m_tokens) / m_refillRate);
    // Round up so the retry never wakes a hair before the token exists.
    return std::max(std::chrono::nanoseconds(1), std::chrono::ceil<std::chrono::nanoseconds>(wait));
}

void RateLimiter::asyncConsume(net::any_io_executor ex, std::function<void()> onToken) {
    const auto wait = tryConsume();
    if (wait == std::chrono::nanoseconds::zero()) {
        net::post(ex, std::move(onToken));
        return;
    }

    LOG_T("ratelimit", "bucket empty, waiting {}us", std::chrono::duration_cast<std::chrono::microseconds>(wait).count());
    auto timer = std::make_shared<net::steady_timer>(ex, wait);
    timer->async_wait([this, ex, timer, cb = std::move(onToken)](const boost::system::error_code& ec) mutable {
        if (ec) {
            // Only operation_aborted reaches here: the executor is shutting down.
            LOG_D("ratelimit", "token wait cancelled: {}", ec.message());
            return;
        }
        asyncConsume(ex, std::move(cb));
    });
}

double RateLimiter::available() {
    std::lock_guard<std::mutex> lock(m_mx);
    refillLocked(m_clock());
    return m_tokens;
}
