#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace ch {
    inline constexpr const char* kStatus                = "status";
    inline constexpr const char* kCandles               = "candles";
    inline constexpr const char* kTicker                = "ticker";
    inline constexpr const char* kTickerBatch           = "ticker_batch";
    inline constexpr const char* kL2Subscribe           = "level2";
    inline constexpr const char* kL2Data                = "l2_data";
    inline constexpr const char* kTrades                = "market_trades";
    inline constexpr const char* kHeartbeats            = "heartbeats";
    inline constexpr const char* kUser                  = "user";
    inline constexpr const char* kFuturesBalanceSummary = "futures_balance_summary";
    inline constexpr const char* kSubscriptions         = "subscriptions";
}

enum class Channel {
    Status,
    Candles,
    Ticker,
    TickerBatch,
    Level2,
    MarketTrades,
    Heartbeats,
    User,
    FuturesBalanceSummary,
    Subscriptions,
};

enum class EndpointKind { Public, User };

inline constexpr std::array<Channel, 10> kAllChannels = {
    Channel::Status, Channel::Candles, Channel::Ticker, Channel::TickerBatch,
    Channel::Level2, Channel::MarketTrades, Channel::Heartbeats, Channel::User,
    Channel::FuturesBalanceSummary, Channel::Subscriptions,
};

inline constexpr std::array<EndpointKind, 2> kAllEndpoints = { EndpointKind::Public, EndpointKind::User };

// Wire name used in subscribe/unsubscribe frames.
inline constexpr const char* toString(Channel c) {
    switch (c) {
        case Channel::Status:                return ch::kStatus;
        case Channel::Candles:               return ch::kCandles;
        case Channel::Ticker:                return ch::kTicker;
        case Channel::TickerBatch:           return ch::kTickerBatch;
        case Channel::Level2:                return ch::kL2Subscribe;
        case Channel::MarketTrades:          return ch::kTrades;
        case Channel::Heartbeats:            return ch::kHeartbeats;
        case Channel::User:                  return ch::kUser;
        case Channel::FuturesBalanceSummary: return ch::kFuturesBalanceSummary;
        case Channel::Subscriptions:         return ch::kSubscriptions;
    }
    return "unknown";
}

inline constexpr const char* toString(EndpointKind k) {
    return k == EndpointKind::Public ? "public" : "user";
}

// Inbound tag -> Channel. Level2 data arrives tagged "l2_data".
inline std::optional<Channel> channelFromString(std::string_view s) {
    if (s == ch::kL2Data) return Channel::Level2;
    for (Channel c : kAllChannels) {
        if (s == toString(c)) return c;
    }
    return std::nullopt;
}

inline constexpr EndpointKind endpointFor(Channel c) {
    switch (c) {
        case Channel::User:
        case Channel::FuturesBalanceSummary:
            return EndpointKind::User;
        default:
            return EndpointKind::Public;
    }
}

inline constexpr std::size_t indexOf(EndpointKind k) {
    return k == EndpointKind::Public ? 0 : 1;
}
