#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include "dispatch/Message.hpp"
#include "model/Candle.h"

// Turns the stream of partial candle updates into completed candles. A product's
// candle is complete once an update with a later start arrives for it.
class CandleWatcher {
public:
    // Bucket width of the candles channel, fixed by the service.
    static constexpr uint64_t kGranularitySeconds = 300;

    using CandleCb  = std::function<void(uint64_t now, const std::string& productId, const Candle& candle)>;
    using WallClock = std::function<uint64_t()>; // unix seconds

    explicit CandleWatcher(CandleCb onCandle, WallClock clock = {});

    /// Feed for StreamingClient::listen. Errors are logged and change nothing.
    void onMessage(const MessageResult& result);

    void process(const Message& msg);

    [[nodiscard]] std::optional<Candle> current(const std::string& productId) const;
    [[nodiscard]] std::size_t trackedProducts() const { return m_candles.size(); }

private:
    void update(const std::string& productId, const Candle& candle);

    CandleCb  m_onCandle;
    WallClock m_clock;
    std::unordered_map<std::string, Candle> m_candles; // latest in-progress candle per product
};
