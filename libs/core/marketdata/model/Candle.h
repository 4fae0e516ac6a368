#pragma once
#include <cstdint>
#include <string>

// OHLCV bucket as published on the candles channel. `start` is unix seconds.
struct Candle {
    uint64_t start = 0;
    double low = 0.0;
    double high = 0.0;
    double open = 0.0;
    double close = 0.0;
    double volume = 0.0;

    bool operator==(const Candle&) const = default;
};

// One entry of a candles event: product id plus the flattened candle fields.
struct CandleUpdate {
    std::string product_id;
    Candle candle;
};
