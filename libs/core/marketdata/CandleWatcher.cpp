#include "CandleWatcher.hpp"
#include "Cpp20Utils.hpp"
#include "Log.hpp"
#include <algorithm>
#include <unordered_set>
#include <vector>

CandleWatcher::CandleWatcher(CandleCb onCandle, WallClock clock)
    : m_onCandle(std::move(onCandle))
    , m_clock(clock ? std::move(clock) : WallClock([] { return Cpp20Utils::unixSecondsNow(); }))
{}

void CandleWatcher::onMessage(const MessageResult& result) {
    if (const auto* err = std::get_if<StreamError>(&result)) {
        LOG_W("candles", "ignoring {} error: {}", toString(err->kind()), err->what());
        return;
    }
    process(std::get<Message>(result));
}

void CandleWatcher::process(const Message& msg) {
    if (msg.channel != Channel::Candles) return;

    std::vector<const CandleUpdate*> updates;
    for (const auto& ev : msg.events) {
        if (const auto* candles = std::get_if<CandlesEvent>(&ev)) {
            for (const auto& u : candles->candles) updates.push_back(&u);
        }
    }
    if (updates.empty()) return;

    // Newest first; only the most recent update per product in this frame counts.
    std::stable_sort(updates.begin(), updates.end(), [](const CandleUpdate* a, const CandleUpdate* b) {
        return a->candle.start > b->candle.start;
    });

    std::unordered_set<std::string> seen;
    for (const auto* u : updates) {
        if (seen.insert(u->product_id).second) {
            update(u->product_id, u->candle);
        }
    }
}

void CandleWatcher::update(const std::string& productId, const Candle& candle) {
    auto it = m_candles.find(productId);
    if (it == m_candles.end()) {
        m_candles.emplace(productId, candle);
        return;
    }

    if (candle.start > it->second.start) {
        const Candle completed = it->second;
        it->second = candle;

        const uint64_t t = m_clock();
        const uint64_t now = t - t % (2 * kGranularitySeconds);
        LOG_D("candles", "{} candle {} complete", productId, completed.start);
        if (m_onCandle) m_onCandle(now, productId, completed);
        return;
    }

    it->second = candle;
}

std::optional<Candle> CandleWatcher::current(const std::string& productId) const {
    auto it = m_candles.find(productId);
    if (it == m_candles.end()) return std::nullopt;
    return it->second;
}
