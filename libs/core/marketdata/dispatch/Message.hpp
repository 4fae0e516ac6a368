#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "Channels.hpp"
#include "../StreamError.hpp"
#include "../model/Candle.h"

enum class EventType { Snapshot, Update };

enum class Level2Side { Bid, Ask };

struct HeartbeatsEvent {
    std::string current_time;
    uint64_t heartbeat_counter = 0;
};

struct CandlesEvent {
    EventType type = EventType::Update;
    std::vector<CandleUpdate> candles;
};

struct TickerUpdate {
    std::string type;
    std::string product_id;
    double price = 0.0;
    double volume_24_h = 0.0;
    double low_24_h = 0.0;
    double high_24_h = 0.0;
    double low_52_w = 0.0;
    double high_52_w = 0.0;
    double price_percent_chg_24_h = 0.0;
};

struct TickerEvent {
    EventType type = EventType::Update;
    std::vector<TickerUpdate> tickers;
};

struct Level2Update {
    Level2Side side = Level2Side::Bid;
    std::string event_time;
    double price_level = 0.0;
    double new_quantity = 0.0;
};

struct Level2Event {
    EventType type = EventType::Update;
    std::string product_id;
    std::vector<Level2Update> updates;
};

struct MarketTrade {
    std::string trade_id;
    std::string product_id;
    double price = 0.0;
    double size = 0.0;
    std::string side;
    std::string time;
};

struct MarketTradesEvent {
    EventType type = EventType::Update;
    std::vector<MarketTrade> trades;
};

struct ProductStatus {
    std::string product_type;
    std::string id;
    std::string base_currency;
    std::string quote_currency;
    std::string display_name;
    std::string status;
    std::string status_message;
};

struct StatusEvent {
    EventType type = EventType::Update;
    std::vector<ProductStatus> products;
};

struct OrderUpdate {
    std::string order_id;
    std::string client_order_id;
    std::string status;
    std::string product_id;
    std::string order_side;
    std::string order_type;
    std::string creation_time;
    double cumulative_quantity = 0.0;
    double leaves_quantity = 0.0;
    double avg_price = 0.0;
    double total_fees = 0.0;
};

struct UserEvent {
    EventType type = EventType::Update;
    std::vector<OrderUpdate> orders;
};

// Futures balances are passed through untyped; nothing in the client routes on them.
struct FuturesBalanceSummaryEvent {
    EventType type = EventType::Update;
    nlohmann::json fcm_balance_summary;
};

// Server view of active subscriptions, keyed by wire channel name.
struct SubscriptionsEvent {
    std::map<std::string, std::vector<std::string>> subscriptions;
};

using Event = std::variant<HeartbeatsEvent,
                           CandlesEvent,
                           TickerEvent,
                           Level2Event,
                           MarketTradesEvent,
                           StatusEvent,
                           UserEvent,
                           FuturesBalanceSummaryEvent,
                           SubscriptionsEvent>;

struct Message {
    Channel channel = Channel::Heartbeats;
    std::string client_id;
    std::string timestamp;
    uint64_t sequence_num = 0;
    std::vector<Event> events;
};

// What the listen loop hands to a message callback: a message, or a per-frame error.
using MessageResult = std::variant<Message, StreamError>;
