/*
Slipstream — MessageDispatcher
Role: Parses inbound frames into the closed Message/Event model.
Inputs/Outputs: JSON text or object in; Message or StreamError(Protocol) out.
Threading: Stateless; callable from any thread.
Performance: One nlohmann parse per frame; candle fields are parsed strictly, others leniently.
Integration: Used by StreamingClient's listen loop for every text/binary frame.
Observability: No logging; errors travel to the message callback.
Related: Message.hpp, Channels.hpp, Cpp20Utils.hpp.
Assumptions: Envelope fields follow the Advanced Trade WebSocket format.
*/
#include "MessageDispatcher.hpp"
#include "Cpp20Utils.hpp"
#include <stdexcept>
#include <string>

namespace {

// Lenient numeric read for fields nothing routes on: absent or empty means zero.
double optNumber(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return 0.0;
    if (it->is_string() && it->get_ref<const std::string&>().empty()) return 0.0;
    return Cpp20Utils::numericField(obj, key);
}

EventType eventTypeOf(const nlohmann::json& ev) {
    const std::string type = ev.value("type", "update");
    if (type == "snapshot") return EventType::Snapshot;
    if (type == "update") return EventType::Update;
    throw std::invalid_argument("unknown event type '" + type + "'");
}

Level2Side sideOf(const std::string& side) {
    if (side == "bid") return Level2Side::Bid;
    if (side == "offer" || side == "ask") return Level2Side::Ask;
    throw std::invalid_argument("unknown level2 side '" + side + "'");
}

CandleUpdate parseCandle(const nlohmann::json& c) {
    CandleUpdate u;
    u.product_id    = c.at("product_id").get<std::string>();
    u.candle.start  = Cpp20Utils::unsignedField(c, "start");
    u.candle.low    = Cpp20Utils::numericField(c, "low");
    u.candle.high   = Cpp20Utils::numericField(c, "high");
    u.candle.open   = Cpp20Utils::numericField(c, "open");
    u.candle.close  = Cpp20Utils::numericField(c, "close");
    u.candle.volume = Cpp20Utils::numericField(c, "volume");
    return u;
}

} // namespace

MessageResult MessageDispatcher::parse(std::string_view text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return StreamError(ErrorKind::Protocol, std::string("unable to parse message: ") + e.what());
    }
    return parse(j);
}

MessageResult MessageDispatcher::parse(const nlohmann::json& j) {
    if (!j.is_object()) {
        return StreamError(ErrorKind::Protocol, "unable to parse message: not a JSON object");
    }

    try {
        if (const auto type = j.find("type"); type != j.end() && *type == "error") {
            std::string reason = "unspecified";
            if (const auto text = j.find("message"); text != j.end()) {
                reason = text->is_string() ? text->get<std::string>() : text->dump();
            }
            return StreamError(ErrorKind::Protocol, "provider error: " + reason);
        }

        const std::string tag = j.at("channel").get<std::string>();
        const auto channel = channelFromString(tag);
        if (!channel) {
            return StreamError(ErrorKind::Protocol, "unknown channel '" + tag + "'");
        }

        Message msg;
        msg.channel      = *channel;
        msg.client_id    = j.at("client_id").get<std::string>();
        msg.timestamp    = j.at("timestamp").get<std::string>();
        msg.sequence_num = Cpp20Utils::unsignedField(j, "sequence_num");

        const auto& events = j.at("events");
        if (!events.is_array()) {
            return StreamError(ErrorKind::Protocol, "unable to parse message: 'events' is not an array");
        }
        msg.events.reserve(events.size());
        for (const auto& ev : events) {
            msg.events.push_back(parseEvent(msg.channel, ev));
        }
        return msg;
    } catch (const nlohmann::json::exception& e) {
        return StreamError(ErrorKind::Protocol, std::string("unable to parse message: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return StreamError(ErrorKind::Protocol, std::string("unable to parse message: ") + e.what());
    }
}

Event MessageDispatcher::parseEvent(Channel channel, const nlohmann::json& ev) {
    switch (channel) {
        case Channel::Heartbeats: {
            HeartbeatsEvent out;
            out.current_time      = ev.at("current_time").get<std::string>();
            out.heartbeat_counter = Cpp20Utils::unsignedField(ev, "heartbeat_counter");
            return out;
        }
        case Channel::Candles: {
            CandlesEvent out;
            out.type = eventTypeOf(ev);
            for (const auto& c : ev.at("candles")) {
                out.candles.push_back(parseCandle(c));
            }
            return out;
        }
        case Channel::Ticker:
        case Channel::TickerBatch: {
            TickerEvent out;
            out.type = eventTypeOf(ev);
            for (const auto& t : ev.at("tickers")) {
                TickerUpdate u;
                u.type                   = t.value("type", "");
                u.product_id             = t.at("product_id").get<std::string>();
                u.price                  = optNumber(t, "price");
                u.volume_24_h            = optNumber(t, "volume_24_h");
                u.low_24_h               = optNumber(t, "low_24_h");
                u.high_24_h              = optNumber(t, "high_24_h");
                u.low_52_w               = optNumber(t, "low_52_w");
                u.high_52_w              = optNumber(t, "high_52_w");
                u.price_percent_chg_24_h = optNumber(t, "price_percent_chg_24_h");
                out.tickers.push_back(std::move(u));
            }
            return out;
        }
        case Channel::Level2: {
            Level2Event out;
            out.type       = eventTypeOf(ev);
            out.product_id = ev.at("product_id").get<std::string>();
            for (const auto& u : ev.at("updates")) {
                Level2Update lvl;
                lvl.side         = sideOf(u.at("side").get<std::string>());
                lvl.event_time   = u.value("event_time", "");
                lvl.price_level  = Cpp20Utils::numericField(u, "price_level");
                lvl.new_quantity = Cpp20Utils::numericField(u, "new_quantity");
                out.updates.push_back(std::move(lvl));
            }
            return out;
        }
        case Channel::MarketTrades: {
            MarketTradesEvent out;
            out.type = eventTypeOf(ev);
            for (const auto& t : ev.at("trades")) {
                MarketTrade trade;
                trade.trade_id   = t.value("trade_id", "");
                trade.product_id = t.at("product_id").get<std::string>();
                trade.price      = Cpp20Utils::numericField(t, "price");
                trade.size       = Cpp20Utils::numericField(t, "size");
                trade.side       = t.value("side", "");
                trade.time       = t.value("time", "");
                out.trades.push_back(std::move(trade));
            }
            return out;
        }
        case Channel::Status: {
            StatusEvent out;
            out.type = eventTypeOf(ev);
            for (const auto& p : ev.at("products")) {
                ProductStatus s;
                s.product_type   = p.value("product_type", "");
                s.id             = p.at("id").get<std::string>();
                s.base_currency  = p.value("base_currency", "");
                s.quote_currency = p.value("quote_currency", "");
                s.display_name   = p.value("display_name", "");
                s.status         = p.value("status", "");
                s.status_message = p.value("status_message", "");
                out.products.push_back(std::move(s));
            }
            return out;
        }
        case Channel::User: {
            UserEvent out;
            out.type = eventTypeOf(ev);
            for (const auto& o : ev.at("orders")) {
                OrderUpdate u;
                u.order_id            = o.value("order_id", "");
                u.client_order_id     = o.value("client_order_id", "");
                u.status              = o.value("status", "");
                u.product_id          = o.value("product_id", "");
                u.order_side          = o.value("order_side", "");
                u.order_type          = o.value("order_type", "");
                u.creation_time       = o.value("creation_time", "");
                u.cumulative_quantity = optNumber(o, "cumulative_quantity");
                u.leaves_quantity     = optNumber(o, "leaves_quantity");
                u.avg_price           = optNumber(o, "avg_price");
                u.total_fees          = optNumber(o, "total_fees");
                out.orders.push_back(std::move(u));
            }
            return out;
        }
        case Channel::FuturesBalanceSummary: {
            FuturesBalanceSummaryEvent out;
            out.type = eventTypeOf(ev);
            out.fcm_balance_summary = ev.value("fcm_balance_summary", nlohmann::json::object());
            return out;
        }
        case Channel::Subscriptions: {
            SubscriptionsEvent out;
            for (const auto& [name, ids] : ev.at("subscriptions").items()) {
                auto& list = out.subscriptions[name];
                if (ids.is_array()) {
                    for (const auto& id : ids) list.push_back(id.get<std::string>());
                }
            }
            return out;
        }
    }
    throw std::invalid_argument("unhandled channel");
}
