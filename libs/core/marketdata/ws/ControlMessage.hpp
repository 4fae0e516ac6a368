#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../dispatch/Channels.hpp"

enum class ControlAction { Subscribe, Unsubscribe };

inline constexpr const char* toString(ControlAction a) {
    return a == ControlAction::Subscribe ? "subscribe" : "unsubscribe";
}

// Subscribe/unsubscribe frames. Public frames carry a unix timestamp,
// user frames carry a freshly signed JWT. product_ids is omitted when empty.
namespace ControlMessage {

inline nlohmann::json base(ControlAction action, Channel channel, const std::vector<std::string>& productIds) {
    nlohmann::json msg;
    msg["type"] = toString(action);
    if (!productIds.empty()) {
        msg["product_ids"] = productIds;
    }
    msg["channel"] = toString(channel);
    return msg;
}

inline std::string buildPublic(ControlAction action, Channel channel,
                               const std::vector<std::string>& productIds, uint64_t unixSeconds) {
    auto msg = base(action, channel, productIds);
    msg["timestamp"] = std::to_string(unixSeconds);
    return msg.dump();
}

inline std::string buildUser(ControlAction action, Channel channel,
                             const std::vector<std::string>& productIds, const std::string& jwt) {
    auto msg = base(action, channel, productIds);
    msg["jwt"] = jwt;
    return msg.dump();
}

} // namespace ControlMessage
