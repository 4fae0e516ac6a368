#pragma once
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "Message.hpp"

// Turns one inbound text frame into a Message, resolving the event variant
// once from the envelope's `channel`. Never throws: failures come back as
// StreamError(Protocol) so the caller can report them per frame.
class MessageDispatcher {
public:
    static MessageResult parse(std::string_view text);
    static MessageResult parse(const std::string& text) { return parse(std::string_view(text)); }
    static MessageResult parse(const nlohmann::json& j);

private:
    static Event parseEvent(Channel channel, const nlohmann::json& ev);
};
