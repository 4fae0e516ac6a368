/*
Slipstream — ClientConfig
Role: Everything a StreamingClient needs at construction: credentials, enabled endpoints, addresses, reconnect and rate-limit settings.
Inputs/Outputs: Loaded from and saved to a JSON file; missing fields take defaults.
Threading: Plain value type; copy freely.
Performance: Read once at startup.
Integration: Passed by value to StreamingClient; the apps build an Authenticator from api_key/api_secret.
Observability: Logs version upgrades and failed re-saves under the "config" category.
Related: ClientConfig.cpp, ReconnectPolicy.hpp, RateLimiter.hpp, WsTransport.hpp.
Assumptions: A file with an older or missing version is rewritten in the current layout.
*/
#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "Log.hpp"
#include "../dispatch/Channels.hpp"
#include "../ws/RateLimiter.hpp"
#include "../ws/ReconnectPolicy.hpp"
#include "../ws/WsTransport.hpp"

struct RateLimitSettings {
    double maxTokens  = RateLimiter::kStreamingMaxTokens;
    double refillRate = RateLimiter::kStreamingRefillRate;
};

struct ClientConfig {
    static constexpr uint32_t kCurrentVersion = 1;
    static constexpr const char* kDefaultPath = "slipstream.json";

    uint32_t version = kCurrentVersion;
    std::string apiKey;
    std::string apiSecret;

    bool enablePublic = true;
    bool enableUser   = false;

    EndpointAddress publicEndpoint{"advanced-trade-ws.coinbase.com", "443", "/"};
    EndpointAddress userEndpoint{"advanced-trade-ws-user.coinbase.com", "443", "/"};

    ReconnectPolicy reconnect;
    RateLimitSettings rateLimit;
    Slipstream::Log::Level logLevel = Slipstream::Log::Level::INFO;

    [[nodiscard]] bool isEnabled(EndpointKind kind) const {
        return kind == EndpointKind::Public ? enablePublic : enableUser;
    }

    [[nodiscard]] const EndpointAddress& address(EndpointKind kind) const {
        return kind == EndpointKind::Public ? publicEndpoint : userEndpoint;
    }

    [[nodiscard]] bool hasCredentials() const { return !apiKey.empty() && !apiSecret.empty(); }

    /// Throws StreamError(Caller) when no endpoint is enabled or a limit is out of range.
    void validate() const;

    /// Reads `path`. An older or missing version is upgraded and the file re-saved.
    static ClientConfig load(const std::string& path);

    /// Writes a template with placeholder credentials to `path` and returns it.
    static ClientConfig createDefault(const std::string& path);

    static bool exists(const std::string& path);

    void save(const std::string& path) const;
};

void to_json(nlohmann::json& j, const ClientConfig& cfg);
void from_json(const nlohmann::json& j, ClientConfig& cfg);
