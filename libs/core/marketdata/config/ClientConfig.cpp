#include "ClientConfig.hpp"
#include "../StreamError.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace {

constexpr const char* kPlaceholderKey    = "YOUR_API_KEY_NAME_HERE";
constexpr const char* kPlaceholderSecret = "YOUR_API_PRIVATE_KEY_HERE";

Slipstream::Log::Level levelFromConfig(const std::string& name) {
    if (auto lvl = Slipstream::Log::levelFromName(name)) return *lvl;
    throw StreamError(ErrorKind::Caller, "config: unknown log_level '" + name + "'");
}

const char* backoffName(BackoffReset r) {
    return r == BackoffReset::Persistent ? "persistent" : "per_reconnect";
}

BackoffReset backoffFromName(const std::string& name) {
    if (name == "per_reconnect") return BackoffReset::PerReconnect;
    if (name == "persistent") return BackoffReset::Persistent;
    throw StreamError(ErrorKind::Caller, "config: unknown backoff_reset '" + name + "'");
}

nlohmann::json addressToJson(const EndpointAddress& a) {
    return {{"host", a.host}, {"port", a.port}, {"target", a.target}};
}

void addressFromJson(const nlohmann::json& j, EndpointAddress& a) {
    a.host   = j.value("host", a.host);
    a.port   = j.value("port", a.port);
    a.target = j.value("target", a.target);
}

} // namespace

void to_json(nlohmann::json& j, const ClientConfig& cfg) {
    j = nlohmann::json{
        {"version", cfg.version},
        {"api_key", cfg.apiKey},
        {"api_secret", cfg.apiSecret},
        {"enable_public", cfg.enablePublic},
        {"enable_user", cfg.enableUser},
        {"public_endpoint", addressToJson(cfg.publicEndpoint)},
        {"user_endpoint", addressToJson(cfg.userEndpoint)},
        {"reconnect", {
            {"auto_reconnect", cfg.reconnect.autoReconnect},
            {"max_retries", cfg.reconnect.maxRetries},
            {"initial_delay_ms", cfg.reconnect.initialDelay.count()},
            {"max_delay_ms", cfg.reconnect.maxDelay.count()},
            {"backoff_reset", backoffName(cfg.reconnect.backoffReset)},
        }},
        {"rate_limit", {
            {"max_tokens", cfg.rateLimit.maxTokens},
            {"refill_rate", cfg.rateLimit.refillRate},
        }},
        {"log_level", std::string(Slipstream::Log::levelName(cfg.logLevel))},
    };
}

void from_json(const nlohmann::json& j, ClientConfig& cfg) {
    cfg.version      = j.value("version", 0u);
    cfg.apiKey       = j.value("api_key", cfg.apiKey);
    cfg.apiSecret    = j.value("api_secret", cfg.apiSecret);
    cfg.enablePublic = j.value("enable_public", cfg.enablePublic);
    cfg.enableUser   = j.value("enable_user", cfg.enableUser);

    if (auto it = j.find("public_endpoint"); it != j.end()) addressFromJson(*it, cfg.publicEndpoint);
    if (auto it = j.find("user_endpoint"); it != j.end()) addressFromJson(*it, cfg.userEndpoint);

    if (auto it = j.find("reconnect"); it != j.end()) {
        auto& r = cfg.reconnect;
        r.autoReconnect = it->value("auto_reconnect", r.autoReconnect);
        r.maxRetries    = it->value("max_retries", r.maxRetries);
        r.initialDelay  = std::chrono::milliseconds(it->value("initial_delay_ms", r.initialDelay.count()));
        r.maxDelay      = std::chrono::milliseconds(it->value("max_delay_ms", r.maxDelay.count()));
        r.backoffReset  = backoffFromName(it->value("backoff_reset", std::string(backoffName(r.backoffReset))));
    }

    if (auto it = j.find("rate_limit"); it != j.end()) {
        cfg.rateLimit.maxTokens  = it->value("max_tokens", cfg.rateLimit.maxTokens);
        cfg.rateLimit.refillRate = it->value("refill_rate", cfg.rateLimit.refillRate);
    }

    cfg.logLevel = levelFromConfig(j.value("log_level", std::string(Slipstream::Log::levelName(cfg.logLevel))));
}

void ClientConfig::validate() const {
    if (!enablePublic && !enableUser) {
        throw StreamError(ErrorKind::Caller, "config: at least one endpoint must be enabled");
    }
    if (rateLimit.maxTokens < 1.0) {
        throw StreamError(ErrorKind::Caller, "config: rate_limit.max_tokens must be at least 1");
    }
    if (rateLimit.refillRate <= 0.0) {
        throw StreamError(ErrorKind::Caller, "config: rate_limit.refill_rate must be positive");
    }
    if (reconnect.initialDelay.count() < 0 || reconnect.maxDelay < reconnect.initialDelay) {
        throw StreamError(ErrorKind::Caller, "config: reconnect delays must satisfy 0 <= initial <= max");
    }
    for (EndpointKind kind : kAllEndpoints) {
        if (isEnabled(kind) && address(kind).host.empty()) {
            throw StreamError(ErrorKind::Caller, fmt::format("config: {} endpoint has no host", toString(kind)));
        }
    }
}

ClientConfig ClientConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw StreamError(ErrorKind::Caller, "config: unable to open " + path);
    }

    ClientConfig cfg;
    try {
        nlohmann::json j;
        in >> j;
        cfg = j.get<ClientConfig>();
    } catch (const nlohmann::json::exception& ex) {
        throw StreamError(ErrorKind::Caller, "config: unable to parse " + path + ": " + ex.what());
    }

    if (cfg.version != kCurrentVersion) {
        LOG_I("config", "upgrading {} from version {} to {}", path, cfg.version, kCurrentVersion);
        cfg.version = kCurrentVersion;
        try {
            cfg.save(path);
        } catch (const StreamError& ex) {
            LOG_W("config", "could not save updated configuration: {}", ex.what());
        }
    }
    return cfg;
}

ClientConfig ClientConfig::createDefault(const std::string& path) {
    ClientConfig cfg;
    cfg.apiKey = kPlaceholderKey;
    cfg.apiSecret = kPlaceholderSecret;
    cfg.save(path);
    LOG_I("config", "wrote default configuration to {}", path);
    return cfg;
}

bool ClientConfig::exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

void ClientConfig::save(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw StreamError(ErrorKind::Caller, "config: unable to write " + path);
    }
    out << nlohmann::json(*this).dump(4) << '\n';
    if (!out) {
        throw StreamError(ErrorKind::Caller, "config: write to " + path + " failed");
    }
}
