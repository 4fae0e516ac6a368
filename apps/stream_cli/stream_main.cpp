#include "Log.hpp"
#include "marketdata/StreamingClient.hpp"
#include "marketdata/auth/Authenticator.hpp"
#include <boost/asio/signal_set.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <atomic>
#include <string>
#include <type_traits>
#include <vector>

namespace {

std::string describe(const Event& ev) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, HeartbeatsEvent>) {
            return fmt::format("heartbeat #{} at {}", e.heartbeat_counter, e.current_time);
        } else if constexpr (std::is_same_v<T, CandlesEvent>) {
            return fmt::format("{} candle update(s)", e.candles.size());
        } else if constexpr (std::is_same_v<T, TickerEvent>) {
            std::string out;
            for (const auto& t : e.tickers) out += fmt::format("{}={} ", t.product_id, t.price);
            return out;
        } else if constexpr (std::is_same_v<T, Level2Event>) {
            return fmt::format("{} book: {} level(s)", e.product_id, e.updates.size());
        } else if constexpr (std::is_same_v<T, MarketTradesEvent>) {
            std::string out;
            for (const auto& t : e.trades) out += fmt::format("{} {}@{} [{}] ", t.product_id, t.size, t.price, t.side);
            return out;
        } else if constexpr (std::is_same_v<T, StatusEvent>) {
            return fmt::format("{} product status update(s)", e.products.size());
        } else if constexpr (std::is_same_v<T, UserEvent>) {
            return fmt::format("{} order update(s)", e.orders.size());
        } else if constexpr (std::is_same_v<T, FuturesBalanceSummaryEvent>) {
            return e.fcm_balance_summary.dump();
        } else {
            std::string out;
            for (const auto& [name, ids] : e.subscriptions) out += fmt::format("{}[{}] ", name, fmt::join(ids, ","));
            return "subscribed: " + out;
        }
    }, ev);
}

} // namespace

// Usage: slipstream_stream [config.json] [PRODUCT...]
int main(int argc, char** argv) {
    const std::string path = argc > 1 ? argv[1] : ClientConfig::kDefaultPath;
    std::vector<std::string> products;
    for (int i = 2; i < argc; ++i) products.emplace_back(argv[i]);
    if (products.empty()) products = {"BTC-USD", "ETH-USD"};

    try {
        if (!ClientConfig::exists(path)) {
            ClientConfig::createDefault(path);
            fmt::print(stderr, "Empty configuration file created at {}, please update it.\n", path);
            return 1;
        }
        ClientConfig config = ClientConfig::load(path);
        Slipstream::Log::setLevel(config.logLevel);

        std::shared_ptr<IAuthenticator> auth;
        if (config.enableUser && config.hasCredentials()) {
            auth = std::make_shared<Authenticator>(config.apiKey, config.apiSecret);
        }

        net::io_context ioc;
        ssl::context sslCtx{ssl::context::tlsv12_client};
        sslCtx.set_default_verify_paths();
        sslCtx.set_verify_mode(ssl::verify_peer);

        StreamingClient client(ioc, config, StreamingClient::beastTransports(ioc, sslCtx), auth);

        // Stopping the client lets run() return once the sockets have closed. The
        // signal handlers are released first so a second Ctrl-C ends the process.
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        auto shutdown = [&] {
            boost::system::error_code ignored;
            signals.cancel(ignored);
            signals.clear(ignored);
            client.stop();
        };
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) return;
            LOG_I("app", "interrupted; closing connections");
            shutdown();
        });

        std::atomic<uint64_t> processed{0};
        client.listen(
            [&processed](const MessageResult& result) {
                const auto n = ++processed;
                if (const auto* err = std::get_if<StreamError>(&result)) {
                    fmt::print("{:<6}> error: {}\n", n, err->what());
                    return;
                }
                const auto& msg = std::get<Message>(result);
                for (const auto& ev : msg.events) {
                    fmt::print("{:<6}> [{} #{}] {}\n", n, toString(msg.channel), msg.sequence_num, describe(ev));
                }
            },
            [&](EndpointKind kind, const StreamError& err) {
                fmt::print(stderr, "{} endpoint lost: {}\n", toString(kind), err.what());
                if (client.state(EndpointKind::Public) == EndpointState::Closed &&
                    client.state(EndpointKind::User) == EndpointState::Closed) {
                    shutdown();
                }
            });

        client.connect([&](std::optional<StreamError> err) {
            if (err) {
                LOG_E("app", "connect failed: {}", err->what());
                shutdown();
                return;
            }
            auto report = [](const char* what) {
                return [what](std::optional<StreamError> e) {
                    if (e) LOG_W("app", "{} failed: {}", what, e->what());
                    else   LOG_I("app", "{} ok", what);
                };
            };
            if (client.isEnabled(EndpointKind::Public)) {
                client.subscribe(Channel::Heartbeats, {}, report("heartbeats"));
                client.subscribe(Channel::Ticker, products, report("ticker"));
                client.subscribe(Channel::MarketTrades, products, report("market_trades"));
            }
            if (client.isEnabled(EndpointKind::User) && auth) {
                client.subscribe(Channel::User, products, report("user"));
            }
        });

        ioc.run();
    } catch (const StreamError& ex) {
        LOG_E("app", "{} error: {}", toString(ex.kind()), ex.what());
        return 1;
    } catch (const std::exception& ex) {
        LOG_E("app", "fatal: {}", ex.what());
        return 1;
    }
    return 0;
}
