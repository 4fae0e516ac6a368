#include "Log.hpp"
#include "marketdata/StreamingClient.hpp"
#include <boost/asio/signal_set.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <string>
#include <vector>

// Usage: slipstream_candles [config.json] [PRODUCT...]
int main(int argc, char** argv) {
    const std::string path = argc > 1 ? argv[1] : ClientConfig::kDefaultPath;
    std::vector<std::string> products;
    for (int i = 2; i < argc; ++i) products.emplace_back(argv[i]);
    if (products.empty()) products = {"BTC-USD", "ETH-USD", "SOL-USD"};

    try {
        ClientConfig config;
        if (ClientConfig::exists(path)) {
            config = ClientConfig::load(path);
        } else {
            LOG_I("app", "{} not found; using defaults", path);
        }
        // Candles are public data.
        config.enableUser = false;
        config.enablePublic = true;
        Slipstream::Log::setLevel(config.logLevel);

        net::io_context ioc;
        ssl::context sslCtx{ssl::context::tlsv12_client};
        sslCtx.set_default_verify_paths();
        sslCtx.set_verify_mode(ssl::verify_peer);

        StreamingClient client(ioc, config, StreamingClient::beastTransports(ioc, sslCtx));

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

        client.connect([&](std::optional<StreamError> err) {
            if (err) {
                LOG_E("app", "connect failed: {}", err->what());
                shutdown();
                return;
            }
            client.watchCandles(
                products,
                [](uint64_t now, const std::string& productId, const Candle& c) {
                    fmt::print("{} {:<10} start={} o={} h={} l={} c={} v={}\n",
                               now, productId, c.start, c.open, c.high, c.low, c.close, c.volume);
                },
                [&](std::optional<StreamError> e) {
                    if (e) {
                        LOG_E("app", "candle subscription failed: {}", e->what());
                        shutdown();
                        return;
                    }
                    LOG_I("app", "watching candles for {}", fmt::join(products, ", "));
                },
                [&](EndpointKind, const StreamError& e) {
                    LOG_E("app", "stream lost: {}", e.what());
                    shutdown();
                });
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
