#include <spdlog/spdlog.h>
#include <boost/asio.hpp>
#include "Cache/SingleFlightCache.hpp"
#include "Config/Config.hpp"
#include "Logging/Logging.hpp"
#include "Stream/StreamRegistry.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <memory>
#include <signal.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using QuoteCache = SingleFlightCache<std::string>;
using FeedRegistry = StreamRegistry<std::string, std::string>;

static boost::asio::io_context* g_io_context = nullptr;
static boost::asio::executor_work_guard<boost::asio::io_context::executor_type>* g_work_guard = nullptr;

void signal_handler(int signal) {
    if (g_io_context && g_work_guard) {
        spdlog::info("[FEED DEMO] Received signal {}, shutting down gracefully...", signal);
        g_work_guard->reset();
        g_io_context->stop();
    }
}

// Simulated remote source: answers after 50 ms, every fourth call fails.
static QuoteCache::Fallback slowSource(boost::asio::io_context& io_context,
                                       std::atomic<int>& source_calls,
                                       const std::string& name) {
    return [&io_context, &source_calls, name](QuoteCache::Handler done) {
        int call = ++source_calls;
        auto timer = std::make_shared<boost::asio::steady_timer>(io_context, std::chrono::milliseconds(50));
        timer->async_wait([timer, done, name, call](const boost::system::error_code& ec) {
            if (ec) {
                done(std::make_exception_ptr(std::runtime_error(ec.message())), {});
                return;
            }
            if (call % 4 == 0) {
                done(std::make_exception_ptr(std::runtime_error("source unavailable")), {});
                return;
            }
            done(nullptr, name + "#" + std::to_string(call));
        });
    };
}

int main(int argc, char* argv[]) {
    try {
        auto& config = Config::getInstance();
        std::string config_path = "config.yaml";

        if (argc > 1) {
            config_path = argv[1];
        }

        if (!config.loadFromFile(config_path)) {
            spdlog::error("Failed to load configuration: {}", config.getError());
            if (!config.isValid()) {
                return 1;
            }
        }

        configureLogging(config.getLogLevel(), config.getLogPattern());

        boost::asio::io_context io_context;
        std::atomic<int> source_calls{0};

        QuoteCache cache(std::make_shared<MemoryCacheStorage<std::string>>(),
                         steadyClock(), config.getCacheDefaultTtl());
        FeedRegistry streams(io_context);

        // Several callers asking for the same quote share one source call.
        for (int i = 0; i < 3; i++) {
            cache.get("quote:ACME",
                      [i](std::exception_ptr error, const std::string& value) {
                          if (error) {
                              spdlog::warn("[FEED DEMO] Caller {} failed: {}", i, describeException(error));
                              return;
                          }
                          spdlog::info("[FEED DEMO] Caller {} received {}", i, value);
                      },
                      slowSource(io_context, source_calls, "ACME"));
        }

        auto feed = streams.registerStream(
            "feed",
            [&cache, &io_context, &source_calls](const std::string& payload, FeedRegistry::Handler done) {
                spdlog::debug("[FEED DEMO] Refresh requested: {}", payload);
                cache.get("feed:latest", done, slowSource(io_context, source_calls, "feed"),
                          std::chrono::milliseconds(500));
            },
            config.getStreamThrottle());

        LogTap feed_log("[feed]", spdlog::level::debug);
        auto tap = feed->subscribe(feed_log.tap<std::string>(
            [](const std::string& value) { return "put " + value; }, spdlog::level::info));
        auto consumer = feed->subscribe(
            [](const std::string& value) { spdlog::info("[FEED DEMO] Consumer saw {}", value); },
            {},
            [] { spdlog::info("[FEED DEMO] Feed closed"); });

        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard(
            boost::asio::make_work_guard(io_context));

        const unsigned int demo_ticks = config.getDemoTicks();
        const auto tick_interval = config.getTickInterval();
        const auto update_wait = config.getUpdateWait();

        auto ticker = std::make_shared<boost::asio::steady_timer>(io_context);
        auto ticks = std::make_shared<unsigned int>(0);
        std::function<void()> schedule_tick;
        schedule_tick = [&, ticker, ticks] {
            ticker->expires_after(tick_interval);
            ticker->async_wait([&, ticker, ticks](const boost::system::error_code& ec) {
                if (ec) {
                    return;
                }
                unsigned int tick = ++(*ticks);
                streams.applyUpdateAndWait("feed", "tick " + std::to_string(tick), update_wait,
                    [tick](UpdateOutcome outcome) {
                        spdlog::info("[FEED DEMO] Tick {}: {}", tick, toString(outcome));
                    });
                // Inside the throttle window, dropped.
                streams.applyUpdate("feed", "burst " + std::to_string(tick));

                if (tick < demo_ticks) {
                    schedule_tick();
                    return;
                }

                // Give the last refresh time to land before tearing down.
                ticker->expires_after(update_wait);
                ticker->async_wait([&](const boost::system::error_code& wait_ec) {
                    if (wait_ec) {
                        return;
                    }
                    streams.clearAll();
                    cache.collect("feed:latest", std::chrono::milliseconds(500));

                    auto stats = cache.getStats();
                    spdlog::info("[FEED DEMO] Cache stats: {} hits, {} misses, {} joins, {} fetches, {} failures",
                                 stats.hits, stats.misses, stats.joins, stats.fetches, stats.failures);
                    spdlog::info("[FEED DEMO] Source called {} times", source_calls.load());
                    work_guard.reset();
                });
            });
        };

        if (demo_ticks > 0) {
            schedule_tick();
        } else {
            work_guard.reset();
        }

        g_io_context = &io_context;
        g_work_guard = &work_guard;

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::vector<std::thread> worker_threads;
        unsigned int num_threads = config.getNumThreads();

        for (unsigned int i = 0; i < num_threads; i++) {
            worker_threads.emplace_back([&io_context, i] {
                try {
                    spdlog::debug("[FEED DEMO] Worker thread {} started", i);
                    io_context.run();
                    spdlog::debug("[FEED DEMO] Worker thread {} finished", i);
                } catch (const std::exception& e) {
                    spdlog::error("[FEED DEMO] Worker thread {} error: {}", i, e.what());
                }
            });
        }

        spdlog::info("[FEED DEMO] All {} worker threads started. Running {} ticks...", num_threads, demo_ticks);

        for (auto& thread : worker_threads) {
            thread.join();
        }

        tap.unsubscribe();
        consumer.unsubscribe();
        streams.clearAll();

        g_io_context = nullptr;
        g_work_guard = nullptr;

        spdlog::info("[FEED DEMO] All threads joined. Shutting down.");

    } catch (std::exception& e) {
        spdlog::error("[FEED DEMO] Unexpected error: {}", e.what());
        return 1;
    }
    return 0;
}
