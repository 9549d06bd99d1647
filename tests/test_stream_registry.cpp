#include "Stream/StreamRegistry.hpp"
#include "Cache/SingleFlightCache.hpp"

#include <catch2/catch.hpp>
#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

using Registry = StreamRegistry<int, std::string>;

struct ManualClock {
    TimePoint now{};

    Clock clock() {
        return [this] { return now; };
    }

    void advance(std::chrono::milliseconds by) { now += by; }
};

// Query whose completions are held until the test releases them.
struct PendingQuery {
    std::vector<std::string> payloads;
    std::vector<Registry::Handler> pending;

    Registry::Query query() {
        return [this](const std::string& payload, Registry::Handler done) {
            payloads.push_back(payload);
            pending.push_back(std::move(done));
        };
    }

    void resolve(int value) {
        REQUIRE_FALSE(pending.empty());
        auto done = std::move(pending.front());
        pending.erase(pending.begin());
        done(nullptr, value);
    }

    void reject(const std::string& message) {
        REQUIRE_FALSE(pending.empty());
        auto done = std::move(pending.front());
        pending.erase(pending.begin());
        done(std::make_exception_ptr(std::runtime_error(message)), 0);
    }
};

}  // namespace

TEST_CASE("Registering a key twice fails and keeps the first handler", "[stream][register]") {
    boost::asio::io_context io_context;
    ManualClock clock;
    Registry registry(io_context, clock.clock());
    PendingQuery first;
    PendingQuery second;

    auto stream = registry.registerStream("x", first.query());
    CHECK_THROWS_AS(registry.registerStream("x", second.query()), DuplicateKeyError);

    CHECK(registry.size() == 1);
    CHECK(registry.getStream("x") == stream);
    CHECK(registry.getHandler("x")->throttleWindow() == Registry::DEFAULT_THROTTLE);

    registry.applyUpdate("x", "p");
    CHECK(first.payloads.size() == 1);
    CHECK(second.payloads.empty());
}

TEST_CASE("Lookups on unknown keys return nothing", "[stream]") {
    boost::asio::io_context io_context;
    Registry registry(io_context);

    CHECK(registry.getHandler("nope") == nullptr);
    CHECK(registry.getStream("nope") == nullptr);
    CHECK_FALSE(registry.has("nope"));
    CHECK_NOTHROW(registry.applyUpdate("nope", "p"));
    CHECK_NOTHROW(registry.clear("nope"));
}

TEST_CASE("Refresh requests inside the throttle window are dropped", "[stream][throttle]") {
    boost::asio::io_context io_context;
    ManualClock clock;
    Registry registry(io_context, clock.clock());
    PendingQuery query;
    registry.registerStream("x", query.query(), 1000ms);

    registry.applyUpdate("x", "t0");
    clock.advance(200ms);
    registry.applyUpdate("x", "t200");
    clock.advance(900ms);
    registry.applyUpdate("x", "t1100");

    CHECK(query.payloads == std::vector<std::string>{"t0", "t1100"});
}

TEST_CASE("The throttle window starts at the last request that passed", "[stream][throttle]") {
    boost::asio::io_context io_context;
    ManualClock clock;
    Registry registry(io_context, clock.clock());
    PendingQuery query;
    registry.registerStream("x", query.query(), 1000ms);
    auto handler = registry.getHandler("x");
    REQUIRE(handler != nullptr);

    CHECK(handler->update("a"));
    clock.advance(999ms);
    CHECK_FALSE(handler->update("b"));
    clock.advance(1ms);
    CHECK(handler->update("c"));
    clock.advance(500ms);
    CHECK_FALSE(handler->update("d"));

    CHECK(query.payloads == std::vector<std::string>{"a", "c"});
}

TEST_CASE("Results are broadcast and replayed to late subscribers", "[stream][replay]") {
    boost::asio::io_context io_context;
    Registry registry(io_context);
    PendingQuery query;
    auto stream = registry.registerStream("x", query.query());

    std::vector<int> early;
    stream->subscribe([&](int v) { early.push_back(v); });

    registry.applyUpdate("x", "p");
    query.resolve(1);
    CHECK(early == std::vector<int>{1});

    std::vector<int> late;
    stream->subscribe([&](int v) { late.push_back(v); });
    CHECK(late == std::vector<int>{1});
    CHECK(query.payloads.size() == 1);
}

TEST_CASE("Query failures are absorbed and the stream stays usable", "[stream][error]") {
    boost::asio::io_context io_context;
    ManualClock clock;
    Registry registry(io_context, clock.clock());
    PendingQuery fetchFeed;
    auto stream = registry.registerStream("feed", fetchFeed.query());

    std::vector<int> values;
    int errors = 0;
    int completions = 0;
    stream->subscribe([&](int v) { values.push_back(v); },
                      [&](std::exception_ptr) { ++errors; },
                      [&] { ++completions; });

    registry.applyUpdate("feed");
    fetchFeed.reject("timeout");

    clock.advance(1200ms);
    registry.applyUpdate("feed");
    fetchFeed.resolve(42);

    CHECK(values == std::vector<int>{42});
    CHECK(errors == 0);
    CHECK(completions == 0);
    CHECK_FALSE(stream->closed());
}

TEST_CASE("A query that throws is absorbed", "[stream][error]") {
    boost::asio::io_context io_context;
    Registry registry(io_context);
    auto stream = registry.registerStream("x", [](const std::string&, Registry::Handler) {
        throw std::runtime_error("bad payload");
    });

    CHECK_NOTHROW(registry.applyUpdate("x", "p"));
    CHECK_FALSE(stream->closed());
    CHECK_FALSE(stream->lastValue().has_value());
}

TEST_CASE("Overlapping queries are broadcast in completion order", "[stream]") {
    boost::asio::io_context io_context;
    Registry registry(io_context);
    PendingQuery query;
    auto stream = registry.registerStream("x", query.query(), 0ms);

    std::vector<int> values;
    stream->subscribe([&](int v) { values.push_back(v); });

    registry.applyUpdate("x", "a");
    registry.applyUpdate("x", "b");
    REQUIRE(query.pending.size() == 2);

    auto first = std::move(query.pending[0]);
    auto second = std::move(query.pending[1]);
    second(nullptr, 2);
    first(nullptr, 1);

    CHECK(values == std::vector<int>{2, 1});
    CHECK(stream->lastValue() == 1);
}

TEST_CASE("Clearing a stream completes its subscribers", "[stream][clear]") {
    boost::asio::io_context io_context;
    Registry registry(io_context);
    PendingQuery query;
    auto stream = registry.registerStream("x", query.query());
    auto handler = registry.getHandler("x");

    int completions = 0;
    std::vector<int> values;
    stream->subscribe([&](int v) { values.push_back(v); }, {}, [&] { ++completions; });

    registry.applyUpdate("x", "p");
    registry.clear("x");
    registry.clear("x");

    CHECK(completions == 1);
    CHECK_FALSE(registry.has("x"));
    CHECK(handler->cleared());
    CHECK(stream->closed());

    query.resolve(5);
    CHECK(values.empty());
    CHECK_FALSE(handler->update("again"));

    auto fresh = registry.registerStream("x", query.query());
    CHECK(fresh != stream);
    CHECK_FALSE(fresh->closed());
}

TEST_CASE("clearAll tears down every stream", "[stream][clear]") {
    boost::asio::io_context io_context;
    Registry registry(io_context);
    PendingQuery query;
    auto a = registry.registerStream("a", query.query());
    auto b = registry.registerStream("b", query.query());

    registry.clearAll();

    CHECK(registry.size() == 0);
    CHECK(a->closed());
    CHECK(b->closed());
}

TEST_CASE("A stream can refresh through the cache", "[stream][cache]") {
    boost::asio::io_context io_context;
    ManualClock clock;
    Registry registry(io_context, clock.clock());
    SingleFlightCache<int> cache(std::make_shared<MemoryCacheStorage<int>>(), clock.clock());
    int source_calls = 0;

    auto stream = registry.registerStream("feed", [&](const std::string&, Registry::Handler done) {
        cache.get("feed:latest", done, [&](SingleFlightCache<int>::Handler fetched) {
            fetched(nullptr, ++source_calls);
        }, 5000ms);
    });

    registry.applyUpdate("feed");
    clock.advance(1000ms);
    registry.applyUpdate("feed");

    CHECK(source_calls == 1);
    CHECK(stream->lastValue() == 1);
}

TEST_CASE("applyUpdateAndWait reports a value that lands in time", "[stream][wait][asio]") {
    boost::asio::io_context io_context;
    Registry registry(io_context);
    registry.registerStream("x", [&io_context](const std::string&, Registry::Handler done) {
        auto timer = std::make_shared<boost::asio::steady_timer>(io_context, 20ms);
        timer->async_wait([timer, done](const boost::system::error_code&) { done(nullptr, 9); });
    });

    std::optional<UpdateOutcome> outcome;
    registry.applyUpdateAndWait("x", "p", 2000ms, [&](UpdateOutcome o) { outcome = o; });
    io_context.run();

    REQUIRE(outcome.has_value());
    CHECK(*outcome == UpdateOutcome::UPDATED);
}

TEST_CASE("applyUpdateAndWait sees a value that lands while the io thread is busy", "[stream][wait][asio][threads]") {
    boost::asio::io_context io_context;
    boost::asio::thread_pool source_pool(1);
    Registry registry(io_context);
    registry.registerStream("x", [&source_pool](const std::string&, Registry::Handler done) {
        boost::asio::post(source_pool, [done] {
            std::this_thread::sleep_for(3ms);
            done(nullptr, 5);
        });
    });

    std::optional<UpdateOutcome> outcome;
    std::chrono::steady_clock::time_point resolved_at;
    const auto started = std::chrono::steady_clock::now();
    boost::asio::post(io_context, [&] {
        registry.applyUpdateAndWait("x", "p", 500ms, [&](UpdateOutcome o) {
            outcome = o;
            resolved_at = std::chrono::steady_clock::now();
        });
        std::this_thread::sleep_for(10ms);
    });
    io_context.run();
    source_pool.join();

    REQUIRE(outcome.has_value());
    CHECK(*outcome == UpdateOutcome::UPDATED);
    CHECK(resolved_at - started < 500ms);
    CHECK(registry.getStream("x")->lastValue() == 5);
}

TEST_CASE("Concurrent waits on one key share the refresh they triggered", "[stream][wait][asio][threads]") {
    constexpr int callers = 8;
    boost::asio::io_context io_context;
    boost::asio::thread_pool source_pool(1);
    ManualClock clock;
    Registry registry(io_context, clock.clock());
    std::atomic<int> queries{0};
    std::atomic<int> waiting{0};

    registry.registerStream("x", [&](const std::string&, Registry::Handler done) {
        ++queries;
        boost::asio::post(source_pool, [&waiting, done] {
            while (waiting.load() < callers) {
                std::this_thread::yield();
            }
            std::this_thread::sleep_for(5ms);
            done(nullptr, 42);
        });
    });

    std::atomic<int> updated{0};
    std::atomic<int> not_updated{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < callers; i++) {
        threads.emplace_back([&, i] {
            registry.applyUpdateAndWait("x", "caller " + std::to_string(i), 2000ms, [&](UpdateOutcome o) {
                if (o == UpdateOutcome::UPDATED) {
                    ++updated;
                } else {
                    ++not_updated;
                }
            });
            ++waiting;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; i++) {
        workers.emplace_back([&io_context] { io_context.run(); });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    source_pool.join();

    CHECK(queries == 1);
    CHECK(updated == callers);
    CHECK(not_updated == 0);
}

TEST_CASE("Registration and throttled updates from many threads", "[stream][throttle][threads]") {
    boost::asio::io_context io_context;
    ManualClock clock;
    Registry registry(io_context, clock.clock());
    std::atomic<int> registered{0};
    std::atomic<int> duplicates{0};
    std::atomic<int> queries{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&, t] {
            for (int k = 0; k < 4; k++) {
                try {
                    registry.registerStream("key" + std::to_string(k),
                        [&queries](const std::string&, Registry::Handler done) {
                            ++queries;
                            done(nullptr, 1);
                        });
                    ++registered;
                } catch (const DuplicateKeyError&) {
                    ++duplicates;
                }
            }
            for (int i = 0; i < 100; i++) {
                registry.applyUpdate("key" + std::to_string((t + i) % 4), "p");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(registered == 4);
    CHECK(duplicates == 28);
    CHECK(registry.size() == 4);
    CHECK(queries == 4);
    for (int k = 0; k < 4; k++) {
        CHECK(registry.getStream("key" + std::to_string(k))->lastValue() == 1);
    }
}

TEST_CASE("applyUpdateAndWait gives up after waitFor", "[stream][wait][asio]") {
    boost::asio::io_context io_context;
    Registry registry(io_context);
    PendingQuery query;
    registry.registerStream("x", query.query());

    std::optional<UpdateOutcome> outcome;
    registry.applyUpdateAndWait("x", "p", 30ms, [&](UpdateOutcome o) { outcome = o; });
    io_context.run();

    REQUIRE(outcome.has_value());
    CHECK(*outcome == UpdateOutcome::NOT_UPDATED);
    CHECK(query.payloads.size() == 1);
    REQUIRE(query.pending.size() == 1);

    // The query keeps running after the wait ran out.
    auto stream = registry.getStream("x");
    query.resolve(3);
    CHECK(stream->lastValue() == 3);
}

TEST_CASE("applyUpdateAndWait ignores the replay of an older value", "[stream][wait][asio]") {
    boost::asio::io_context io_context;
    ManualClock clock;
    Registry registry(io_context, clock.clock());
    PendingQuery query;
    registry.registerStream("x", query.query());

    registry.applyUpdate("x", "first");
    query.resolve(1);
    clock.advance(2000ms);

    std::optional<UpdateOutcome> outcome;
    registry.applyUpdateAndWait("x", "second", 30ms, [&](UpdateOutcome o) { outcome = o; });
    query.reject("upstream down");
    io_context.run();

    REQUIRE(outcome.has_value());
    CHECK(*outcome == UpdateOutcome::NOT_UPDATED);
}

TEST_CASE("applyUpdateAndWait on a throttled update times out", "[stream][wait][asio]") {
    boost::asio::io_context io_context;
    ManualClock clock;
    Registry registry(io_context, clock.clock());
    PendingQuery query;
    registry.registerStream("x", query.query());

    registry.applyUpdate("x", "first");

    std::optional<UpdateOutcome> outcome;
    registry.applyUpdateAndWait("x", "dropped", 30ms, [&](UpdateOutcome o) { outcome = o; });
    io_context.run();

    CHECK(query.payloads.size() == 1);
    REQUIRE(outcome.has_value());
    CHECK(*outcome == UpdateOutcome::NOT_UPDATED);
}

TEST_CASE("applyUpdateAndWait resolves when the stream is cleared", "[stream][wait][asio]") {
    boost::asio::io_context io_context;
    Registry registry(io_context);
    PendingQuery query;
    registry.registerStream("x", query.query());

    std::optional<UpdateOutcome> outcome;
    registry.applyUpdateAndWait("x", "p", 5000ms, [&](UpdateOutcome o) { outcome = o; });

    boost::asio::steady_timer clear_timer(io_context, 10ms);
    clear_timer.async_wait([&](const boost::system::error_code&) { registry.clear("x"); });

    auto started = std::chrono::steady_clock::now();
    io_context.run();

    REQUIRE(outcome.has_value());
    CHECK(*outcome == UpdateOutcome::NOT_UPDATED);
    CHECK(std::chrono::steady_clock::now() - started < 5000ms);
}

TEST_CASE("applyUpdateAndWait on an unknown key reports it immediately", "[stream][wait]") {
    boost::asio::io_context io_context;
    Registry registry(io_context);

    std::optional<UpdateOutcome> outcome;
    registry.applyUpdateAndWait("missing", "p", 1000ms, [&](UpdateOutcome o) { outcome = o; });

    REQUIRE(outcome.has_value());
    CHECK(*outcome == UpdateOutcome::UNKNOWN_KEY);
    CHECK(std::string(toString(*outcome)) == "unknown key");
}
