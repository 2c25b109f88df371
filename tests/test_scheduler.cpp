#include "catch.hpp"
#include "nzbstream/scheduler.hpp"
#include "nzbstream/ttl_cache.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace

TEST_CASE("delayed tasks run once in due order") {
    nzbstream::TaskScheduler sched;
    sched.start();
    REQUIRE(sched.running());

    std::mutex m;
    std::vector<std::string> order;
    sched.scheduleAfter(std::chrono::milliseconds(60), [&] {
        std::lock_guard<std::mutex> lock(m);
        order.push_back("late");
    });
    sched.scheduleAfter(std::chrono::milliseconds(10), [&] {
        std::lock_guard<std::mutex> lock(m);
        order.push_back("early");
    });

    REQUIRE(waitFor([&] {
        std::lock_guard<std::mutex> lock(m);
        return order.size() == 2;
    }));
    REQUIRE(order[0] == "early");
    REQUIRE(order[1] == "late");
    REQUIRE(sched.pendingCount() == 0);
    sched.stop();
    REQUIRE_FALSE(sched.running());
}

TEST_CASE("cancelled task never runs") {
    nzbstream::TaskScheduler sched;
    sched.start();
    std::atomic<int> runs{0};
    auto id = sched.scheduleAfter(std::chrono::milliseconds(50), [&] { runs++; });
    REQUIRE(sched.cancel(id));
    REQUIRE_FALSE(sched.cancel(id));
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    REQUIRE(runs == 0);
}

TEST_CASE("periodic task repeats until cancelled") {
    nzbstream::TaskScheduler sched;
    sched.start();
    std::atomic<int> runs{0};
    auto id = sched.scheduleEvery(std::chrono::milliseconds(10), [&] { runs++; }, std::chrono::milliseconds(0));
    REQUIRE(waitFor([&] { return runs >= 3; }));
    sched.cancel(id);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    const int settled = runs;
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    REQUIRE(runs == settled);
}

TEST_CASE("a throwing task does not stop the worker") {
    nzbstream::TaskScheduler sched;
    sched.start();
    std::atomic<bool> ran{false};
    sched.scheduleAfter(std::chrono::milliseconds(0), [] { throw std::runtime_error("boom"); });
    sched.scheduleAfter(std::chrono::milliseconds(20), [&] { ran = true; });
    REQUIRE(waitFor([&] { return ran.load(); }));
}

TEST_CASE("stop drops pending tasks") {
    nzbstream::TaskScheduler sched;
    sched.start();
    std::atomic<int> runs{0};
    sched.scheduleAfter(std::chrono::seconds(30), [&] { runs++; });
    REQUIRE(sched.pendingCount() == 1);
    sched.stop();
    REQUIRE(sched.pendingCount() == 0);
    REQUIRE(runs == 0);
}

TEST_CASE("ttl cache hides and sweeps expired entries") {
    nzbstream::TtlCache<std::string, int> cache(std::chrono::milliseconds(30));
    cache.put("a", 1);
    REQUIRE(cache.get("a") == 1);
    REQUIRE_FALSE(cache.get("b").has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE_FALSE(cache.get("a").has_value());
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.sweep() == 1);
    REQUIRE(cache.size() == 0);

    cache.setTtl(std::chrono::minutes(5));
    cache.put("c", 3);
    REQUIRE(cache.erase("c"));
    REQUIRE_FALSE(cache.erase("c"));
}
