// ─────────────────────────────────────────────────────────────────────────────
// settle_all Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcphub/async/settle_all.hpp"
#include "test_support.hpp"

#include <asio/steady_timer.hpp>

#include <atomic>
#include <stdexcept>

using namespace mcphub;
using namespace mcphub::testing;
using namespace std::chrono_literals;

namespace {

asio::awaitable<void> finish_after(std::chrono::milliseconds delay, std::atomic<int>& finished) {
    asio::steady_timer timer(co_await asio::this_coro::executor, delay);
    co_await timer.async_wait(asio::use_awaitable);
    ++finished;
}

asio::awaitable<void> throw_standard() {
    throw std::runtime_error("listing failed");
    co_return;
}

asio::awaitable<void> throw_other() {
    throw 42;
    co_return;
}

}  // namespace

TEST_CASE("settle_all with no tasks completes at once", "[async]") {
    TestLoop loop;
    loop.run(settle_all(loop.executor(), {}));
}

TEST_CASE("settle_all waits for the slowest task", "[async]") {
    TestLoop loop;
    std::atomic<int> finished{0};

    std::vector<asio::awaitable<void>> tasks;
    tasks.push_back(finish_after(100ms, finished));
    tasks.push_back(finish_after(10ms, finished));
    tasks.push_back(finish_after(50ms, finished));
    loop.run(settle_all(loop.executor(), std::move(tasks)));

    REQUIRE(finished == 3);
}

TEST_CASE("Throwing tasks still count as settled", "[async]") {
    TestLoop loop;
    std::atomic<int> finished{0};

    std::vector<asio::awaitable<void>> tasks;
    tasks.push_back(throw_standard());
    tasks.push_back(finish_after(20ms, finished));
    tasks.push_back(throw_other());
    loop.run(settle_all(loop.executor(), std::move(tasks)));

    REQUIRE(finished == 1);

    // The loop survives and keeps running work.
    std::vector<asio::awaitable<void>> more;
    more.push_back(finish_after(1ms, finished));
    loop.run(settle_all(loop.executor(), std::move(more)));
    REQUIRE(finished == 2);
}
