#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// settle_all
// ═══════════════════════════════════════════════════════════════════════════
// Runs every task concurrently and resumes the caller once all of them have
// finished, successfully or not. There is no fail-fast: a task reports its
// own outcome through whatever state it owns, and an exception escaping a
// task is logged and counted as settled.

#include "mcphub/log/logger.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/use_awaitable.hpp>

#include <exception>
#include <memory>
#include <vector>

namespace mcphub {

inline asio::awaitable<void> settle_all(
    asio::any_io_executor executor,
    std::vector<asio::awaitable<void>> tasks
) {
    if (tasks.empty()) {
        co_return;
    }

    using DoneChannel = asio::experimental::concurrent_channel<void(asio::error_code)>;
    auto done = std::make_shared<DoneChannel>(executor, tasks.size());
    const std::size_t count = tasks.size();

    for (auto& task : tasks) {
        asio::co_spawn(executor, std::move(task), [done](std::exception_ptr error) {
            if (error) {
                try {
                    std::rethrow_exception(error);
                } catch (const std::exception& e) {
                    MCPHUB_LOG_ERROR("Concurrent task failed: {}", e.what());
                } catch (...) {
                    MCPHUB_LOG_ERROR("Concurrent task failed with a non-standard exception");
                }
            }
            done->try_send(asio::error_code{});
        });
    }

    for (std::size_t settled = 0; settled < count; ++settled) {
        co_await done->async_receive(asio::use_awaitable);
    }
}

}  // namespace mcphub
