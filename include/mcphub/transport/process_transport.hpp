#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport
// ═══════════════════════════════════════════════════════════════════════════
// Spawns a server process and exchanges newline-delimited JSON-RPC over its
// stdin/stdout using asio stream descriptors.
//
// - Writes go through a single writer coroutine fed by a queue, so one
//   envelope is fully written before the next starts.
// - stdout is read in chunks and split by LineFramer; a single read may
//   yield several messages. Unparsable lines are logged and dropped.
// - stderr is diagnostics only: logged at debug level, bounded tail kept.
// - When the process exits (or closes stdout) the receive side yields a
//   Closed error carrying the exit status.
// - Stop: close stdin, SIGTERM, wait for the grace period, then SIGKILL.

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ProcessTransport is only available on POSIX-compatible systems"
#endif

#include "mcphub/transport/line_framer.hpp"
#include "mcphub/transport/transport.hpp"

#include <asio/experimental/concurrent_channel.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace mcphub {

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

enum class StderrHandling {
    Discard,      // Redirect to /dev/null
    Passthrough,  // Inherit from parent
    Capture       // Log at debug level and keep a bounded tail
};

struct ProcessTransportConfig {
    std::string command;
    std::vector<std::string> args;

    /// Merged over the parent environment; later entries win.
    std::vector<std::pair<std::string, std::string>> env;

    std::size_t max_line_size{LineFramer::kDefaultMaxLineSize};

    StderrHandling stderr_handling{StderrHandling::Capture};
    std::size_t stderr_tail_limit{16 * 1024};

    std::size_t channel_capacity{64};

    /// Time between SIGTERM and SIGKILL on stop.
    std::chrono::milliseconds shutdown_grace{std::chrono::seconds(2)};

    /// Used as a log prefix; defaults to the command.
    std::string label;
};

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport
// ═══════════════════════════════════════════════════════════════════════════

class ProcessTransport : public ITransport {
public:
    ProcessTransport(asio::any_io_executor executor, ProcessTransportConfig config);
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;
    ProcessTransport(ProcessTransport&&) = delete;
    ProcessTransport& operator=(ProcessTransport&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // ITransport
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] std::string describe() const override;

    // ─────────────────────────────────────────────────────────────────────────
    // Process-specific
    // ─────────────────────────────────────────────────────────────────────────

    /// -1 when no child is running.
    [[nodiscard]] pid_t child_pid() const;

    /// Exit code once reaped; negative values are the terminating signal.
    [[nodiscard]] std::optional<int> exit_code() const;

    [[nodiscard]] std::string stderr_tail() const;

    /// Lines dropped because they could not be framed or parsed.
    [[nodiscard]] std::size_t malformed_count() const;

private:
    using InboundChannel = asio::experimental::concurrent_channel<
        void(asio::error_code, TransportResult<Json>)
    >;
    using OutboundChannel = asio::experimental::concurrent_channel<
        void(asio::error_code, std::string)
    >;

    asio::awaitable<void> reader_loop();
    asio::awaitable<void> writer_loop();
    asio::awaitable<void> stderr_loop();
    asio::awaitable<void> exit_watch_loop();
    asio::awaitable<void> stop_on_strand();

    TransportResult<void> spawn_process();
    asio::awaitable<bool> wait_for_exit(std::chrono::milliseconds limit);
    asio::awaitable<void> terminate_child();
    bool reap_child(int options);
    void kill_child_now();
    void close_streams();
    [[nodiscard]] std::string exit_description() const;

    ProcessTransportConfig config_;

    asio::any_io_executor executor_;
    asio::strand<asio::any_io_executor> strand_;

    std::unique_ptr<asio::posix::stream_descriptor> stdin_stream_;
    std::unique_ptr<asio::posix::stream_descriptor> stdout_stream_;
    std::unique_ptr<asio::posix::stream_descriptor> stderr_stream_;

    std::unique_ptr<InboundChannel> inbound_;
    std::unique_ptr<OutboundChannel> outbound_;

    LineFramer framer_;
    std::atomic<std::size_t> malformed_{0};

    // Guards child_pid_ and exit_code_; waitpid runs from the strand and
    // from the destructor.
    mutable std::mutex process_mutex_;
    pid_t child_pid_{-1};
    std::optional<int> exit_code_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> closed_seen_{false};
    std::atomic<int> active_loops_{0};

    mutable std::mutex stderr_mutex_;
    std::string stderr_tail_;
};

}  // namespace mcphub
