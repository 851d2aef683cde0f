#include "mcphub/transport/process_transport.hpp"
#include "mcphub/log/logger.hpp"

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

extern char** environ;

namespace mcphub {

namespace {

constexpr auto kExitPollInterval = std::chrono::milliseconds(10);
constexpr auto kExitSettleTime = std::chrono::milliseconds(500);
constexpr auto kExitWatchInterval = std::chrono::milliseconds(100);
constexpr auto kLoopDrainLimit = std::chrono::seconds(1);
constexpr useconds_t kDestructorGraceUs = 100'000;

TransportError make_error(TransportError::Category cat, std::string msg) {
    return TransportError{cat, std::move(msg)};
}

// A write to a pipe whose reader has exited must fail with EPIPE instead of
// killing the host process.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

void set_cloexec(int fd) {
    if (fd < 0) {
        return;
    }
    const int flags = fcntl(fd, F_GETFD);
    if (flags != -1) {
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>>& overrides
) {
    std::vector<std::string> entries;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string_view text(*entry);
        const auto name = text.substr(0, text.find('='));
        const bool overridden = std::any_of(overrides.begin(), overrides.end(),
            [&name](const auto& kv) { return kv.first == name; });
        if (overridden == false) {
            entries.emplace_back(text);
        }
    }
    for (const auto& [name, value] : overrides) {
        entries.push_back(name + "=" + value);
    }
    return entries;
}

std::vector<char*> as_pointer_array(std::vector<std::string>& storage) {
    std::vector<char*> pointers;
    pointers.reserve(storage.size() + 1);
    for (auto& str : storage) {
        pointers.push_back(str.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

// Keeps ProcessTransport::active_loops_ accurate across every exit path of a
// coroutine, including cancellation.
struct LoopGuard {
    explicit LoopGuard(std::atomic<int>& counter) : counter_(counter) {}
    ~LoopGuard() { counter_.fetch_sub(1); }
    LoopGuard(const LoopGuard&) = delete;
    LoopGuard& operator=(const LoopGuard&) = delete;

    std::atomic<int>& counter_;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

ProcessTransport::ProcessTransport(
    asio::any_io_executor executor,
    ProcessTransportConfig config
)
    : config_(std::move(config))
    , executor_(std::move(executor))
    , strand_(asio::make_strand(executor_))
    , framer_(config_.max_line_size)
{
    if (config_.label.empty()) {
        config_.label = config_.command;
    }
}

ProcessTransport::~ProcessTransport() {
    // Owners await async_stop() first; this only makes sure no child outlives us.
    stopping_ = true;
    running_ = false;
    kill_child_now();
}

// ═══════════════════════════════════════════════════════════════════════════
// ITransport
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor ProcessTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> ProcessTransport::async_start() {
    if (running_ || inbound_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Transport already started"
        ));
    }
    if (config_.command.empty()) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "No command configured"
        ));
    }

    ignore_sigpipe_once();

    auto spawned = spawn_process();
    if (!spawned) {
        co_return spawned;
    }

    inbound_ = std::make_unique<InboundChannel>(executor_, config_.channel_capacity);
    outbound_ = std::make_unique<OutboundChannel>(executor_, config_.channel_capacity);
    running_ = true;

    active_loops_ += 2;
    asio::co_spawn(strand_, reader_loop(), asio::detached);
    asio::co_spawn(strand_, writer_loop(), asio::detached);

    if (stderr_stream_) {
        ++active_loops_;
        asio::co_spawn(strand_, stderr_loop(), asio::detached);
    }

    ++active_loops_;
    asio::co_spawn(strand_, exit_watch_loop(), asio::detached);

    MCPHUB_LOG_INFO("[{}] started process {} (pid {})", config_.label, describe(), child_pid());

    co_return TransportResult<void>{};
}

asio::awaitable<void> ProcessTransport::async_stop() {
    co_await asio::co_spawn(strand_, stop_on_strand(), asio::use_awaitable);
}

asio::awaitable<TransportResult<void>> ProcessTransport::async_send(Json message) {
    if (!running_ || !outbound_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Transport not running"
        ));
    }

    std::string line;
    try {
        line = message.dump();
    } catch (const Json::type_error& e) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Failed to serialize message: " + std::string(e.what())
        ));
    }
    line.push_back('\n');

    auto [ec] = co_await outbound_->async_send(
        asio::error_code{}, std::move(line), asio::as_tuple(asio::use_awaitable));
    if (ec) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Server stdin is closed"
        ));
    }

    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<Json>> ProcessTransport::async_receive() {
    if (!inbound_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "Transport not started"
        ));
    }
    if (closed_seen_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "Server process ended: " + exit_description()
        ));
    }

    auto [ec, result] = co_await inbound_->async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec) {
        closed_seen_ = true;
        co_return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "Transport stopped"
        ));
    }
    if (!result && result.error().category == TransportError::Category::Closed) {
        closed_seen_ = true;
    }
    co_return std::move(result);
}

bool ProcessTransport::is_running() const {
    return running_;
}

std::string ProcessTransport::describe() const {
    std::string text = config_.command;
    for (const auto& arg : config_.args) {
        text += ' ';
        text += arg;
    }
    return text;
}

// ═══════════════════════════════════════════════════════════════════════════
// Process-Specific
// ═══════════════════════════════════════════════════════════════════════════

pid_t ProcessTransport::child_pid() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return child_pid_;
}

std::optional<int> ProcessTransport::exit_code() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return exit_code_;
}

std::string ProcessTransport::stderr_tail() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return stderr_tail_;
}

std::size_t ProcessTransport::malformed_count() const {
    return malformed_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: I/O Loops
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> ProcessTransport::reader_loop() {
    LoopGuard guard(active_loops_);
    std::array<char, 8192> buffer;
    std::size_t dropped_before = 0;

    while (true) {
        asio::error_code ec;
        const std::size_t n = co_await stdout_stream_->async_read_some(
            asio::buffer(buffer), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec != asio::error::eof && !stopping_) {
                MCPHUB_LOG_DEBUG("[{}] stdout read ended: {}", config_.label, ec.message());
            }
            break;
        }

        for (auto& line : framer_.feed(std::string_view(buffer.data(), n))) {
            auto message = decode_line(line);
            if (!message) {
                ++malformed_;
                MCPHUB_LOG_WARN("[{}] discarding malformed line: {}",
                                config_.label, message.error().message);
                continue;
            }
            auto [send_ec] = co_await inbound_->async_send(
                asio::error_code{}, std::move(message), asio::as_tuple(asio::use_awaitable));
            if (send_ec) {
                co_return;
            }
        }

        if (framer_.dropped() != dropped_before) {
            malformed_ += framer_.dropped() - dropped_before;
            dropped_before = framer_.dropped();
            MCPHUB_LOG_WARN("[{}] discarding line longer than {} bytes",
                            config_.label, config_.max_line_size);
        }
    }

    if (stopping_) {
        co_return;
    }

    // The server closed stdout on its own: report why, then end the stream.
    running_ = false;
    if (co_await wait_for_exit(kExitSettleTime) == false) {
        co_await terminate_child();
    }
    if (stopping_) {
        co_return;
    }

    const auto reason = exit_description();
    MCPHUB_LOG_INFO("[{}] server process ended ({})", config_.label, reason);
    if (outbound_) {
        outbound_->close();
    }

    co_await inbound_->async_send(
        asio::error_code{},
        TransportResult<Json>(tl::unexpected(make_error(
            TransportError::Category::Closed, "Server process ended: " + reason))),
        asio::as_tuple(asio::use_awaitable));
}

asio::awaitable<void> ProcessTransport::writer_loop() {
    LoopGuard guard(active_loops_);

    while (true) {
        auto [ec, bytes] = co_await outbound_->async_receive(asio::as_tuple(asio::use_awaitable));
        if (ec) {
            break;
        }

        asio::error_code write_ec;
        co_await asio::async_write(
            *stdin_stream_, asio::buffer(bytes), asio::redirect_error(asio::use_awaitable, write_ec));
        if (write_ec) {
            if (!stopping_) {
                MCPHUB_LOG_WARN("[{}] write to server stdin failed: {}",
                                config_.label, write_ec.message());
            }
            outbound_->close();
            break;
        }
    }
}

asio::awaitable<void> ProcessTransport::stderr_loop() {
    LoopGuard guard(active_loops_);
    LineFramer lines(config_.stderr_tail_limit);
    std::array<char, 4096> buffer;

    while (true) {
        asio::error_code ec;
        const std::size_t n = co_await stderr_stream_->async_read_some(
            asio::buffer(buffer), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            break;
        }

        {
            std::lock_guard<std::mutex> lock(stderr_mutex_);
            stderr_tail_.append(buffer.data(), n);
            if (stderr_tail_.size() > config_.stderr_tail_limit) {
                stderr_tail_.erase(0, stderr_tail_.size() - config_.stderr_tail_limit);
            }
        }

        for (const auto& line : lines.feed(std::string_view(buffer.data(), n))) {
            MCPHUB_LOG_DEBUG("[{}] stderr: {}", config_.label, line);
        }
    }
}

// A descendant of the server can inherit stdout and keep it open after the
// server itself has exited. Once the server is reaped and nothing is left to
// read, closing stdout sends the reader down its end-of-stream path.
asio::awaitable<void> ProcessTransport::exit_watch_loop() {
    LoopGuard guard(active_loops_);
    asio::steady_timer timer(strand_);
    bool exited = false;

    while (true) {
        timer.expires_after(kExitWatchInterval);
        asio::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (!running_ || stopping_) {
            co_return;
        }

        if (exited == false) {
            exited = reap_child(WNOHANG);
            if (exited == false) {
                continue;
            }
            MCPHUB_LOG_DEBUG("[{}] server process exited ({})", config_.label, exit_description());
        }

        if (!stdout_stream_ || !stdout_stream_->is_open()) {
            co_return;
        }
        asio::error_code avail_ec;
        const std::size_t pending = stdout_stream_->available(avail_ec);
        if (!avail_ec && pending > 0) {
            continue;
        }

        MCPHUB_LOG_DEBUG("[{}] closing stdout still held open by another process", config_.label);
        stdout_stream_->close(avail_ec);
        co_return;
    }
}

asio::awaitable<void> ProcessTransport::stop_on_strand() {
    if (!inbound_ || stopping_.exchange(true)) {
        co_return;
    }
    running_ = false;

    if (outbound_) {
        outbound_->close();
    }
    if (stdin_stream_ && stdin_stream_->is_open()) {
        asio::error_code ec;
        stdin_stream_->close(ec);
    }

    co_await terminate_child();
    close_streams();
    inbound_->close();

    // The loops hold `this`; let their cancelled operations complete first.
    asio::steady_timer timer(strand_);
    const auto deadline = std::chrono::steady_clock::now() + kLoopDrainLimit;
    while (active_loops_ > 0 && std::chrono::steady_clock::now() < deadline) {
        timer.expires_after(std::chrono::milliseconds(1));
        asio::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }

    MCPHUB_LOG_INFO("[{}] process transport stopped ({})", config_.label, exit_description());
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Process Management
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<void> ProcessTransport::spawn_process() {
    // Everything the child needs is allocated before fork(): after fork only
    // the calling thread exists and malloc may be locked by a vanished thread.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    argv_storage.insert(argv_storage.end(), config_.args.begin(), config_.args.end());
    auto argv = as_pointer_array(argv_storage);

    auto env_storage = build_environment(config_.env);
    auto envp = as_pointer_array(env_storage);

    const bool capture_stderr = (config_.stderr_handling == StderrHandling::Capture);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&] {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };

    const bool pipes_ok =
        (pipe(stdin_pipe) == 0) &&
        (pipe(stdout_pipe) == 0) &&
        (pipe(status_pipe) == 0) &&
        (capture_stderr == false || pipe(stderr_pipe) == 0);
    if (pipes_ok == false) {
        const int err = errno;
        close_all();
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to create pipes: " + std::string(std::strerror(err))
        ));
    }

    // Nothing may leak into other children spawned concurrently; dup2 onto
    // 0/1/2 clears the flag for the descriptors the child actually keeps.
    for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe}) {
        set_cloexec(fds[0]);
        set_cloexec(fds[1]);
    }

    const pid_t pid = fork();

    if (pid == -1) {
        const int err = errno;
        close_all();
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to fork: " + std::string(std::strerror(err))
        ));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);

        switch (config_.stderr_handling) {
            case StderrHandling::Discard: {
                const int devnull = open("/dev/null", O_WRONLY);
                if (devnull != -1) {
                    dup2(devnull, STDERR_FILENO);
                }
                break;
            }
            case StderrHandling::Passthrough:
                break;
            case StderrHandling::Capture:
                dup2(stderr_pipe[1], STDERR_FILENO);
                break;
        }
        fcntl(STDIN_FILENO, F_SETFD, 0);
        fcntl(STDOUT_FILENO, F_SETFD, 0);
        fcntl(STDERR_FILENO, F_SETFD, 0);

        environ = envp.data();
        execvp(argv[0], argv.data());

        // exec failed: report errno through the status pipe.
        const int err = errno;
        [[maybe_unused]] const auto written = ::write(status_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    // Parent
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on successful exec; data means exec failed.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n > 0) {
        int status = 0;
        waitpid(pid, &status, 0);
        close_all();
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to execute '" + config_.command + "': " + std::strerror(child_errno)
        ));
    }

    stdin_stream_ = std::make_unique<asio::posix::stream_descriptor>(strand_, stdin_pipe[1]);
    stdout_stream_ = std::make_unique<asio::posix::stream_descriptor>(strand_, stdout_pipe[0]);
    if (capture_stderr) {
        stderr_stream_ = std::make_unique<asio::posix::stream_descriptor>(strand_, stderr_pipe[0]);
    }

    std::lock_guard<std::mutex> lock(process_mutex_);
    child_pid_ = pid;
    exit_code_.reset();
    return {};
}

bool ProcessTransport::reap_child(int options) {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (child_pid_ <= 0) {
        return true;
    }

    int status = 0;
    const pid_t result = waitpid(child_pid_, &status, options);
    if (result == child_pid_) {
        exit_code_ = decode_wait_status(status);
        child_pid_ = -1;
        return true;
    }
    if (result == -1 && errno == ECHILD) {
        child_pid_ = -1;
        return true;
    }
    return false;
}

asio::awaitable<bool> ProcessTransport::wait_for_exit(std::chrono::milliseconds limit) {
    asio::steady_timer timer(strand_);
    const auto deadline = std::chrono::steady_clock::now() + limit;

    while (true) {
        if (reap_child(WNOHANG)) {
            co_return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            co_return false;
        }
        timer.expires_after(kExitPollInterval);
        asio::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
}

asio::awaitable<void> ProcessTransport::terminate_child() {
    if (reap_child(WNOHANG)) {
        co_return;
    }

    const pid_t pid = child_pid();
    if (pid > 0) {
        kill(pid, SIGTERM);
    }
    if (co_await wait_for_exit(config_.shutdown_grace)) {
        co_return;
    }

    MCPHUB_LOG_WARN("[{}] process {} ignored SIGTERM for {}ms, sending SIGKILL",
                    config_.label, pid, config_.shutdown_grace.count());
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (child_pid_ > 0) {
            kill(child_pid_, SIGKILL);
        }
    }
    reap_child(0);
}

void ProcessTransport::kill_child_now() {
    if (reap_child(WNOHANG)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (child_pid_ > 0) {
            kill(child_pid_, SIGTERM);
        }
    }
    usleep(kDestructorGraceUs);
    if (reap_child(WNOHANG)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (child_pid_ > 0) {
            kill(child_pid_, SIGKILL);
        }
    }
    reap_child(0);
}

void ProcessTransport::close_streams() {
    for (auto* stream : {stdin_stream_.get(), stdout_stream_.get(), stderr_stream_.get()}) {
        if (stream != nullptr && stream->is_open()) {
            asio::error_code ec;
            stream->close(ec);
        }
    }
}

std::string ProcessTransport::exit_description() const {
    const auto code = exit_code();
    if (code.has_value() == false) {
        return "stdout closed";
    }
    if (*code >= 0) {
        return "exit code " + std::to_string(*code);
    }
    return "signal " + std::to_string(-*code);
}

}  // namespace mcphub
