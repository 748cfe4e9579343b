#pragma once
#include "transport.hpp"
#include "../session_manager.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>

namespace wxmcp {

constexpr std::chrono::milliseconds DEFAULT_FLUSH_TIMEOUT{5000};

/// Write half of the stdio stream. Frames are queued and written by a
/// dedicated thread; close() lets the queue drain before the thread exits.
/// Writes never block for longer than one poll slice, so a reader that stops
/// draining the stream cannot hold up flush_and_stop() past its timeout.
class StdioChannel : public IConnection {
public:
    explicit StdioChannel(int write_fd, std::chrono::milliseconds flush_timeout = DEFAULT_FLUSH_TIMEOUT);
    ~StdioChannel() override;

    bool send(const std::string& frame) override;
    void close() override;
    bool is_open() const override;

    /// Close, then wait up to the flush timeout for the queued frames to be
    /// written. Whatever is still queued after that is dropped.
    void flush_and_stop();

    /// Frames given up on because the stream was broken or the flush timed out.
    [[nodiscard]] size_t dropped() const;

private:
    enum class WriteStatus { Written, Failed, TimedOut };

    void write_loop();
    WriteStatus write_line(const std::string& bytes);
    int next_poll_slice_ms();
    void abandon_queue(const char* reason);

    int write_fd_;
    const std::chrono::milliseconds flush_timeout_;
    std::atomic<bool> open_{true};

    mutable std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    size_t dropped_{0};

    std::mutex join_mutex_;
    std::thread writer_thread_;
};

/// Reads newline-delimited JSON from stdin (or any fd) and feeds a single
/// session that lives as long as the input stream.
class StdioTransport : public ITransport {
public:
    /// Transport on the process stdin/stdout. Pending output is flushed for at
    /// most flush_timeout when the transport is destroyed.
    explicit StdioTransport(SessionManager& sessions,
                            std::chrono::milliseconds flush_timeout = DEFAULT_FLUSH_TIMEOUT);

    /// Transport on the given descriptors, closed on destruction (for testing).
    StdioTransport(SessionManager& sessions, int read_fd, int write_fd,
                   std::chrono::milliseconds flush_timeout = DEFAULT_FLUSH_TIMEOUT);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start() override;
    void stop_accepting() override;
    void shutdown() override;
    bool is_running() const override;

    /// True once the input stream hit EOF or a read error.
    [[nodiscard]] bool input_closed() const { return input_closed_; }

    static constexpr const char* SESSION_ID = "stdio";

private:
    void read_loop(std::shared_ptr<Session> session);

    SessionManager& sessions_;
    std::shared_ptr<StdioChannel> channel_;
    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    std::chrono::milliseconds flush_timeout_;

    std::atomic<bool> running_{false};
    std::atomic<bool> input_closed_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread reader_thread_;
    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in the reader
};

} // namespace wxmcp
