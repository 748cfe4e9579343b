#include "wxmcp/transport/stdio_transport.hpp"
#include "wxmcp/error.hpp"
#include "wxmcp/logger.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <climits>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace wxmcp {

namespace {

// Longest write that cannot block once poll() reports a pipe writable
constexpr size_t WRITE_CHUNK = PIPE_BUF;
constexpr int POLL_SLICE_MS = 100;

std::string strip_cr(std::string line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

// Moves every complete line out of pending into session, keeping the partial tail
void take_complete_lines(std::string& pending, Session& session) {
    size_t start = 0;
    for (size_t nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', start)) {
        std::string line = strip_cr(pending.substr(start, nl - start));
        start = nl + 1;
        if (!line.empty()) session.enqueue(std::move(line));
    }
    pending.erase(0, start);
}

} // anonymous namespace

// ---------- StdioChannel ----------

StdioChannel::StdioChannel(int write_fd, std::chrono::milliseconds flush_timeout)
    : write_fd_(write_fd), flush_timeout_(flush_timeout) {
    writer_thread_ = std::thread([this]() { write_loop(); });
}

StdioChannel::~StdioChannel() {
    flush_and_stop();
}

void StdioChannel::flush_and_stop() {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!deadline_) deadline_ = std::chrono::steady_clock::now() + flush_timeout_;
    }
    close();
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (writer_thread_.joinable() && writer_thread_.get_id() != std::this_thread::get_id()) {
        writer_thread_.join();
    }
}

bool StdioChannel::send(const std::string& frame) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!open_) return false;
        write_queue_.push(frame);
    }
    write_cv_.notify_one();
    return true;
}

void StdioChannel::close() {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        open_ = false;
    }
    write_cv_.notify_all();
}

bool StdioChannel::is_open() const {
    return open_;
}

size_t StdioChannel::dropped() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return dropped_;
}

int StdioChannel::next_poll_slice_ms() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!deadline_) return POLL_SLICE_MS;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline_ - std::chrono::steady_clock::now()).count();
    if (left <= 0) return -1;
    return static_cast<int>(std::min<long long>(left, POLL_SLICE_MS));
}

StdioChannel::WriteStatus StdioChannel::write_line(const std::string& bytes) {
    const char* cursor = bytes.data();
    size_t left = bytes.size();
    while (left > 0) {
        const int slice = next_poll_slice_ms();
        if (slice < 0) return WriteStatus::TimedOut;

        pollfd out{write_fd_, POLLOUT, 0};
        const int ready = ::poll(&out, 1, slice);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return WriteStatus::Failed;
        }
        if (ready == 0) continue;
        if (out.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            errno = EPIPE;
            return WriteStatus::Failed;
        }

        ssize_t n = ::write(write_fd_, cursor, std::min(left, WRITE_CHUNK));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return WriteStatus::Failed;
        }
        cursor += n;
        left -= static_cast<size_t>(n);
    }
    return WriteStatus::Written;
}

void StdioChannel::abandon_queue(const char* reason) {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        open_ = false;
        count = write_queue_.size();
        write_queue_ = {};
        dropped_ += count;
    }
    LOG4CPLUS_WARN(transport_logger(), "stdio output " << reason << ", dropped "
                   << count << " queued frame(s)");
}

void StdioChannel::write_loop() {
    for (;;) {
        std::string line;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] { return !write_queue_.empty() || !open_; });
            // Frames queued before close() are still written
            if (write_queue_.empty()) return;
            line = std::move(write_queue_.front());
            write_queue_.pop();
        }

        line.push_back('\n');
        switch (write_line(line)) {
            case WriteStatus::Written:
                break;
            case WriteStatus::Failed:
                LOG4CPLUS_ERROR(transport_logger(), "stdio write failed: " << strerror(errno));
                {
                    std::lock_guard<std::mutex> lock(write_mutex_);
                    ++dropped_;
                }
                abandon_queue("broken");
                return;
            case WriteStatus::TimedOut:
                {
                    std::lock_guard<std::mutex> lock(write_mutex_);
                    ++dropped_;
                }
                abandon_queue("not drained before the flush timeout");
                return;
        }
    }
}

// ---------- StdioTransport ----------

StdioTransport::StdioTransport(SessionManager& sessions, std::chrono::milliseconds flush_timeout)
    : sessions_(sessions), read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false)
    , flush_timeout_(flush_timeout) {
}

StdioTransport::StdioTransport(SessionManager& sessions, int read_fd, int write_fd,
                               std::chrono::milliseconds flush_timeout)
    : sessions_(sessions), read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true)
    , flush_timeout_(flush_timeout) {
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (reader_thread_.joinable()) reader_thread_.join();
    // The session may outlive us; nothing may write to the fd once it is closed
    sessions_.release(SESSION_ID);
    if (channel_) channel_->flush_and_stop();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start() {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;

    if (::pipe(wakeup_pipe_) < 0) {
        running_ = false;
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    // shutdown() must never block on a full wakeup pipe
    const int wake_flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    if (wake_flags < 0 || ::fcntl(wakeup_pipe_[1], F_SETFL, wake_flags | O_NONBLOCK) < 0) {
        LOG4CPLUS_WARN(transport_logger(), "stdio wakeup pipe stays blocking: " << strerror(errno));
    }

    channel_ = std::make_shared<StdioChannel>(write_fd_, flush_timeout_);
    auto session = sessions_.open(TransportKind::Stdio, channel_, SESSION_ID);

    reader_thread_ = std::thread([this, session]() { read_loop(session); });
    LOG4CPLUS_INFO(transport_logger(), "stdio transport listening");
}

void StdioTransport::read_loop(std::shared_ptr<Session> session) {
    std::string pending;
    char chunk[4096];

    while (running_) {
        pollfd watched[2] = {
            {read_fd_, POLLIN, 0},
            {wakeup_pipe_[0], POLLIN, 0},
        };
        if (::poll(watched, 2, -1) < 0) {
            if (errno == EINTR) continue;
            LOG4CPLUS_ERROR(transport_logger(), "stdio poll failed: " << strerror(errno));
            break;
        }

        // Woken by shutdown(); the session is released by the destructor
        if (watched[1].revents & POLLIN) return;
        if (!(watched[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t got = ::read(read_fd_, chunk, sizeof(chunk));
        if (got < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            LOG4CPLUS_ERROR(transport_logger(), "stdio read failed: " << strerror(errno));
            break;
        }
        if (got == 0) {
            LOG4CPLUS_INFO(transport_logger(), "stdio input closed");
            break;
        }

        pending.append(chunk, static_cast<size_t>(got));
        take_complete_lines(pending, *session);
    }

    // A final line without a trailing newline still counts as a frame
    std::string last = strip_cr(std::move(pending));
    if (!last.empty()) session->enqueue(std::move(last));

    input_closed_ = true;
    session->end_of_input();
}

void StdioTransport::stop_accepting() {
    shutdown();
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.exchange(false)) return;
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            LOG4CPLUS_WARN(transport_logger(), "stdio wakeup failed: " << strerror(errno));
        }
    }
    LOG4CPLUS_INFO(transport_logger(), "stdio transport stopped");
}

bool StdioTransport::is_running() const {
    return running_;
}

} // namespace wxmcp
