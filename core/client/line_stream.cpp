#include "line_stream.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstring>

namespace tether {
namespace client {

namespace {
constexpr LineStream::PipeHandle kInvalidHandle = -1;
constexpr size_t kReadChunk = 64 * 1024;

int remaining_ms(std::chrono::steady_clock::time_point start, int timeout_ms) {
    if (timeout_ms < 0) {
        return -1;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    auto left = timeout_ms - static_cast<int>(elapsed.count());
    return left > 0 ? left : 0;
}
}  // namespace

LineStream::LineStream() : stdin_write_(kInvalidHandle), stdout_read_(kInvalidHandle) {}

LineStream::~LineStream() {
    close_stdin();
    close_stdout();
}

void LineStream::set_handles(PipeHandle stdin_write, PipeHandle stdout_read) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        stdin_write_ = stdin_write;
        if (stdin_write_ >= 0) {
            // Non-blocking so a child that stops reading cannot wedge a sender past its deadline
            int flags = fcntl(stdin_write_, F_GETFL, 0);
            if (flags >= 0) {
                fcntl(stdin_write_, F_SETFL, flags | O_NONBLOCK);
            }
        }
    }
    stdout_read_ = stdout_read;
    buffer_.clear();
    discarding_ = false;
    eof_ = false;
    read_error_.clear();
}

bool LineStream::write_line(const std::string &line, std::string &error, int timeout_ms) {
    if (line.size() > kMaxLineSize) {
        error = "Message too large: " + std::to_string(line.size()) + " bytes";
        return false;
    }
    if (line.find('\n') != std::string::npos) {
        error = "Message contains a line terminator";
        return false;
    }

    std::string framed;
    framed.reserve(line.size() + 1);
    framed.append(line);
    framed.push_back('\n');

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_write_ < 0) {
        error = "stdin is closed";
        return false;
    }
    return write_exact(framed.data(), framed.size(), timeout_ms, error);
}

bool LineStream::write_exact(const char *buf, size_t n, int timeout_ms, std::string &error) {
    size_t total = 0;
    auto start_time = std::chrono::steady_clock::now();

    while (total < n) {
        ssize_t w = write(stdin_write_, buf + total, n - total);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                int left = remaining_ms(start_time, timeout_ms);
                if (left == 0) {
                    error = "Timeout writing message";
                    return false;
                }
                struct pollfd pfd;
                pfd.fd = stdin_write_;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                int result = poll(&pfd, 1, left);
                if (result < 0 && errno != EINTR) {
                    error = "poll failed: " + std::string(strerror(errno));
                    return false;
                }
                if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
                    error = "Broken pipe (server terminated)";
                    return false;
                }
                continue;
            }
            if (errno == EPIPE) {
                error = "Broken pipe (server terminated)";
            } else {
                error = "Write failed: " + std::string(strerror(errno));
            }
            return false;
        }
        if (w == 0) {
            error = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool LineStream::extract_line(std::string &out, bool &dropped_oversized) {
    while (true) {
        auto newline = buffer_.find('\n');
        if (newline == std::string::npos) {
            if (buffer_.size() > kMaxLineSize) {
                buffer_.clear();
                if (!discarding_) {
                    discarding_ = true;
                    dropped_oversized = true;
                }
            }
            return false;
        }

        if (discarding_) {
            // Tail of an oversized line
            buffer_.erase(0, newline + 1);
            discarding_ = false;
            continue;
        }

        out.assign(buffer_, 0, newline);
        buffer_.erase(0, newline + 1);
        if (!out.empty() && out.back() == '\r') {
            out.pop_back();
        }
        return true;
    }
}

LineStream::ReadStatus LineStream::read_line(std::string &out, int timeout_ms) {
    read_error_.clear();
    auto start_time = std::chrono::steady_clock::now();

    while (true) {
        bool dropped = false;
        if (extract_line(out, dropped)) {
            return ReadStatus::LINE;
        }
        if (dropped) {
            return ReadStatus::OVERSIZED;
        }
        if (eof_) {
            return ReadStatus::END_OF_STREAM;
        }
        if (stdout_read_ < 0) {
            read_error_ = "Invalid stdout pipe";
            return ReadStatus::ERROR;
        }

        struct pollfd pfd;
        pfd.fd = stdout_read_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int result = poll(&pfd, 1, remaining_ms(start_time, timeout_ms));
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            read_error_ = "poll failed: " + std::string(strerror(errno));
            return ReadStatus::ERROR;
        }
        if (result == 0) {
            return ReadStatus::TIMEOUT;
        }
        if ((pfd.revents & POLLNVAL) != 0) {
            read_error_ = "stdout pipe is not open";
            return ReadStatus::ERROR;
        }

        // POLLHUP still needs a read to drain what the child wrote before exiting
        char chunk[kReadChunk];
        ssize_t r = read(stdout_read_, chunk, sizeof(chunk));
        if (r < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            read_error_ = "Read failed: " + std::string(strerror(errno));
            return ReadStatus::ERROR;
        }
        if (r == 0) {
            eof_ = true;
            // A final unterminated message still counts
            if (!buffer_.empty() && !discarding_) {
                out.swap(buffer_);
                buffer_.clear();
                if (!out.empty() && out.back() == '\r') {
                    out.pop_back();
                }
                return ReadStatus::LINE;
            }
            return ReadStatus::END_OF_STREAM;
        }
        buffer_.append(chunk, static_cast<size_t>(r));

        if (timeout_ms >= 0 && remaining_ms(start_time, timeout_ms) == 0) {
            bool dropped_now = false;
            if (extract_line(out, dropped_now)) {
                return ReadStatus::LINE;
            }
            return dropped_now ? ReadStatus::OVERSIZED : ReadStatus::TIMEOUT;
        }
    }
}

void LineStream::close_stdin() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_write_ >= 0) {
        close(stdin_write_);
        stdin_write_ = kInvalidHandle;
    }
}

void LineStream::close_stdout() {
    if (stdout_read_ >= 0) {
        close(stdout_read_);
        stdout_read_ = kInvalidHandle;
    }
}

bool LineStream::stdin_open() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return stdin_write_ >= 0;
}

}  // namespace client
}  // namespace tether
