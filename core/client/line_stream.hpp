#pragma once

#include <cstddef>
#include <mutex>
#include <string>

namespace tether {
namespace client {

// Longest accepted message; longer lines are discarded up to the next terminator
constexpr size_t kMaxLineSize = 16u * 1024u * 1024u;

// LineStream carries newline-terminated messages over a child's stdin/stdout pipes.
// Writes are serialised internally so concurrent senders never interleave bytes.
// Reads must come from a single thread (the transport's reader loop).
class LineStream {
public:
    using PipeHandle = int;  // file descriptor

    enum class ReadStatus {
        LINE,           // one complete message in out
        TIMEOUT,        // no complete message within timeout
        END_OF_STREAM,  // peer closed its stdout
        OVERSIZED,      // a message over kMaxLineSize was dropped
        ERROR           // read/poll failure, see last_read_error()
    };

    LineStream();
    ~LineStream();

    LineStream(const LineStream &) = delete;
    LineStream &operator=(const LineStream &) = delete;

    // stdin_write / stdout_read from the parent's perspective; takes ownership
    void set_handles(PipeHandle stdin_write, PipeHandle stdout_read);

    // Writes line plus '\n'. Returns false and sets error on failure or timeout.
    bool write_line(const std::string &line, std::string &error, int timeout_ms = -1);

    // Returns the next complete line (terminator and trailing '\r' stripped)
    ReadStatus read_line(std::string &out, int timeout_ms);

    // Close stdin (signals EOF to the child). Safe to call repeatedly.
    void close_stdin();

    // Close stdout. Only call once the reader thread has stopped.
    void close_stdout();

    bool stdin_open() const;

    const std::string &last_read_error() const { return read_error_; }

private:
    PipeHandle stdin_write_;
    PipeHandle stdout_read_;
    std::string read_error_;

    std::string buffer_;       // bytes read but not yet returned
    bool discarding_ = false;  // inside an oversized line
    bool eof_ = false;

    mutable std::mutex write_mutex_;

    // Low-level write exactly n bytes (handles partial writes, EINTR, EAGAIN)
    bool write_exact(const char *buf, size_t n, int timeout_ms, std::string &error);

    // Pops a complete line out of buffer_, if any
    bool extract_line(std::string &out, bool &dropped_oversized);
};

}  // namespace client
}  // namespace tether
