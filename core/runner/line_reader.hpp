#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "process/unique_fd.hpp"
#include "result.hpp"

namespace daemon_runner {
namespace runner {

constexpr size_t kDefaultMaxLineLength = 64 * 1024;

// LineReader drains one pipe and splits it into newline-delimited UTF-8 lines.
// A trailing '\r' is stripped and a final unterminated line is delivered at
// end-of-stream. Owns (and closes) the descriptor.
//
// Lines longer than max_line_length bytes are split: the reader delivers
// pieces of at most that size, cut on a UTF-8 character boundary, and the
// remainder continues as the next line. Nothing is dropped and the pending
// buffer stays within max_line_length + 1 bytes plus one read chunk.
// A line of exactly max_line_length bytes (not counting "\n" or "\r\n") is
// delivered whole.
class LineReader {
public:
    using LineCallback = std::function<void(const std::string &line)>;

    explicit LineReader(process::UniqueFd fd, size_t max_line_length = kDefaultMaxLineLength);

    // Delete copy
    LineReader(const LineReader &) = delete;
    LineReader &operator=(const LineReader &) = delete;

    // Block reading until end-of-stream, calling on_line once per line in order.
    // Returns OK at end-of-stream, IO_FAILURE on a read error and
    // DECODE_FAILURE on the first line that is not valid UTF-8 (that line is
    // not delivered). Lines before the failure have been delivered.
    Result run(const LineCallback &on_line);

    size_t lines_delivered() const { return lines_delivered_; }

private:
    process::UniqueFd fd_;
    size_t max_line_length_;
    std::string pending_;
    size_t lines_delivered_ = 0;

    bool deliver(std::string line, const LineCallback &on_line, Result &result, bool strip_cr = true);

    // Whether the line in pending_[start, newline) is short enough to deliver whole
    bool fits(size_t start, size_t newline) const;

    // End of the longest piece starting at `start` that fits max_line_length_
    size_t split_point(size_t start) const;
};

}  // namespace runner
}  // namespace daemon_runner
