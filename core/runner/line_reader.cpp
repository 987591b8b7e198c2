#include "line_reader.hpp"

#include <errno.h>
#include <unistd.h>

#include <cstring>

#include "util/utf8.hpp"

namespace daemon_runner {
namespace runner {

namespace {
constexpr size_t kReadChunk = 4096;
}  // namespace

LineReader::LineReader(process::UniqueFd fd, size_t max_line_length)
    : fd_(std::move(fd)), max_line_length_(max_line_length > 0 ? max_line_length : kDefaultMaxLineLength) {}

size_t LineReader::split_point(size_t start) const {
    size_t cut = start + max_line_length_;
    // Back off continuation bytes so a multi-byte character is not torn apart
    while (cut > start && (static_cast<unsigned char>(pending_[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return cut > start ? cut : start + max_line_length_;
}

bool LineReader::fits(size_t start, size_t newline) const {
    const size_t length = newline - start;
    return length <= max_line_length_ || (length == max_line_length_ + 1 && pending_[newline - 1] == '\r');
}

bool LineReader::deliver(std::string line, const LineCallback &on_line, Result &result, bool strip_cr) {
    if (strip_cr && !line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (!util::is_valid_utf8(line)) {
        result = Result::failure(ErrorCode::DECODE_FAILURE,
                                 "stream data is not valid UTF-8 (after " + std::to_string(lines_delivered_) + " lines)");
        return false;
    }
    on_line(line);
    ++lines_delivered_;
    return true;
}

Result LineReader::run(const LineCallback &on_line) {
    if (!fd_.valid()) {
        return Result::failure(ErrorCode::IO_FAILURE, "invalid pipe descriptor");
    }

    char buf[kReadChunk];
    Result result;

    while (true) {
        ssize_t n = ::read(fd_.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Result::failure(ErrorCode::IO_FAILURE, std::string("pipe read failed: ") + std::strerror(errno));
        }

        if (n == 0) {
            // End-of-stream: flush an unterminated last line
            if (!pending_.empty()) {
                size_t start = 0;
                while (!fits(start, pending_.size())) {
                    size_t cut = split_point(start);
                    if (!deliver(pending_.substr(start, cut - start), on_line, result, false)) {
                        return result;
                    }
                    start = cut;
                }
                if (!deliver(pending_.substr(start), on_line, result)) {
                    return result;
                }
                pending_.clear();
            }
            fd_.reset();
            return Result::success();
        }

        pending_.append(buf, static_cast<size_t>(n));

        size_t start = 0;
        while (true) {
            size_t newline = pending_.find('\n', start);
            if (newline != std::string::npos && fits(start, newline)) {
                if (!deliver(pending_.substr(start, newline - start), on_line, result)) {
                    return result;
                }
                start = newline + 1;
            } else if (pending_.size() - start > max_line_length_ + 1) {
                // Over-long line: hand out a piece now instead of buffering without bound
                size_t cut = split_point(start);
                if (!deliver(pending_.substr(start, cut - start), on_line, result, false)) {
                    return result;
                }
                start = cut;
            } else {
                break;
            }
        }
        pending_.erase(0, start);
    }
}

}  // namespace runner
}  // namespace daemon_runner
