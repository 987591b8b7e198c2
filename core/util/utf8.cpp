#include "utf8.hpp"

#include <cstdint>

namespace daemon_runner {
namespace util {

bool is_valid_utf8(const std::string &data) {
    const auto *s = reinterpret_cast<const uint8_t *>(data.data());
    const size_t len = data.size();
    size_t i = 0;

    while (i < len) {
        uint8_t c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t extra;
        uint32_t cp;
        if (c >= 0xC2 && c <= 0xDF) {
            extra = 1;
            cp = c & 0x1F;
        } else if (c >= 0xE0 && c <= 0xEF) {
            extra = 2;
            cp = c & 0x0F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;  // Continuation byte, overlong 2-byte lead (C0/C1) or > F4
        }

        if (i + extra >= len) {
            return false;  // Truncated sequence
        }
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cc = s[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if ((extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) {
            return false;  // Overlong
        }
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            return false;  // UTF-16 surrogate
        }
        if (cp > 0x10FFFF) {
            return false;
        }

        i += extra + 1;
    }

    return true;
}

}  // namespace util
}  // namespace daemon_runner
