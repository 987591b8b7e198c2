#pragma once

#include <string>

namespace daemon_runner {
namespace util {

// Strict UTF-8 check: rejects overlong encodings, surrogates and code points above U+10FFFF
bool is_valid_utf8(const std::string &data);

}  // namespace util
}  // namespace daemon_runner
