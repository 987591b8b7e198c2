#pragma once

#include <cstdint>

namespace daemon_runner {
namespace util {

// Find a free local port in the dynamic range [49152, 65535) by trying to
// bind a UDP socket on 127.0.0.1 to random candidates. Used to pick RPC and
// P2P ports for test daemons.
uint16_t find_free_port();

}  // namespace util
}  // namespace daemon_runner
