#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace wiz_scan {
namespace protocol {

// One request datagram, at most one reply datagram.
// Throws TimeoutError when nothing arrives within `timeout`, NetworkError when
// the send/receive fails, FatalError when no endpoint could be created.
class Transport {
public:
    virtual ~Transport() = default;
    virtual std::string exchange(const std::string& address, uint16_t port,
                                 const std::string& payload,
                                 std::chrono::milliseconds timeout) = 0;
};

}
}
