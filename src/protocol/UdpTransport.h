#pragma once
#include "Transport.h"

namespace wiz_scan {
namespace protocol {

// Owns a datagram socket for the lifetime of a single exchange.
class UdpSocket {
public:
    UdpSocket();
    ~UdpSocket();
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    int fd() const { return fd_; }
private:
    int fd_ = -1;
};

class UdpTransport : public Transport {
public:
    static constexpr size_t kMaxDatagram = 4096;

    std::string exchange(const std::string& address, uint16_t port,
                         const std::string& payload,
                         std::chrono::milliseconds timeout) override;
};

}
}
