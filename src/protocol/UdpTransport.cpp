#include "UdpTransport.h"
#include "../core/Errors.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace wiz_scan {
namespace protocol {

UdpSocket::UdpSocket(){
    fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if(fd_ < 0) throw FatalError(std::string("socket() failed: ") + std::strerror(errno));
}

UdpSocket::~UdpSocket(){
    if(fd_ >= 0) ::close(fd_);
}

static long long remaining_ms(std::chrono::steady_clock::time_point deadline){
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    return left < 0 ? 0 : left;
}

std::string UdpTransport::exchange(const std::string& address, uint16_t port,
                                   const std::string& payload,
                                   std::chrono::milliseconds timeout){
    struct sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port);
    if(inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1)
        throw NetworkError("Invalid destination address: " + address);

    UdpSocket sock;
    // connect() so the kernel filters replies to this peer and reports ICMP errors (ECONNREFUSED)
    if(::connect(sock.fd(), reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest)) != 0)
        throw NetworkError("connect " + address + ": " + std::strerror(errno));

    ssize_t sent;
    do {
        sent = ::send(sock.fd(), payload.data(), payload.size(), 0);
    } while(sent < 0 && errno == EINTR);
    if(sent < 0) throw NetworkError("send " + address + ": " + std::strerror(errno));

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<char> buf(kMaxDatagram);
    while(true){
        struct pollfd pfd{};
        pfd.fd = sock.fd();
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining_ms(deadline)));
        if(rc < 0){
            if(errno == EINTR) continue;
            throw NetworkError(std::string("poll: ") + std::strerror(errno));
        }
        if(rc == 0) throw TimeoutError("Request timeout: " + address);

        ssize_t n = ::recv(sock.fd(), buf.data(), buf.size(), 0);
        if(n < 0){
            if(errno == EINTR || errno == EAGAIN) continue;
            throw NetworkError("recv " + address + ": " + std::strerror(errno));
        }
        return std::string(buf.data(), static_cast<size_t>(n));
    }
}

}
}
