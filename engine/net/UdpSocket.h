// Cross-platform non-blocking UDP socket used by the server transport.
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "NetAddress.h"

namespace Engine::Net {

// Largest payload a single IPv4 UDP datagram can carry.
constexpr std::size_t kMaxDatagramBytes = 65507;

class UdpSocket {
public:
    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // Port 0 binds an ephemeral port; localPort() reports the result.
    bool open(uint16_t port);
    void close();
    uint16_t localPort() const { return localPort_; }

    bool send(const NetAddress& to, const uint8_t* data, std::size_t len);
    // Returns bytes read, 0 for no data, -1 on fatal error.
    int receive(NetAddress& from, uint8_t* buffer, std::size_t maxLen);

private:
    int fd_{-1};
    bool wsaInit_{false};
    uint16_t localPort_{0};
};

}  // namespace Engine::Net
