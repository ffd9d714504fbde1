// Datagram endpoint; also the identity of a remote subscriber.
#pragma once

#include <cstdint>
#include <string>

namespace Engine::Net {

struct NetAddress {
    std::string ip{"127.0.0.1"};
    uint16_t port{37015};

    // "ip:port", stable across packets from the same socket.
    std::string key() const { return ip + ":" + std::to_string(port); }
};

inline bool operator==(const NetAddress& a, const NetAddress& b) { return a.port == b.port && a.ip == b.ip; }
inline bool operator!=(const NetAddress& a, const NetAddress& b) { return !(a == b); }

}  // namespace Engine::Net
