// Inbound datagram as queued by NetTransport for the server thread.
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "NetAddress.h"

namespace Engine::Net {

struct NetPacket {
    NetAddress from{};
    std::vector<uint8_t> payload{};
    std::chrono::steady_clock::time_point timestamp{};

    std::string text() const { return std::string(payload.begin(), payload.end()); }
};

}  // namespace Engine::Net
