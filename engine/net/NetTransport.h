// Background UDP transport: a receive thread fills a bounded inbox that the
// server thread polls; sends go straight to the socket.
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <thread>
#include <vector>

#include "../core/BoundedQueue.h"
#include "NetAddress.h"
#include "NetPacket.h"
#include "UdpSocket.h"

namespace Engine::Net {

class NetTransport {
public:
    explicit NetTransport(std::size_t inboxCapacity = 256);
    ~NetTransport();

    NetTransport(const NetTransport&) = delete;
    NetTransport& operator=(const NetTransport&) = delete;

    // Bind and start receive thread.
    bool start(uint16_t listenPort);
    void stop();
    bool isRunning() const { return running_; }

    bool send(const NetAddress& to, std::string_view text);
    bool send(const NetAddress& to, const uint8_t* data, std::size_t len);

    // Move up to maxPackets from the inbox into out vector.
    void poll(std::vector<NetPacket>& out, std::size_t maxPackets = 64);
    uint16_t boundPort() const { return socket_.localPort(); }

private:
    void recvLoop();

    UdpSocket socket_{};
    std::thread thread_{};
    std::atomic<bool> running_{false};
    BoundedQueue<NetPacket> inbox_;
};

}  // namespace Engine::Net
