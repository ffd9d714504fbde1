#include "NetTransport.h"

#include <chrono>

#include "../core/Logger.h"

namespace Engine::Net {

NetTransport::NetTransport(std::size_t inboxCapacity) : inbox_(inboxCapacity, DropPolicy::DropOldest) {}

NetTransport::~NetTransport() { stop(); }

bool NetTransport::start(uint16_t listenPort) {
    stop();
    if (!socket_.open(listenPort)) {
        return false;
    }
    running_ = true;
    thread_ = std::thread(&NetTransport::recvLoop, this);
    Engine::logInfo("UDP transport listening on port " + std::to_string(socket_.localPort()));
    return true;
}

void NetTransport::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    socket_.close();
    inbox_.clear();
}

bool NetTransport::send(const NetAddress& to, std::string_view text) {
    return send(to, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool NetTransport::send(const NetAddress& to, const uint8_t* data, std::size_t len) {
    if (!running_) return false;
    return socket_.send(to, data, len);
}

void NetTransport::poll(std::vector<NetPacket>& out, std::size_t maxPackets) { inbox_.drain(out, maxPackets); }

void NetTransport::recvLoop() {
    std::vector<uint8_t> buffer(kMaxDatagramBytes);
    while (running_) {
        NetAddress from{};
        int read = socket_.receive(from, buffer.data(), buffer.size());
        if (read > 0) {
            NetPacket pkt;
            pkt.from = from;
            pkt.timestamp = std::chrono::steady_clock::now();
            pkt.payload.assign(buffer.begin(), buffer.begin() + read);
            if (inbox_.push(std::move(pkt)) != PushResult::Accepted) {
                Engine::logDebug("Inbound queue full; dropped oldest datagram");
            }
        } else {
            if (read < 0) {
                // Transient on unconnected sockets (e.g. ICMP port unreachable from a departed peer).
                Engine::logDebug("UDP receive error; retrying");
            }
            // Sleep briefly to avoid busy spin when no data.
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

}  // namespace Engine::Net
