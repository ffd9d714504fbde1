// Protocol front door: decodes inbound envelopes, routes them to rooms, and
// fans room frames out to subscribers through bounded per-subscriber queues.
//
// Single-threaded: packet handling, pump and expiry all run on the server
// thread. Rooms only reach it through the BroadcastChannel.
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "../../engine/core/BoundedQueue.h"
#include "../../engine/net/NetAddress.h"
#include "../../engine/net/NetPacket.h"
#include "../room/RoomRegistry.h"
#include "BroadcastChannel.h"
#include "NetMessages.h"

namespace Game::Net {

struct GatewayConfig {
    std::size_t subscriberQueueCapacity{32};
    double subscriberTimeoutSeconds{30.0};
    std::size_t maxFramesPerPump{1024};
    std::size_t maxPayloadBytes{65507};  // one UDP datagram
};

struct Subscriber {
    Subscriber(Engine::Net::NetAddress address, std::string room, double now, std::size_t capacity)
        : addr(std::move(address)), roomId(std::move(room)), lastHeard(now),
          outbox(capacity, Engine::DropPolicy::DropOldest) {}

    Engine::Net::NetAddress addr;
    std::string roomId;
    double lastHeard{0.0};
    Engine::BoundedQueue<std::string> outbox;
};

class Gateway {
public:
    using SendFn = std::function<bool(const Engine::Net::NetAddress&, std::string_view)>;

    Gateway(RoomRegistry& rooms, BroadcastChannel& channel, SendFn send, GatewayConfig config = {});

    void handlePacket(const Engine::Net::NetPacket& packet, double now);
    void handleMessage(const Engine::Net::NetAddress& from, std::string_view text, double now);

    // Routes queued frames into subscriber queues and flushes them.
    // Returns the number of datagrams sent.
    std::size_t pump();

    // Drops subscribers idle for longer than the configured timeout.
    void expireIdle(double now);

    std::size_t subscriberCount() const { return subscribers_.size(); }
    std::optional<std::string> roomOf(const Engine::Net::NetAddress& addr) const;
    std::uint64_t droppedFrames() const { return droppedFrames_; }

private:
    void handleJoin(const Engine::Net::NetAddress& from, const Envelope& env, double now);
    void handleLeave(const Engine::Net::NetAddress& from);
    void handleRoomCommand(const Engine::Net::NetAddress& from, const Envelope& env);

    void subscribe(const Engine::Net::NetAddress& addr, const std::string& roomId, double now);
    void unsubscribe(const std::string& key, std::string_view reason);

    void route(Frame& frame);
    void enqueue(Subscriber& sub, std::string payload);

    RoomRegistry& rooms_;
    BroadcastChannel& channel_;
    SendFn send_;
    GatewayConfig config_;
    std::unordered_map<std::string, std::unique_ptr<Subscriber>> subscribers_{};
    std::uint64_t droppedFrames_{0};
};

}  // namespace Game::Net
