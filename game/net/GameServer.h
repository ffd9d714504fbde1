// Process-level wiring: UDP transport, room registry and gateway.
#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include "../../engine/net/NetTransport.h"
#include "../room/RoomRegistry.h"
#include "BroadcastChannel.h"
#include "Gateway.h"
#include "ServerConfig.h"

namespace Game::Net {

class GameServer {
public:
    explicit GameServer(ServerConfig config);
    ~GameServer();

    GameServer(const GameServer&) = delete;
    GameServer& operator=(const GameServer&) = delete;

    // Binds the transport. False when the port cannot be bound.
    bool start();
    // Blocks until requestStop().
    void run();
    void requestStop() { stopRequested_ = true; }
    void stop();

    uint16_t boundPort() const { return transport_.boundPort(); }
    const ServerConfig& config() const { return config_; }

private:
    double now() const;

    ServerConfig config_;
    Engine::Net::NetTransport transport_;
    BroadcastChannel channel_;
    RoomRegistry rooms_;
    Gateway gateway_;
    std::chrono::steady_clock::time_point startedAt_{std::chrono::steady_clock::now()};
    std::atomic<bool> stopRequested_{false};
    bool started_{false};
};

}  // namespace Game::Net
