#include "GameServer.h"

#include <string>
#include <thread>
#include <vector>

#include "../../engine/core/Logger.h"

namespace Game::Net {

namespace {
RegistryConfig registryConfig(const ServerConfig& cfg) {
    RegistryConfig out;
    out.room.tickRate = cfg.tickRate;
    out.room.commandCapacity = cfg.roomCommandCapacity;
    out.autoStartRooms = cfg.autoStartRooms;
    return out;
}

GatewayConfig gatewayConfig(const ServerConfig& cfg) {
    GatewayConfig out;
    out.subscriberQueueCapacity = cfg.subscriberQueueCapacity;
    out.subscriberTimeoutSeconds = cfg.subscriberTimeoutSeconds;
    return out;
}
}  // namespace

GameServer::GameServer(ServerConfig config)
    : config_(config),
      channel_(config.broadcastQueueCapacity),
      rooms_(channel_, registryConfig(config)),
      gateway_(
          rooms_, channel_,
          [this](const Engine::Net::NetAddress& to, std::string_view payload) { return transport_.send(to, payload); },
          gatewayConfig(config)) {}

GameServer::~GameServer() { stop(); }

bool GameServer::start() {
    if (!transport_.start(config_.port)) {
        Engine::logError("GameServer: failed to bind UDP port " + std::to_string(config_.port));
        return false;
    }
    started_ = true;
    stopRequested_ = false;
    startedAt_ = std::chrono::steady_clock::now();
    Engine::logInfo("GameServer listening on UDP port " + std::to_string(transport_.boundPort()));
    return true;
}

void GameServer::run() {
    std::vector<Engine::Net::NetPacket> packets;
    while (!stopRequested_ && transport_.isRunning()) {
        packets.clear();
        transport_.poll(packets, 64);
        const double t = now();
        for (const auto& pkt : packets) {
            gateway_.handlePacket(pkt, t);
        }
        gateway_.pump();
        gateway_.expireIdle(t);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void GameServer::stop() {
    if (!started_) return;
    started_ = false;
    rooms_.shutdown();
    transport_.stop();
    Engine::logInfo("GameServer stopped");
}

double GameServer::now() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - startedAt_).count();
}

}  // namespace Game::Net
