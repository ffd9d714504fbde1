#include "Gateway.h"

#include <utility>
#include <vector>

#include "../../engine/core/Logger.h"

namespace Game::Net {

using Engine::Net::NetAddress;
using nlohmann::json;

namespace {
constexpr std::uint64_t kSaturationLogInterval = 300;

std::string cellText(const Engine::Gameplay::Cell& cell) {
    return "(" + std::to_string(cell.x) + "," + std::to_string(cell.y) + ")";
}

std::string describe(SimError error, const Engine::Gameplay::Cell& cell) {
    switch (error) {
        case SimError::OutOfBounds: return "cell " + cellText(cell) + " is outside the grid";
        case SimError::CellOccupied: return "cell " + cellText(cell) + " already holds a tower";
        case SimError::DefenderNotFound: return "no tower at " + cellText(cell);
        default: return std::string(toString(error));
    }
}

std::string describeSpawn(SimError error) {
    switch (error) {
        case SimError::NoRouteAvailable: return "no route from spawn to goal";
        case SimError::MalformedMessage: return "path is empty or leaves the grid";
        default: return std::string(toString(error));
    }
}
}  // namespace

Gateway::Gateway(RoomRegistry& rooms, BroadcastChannel& channel, SendFn send, GatewayConfig config)
    : rooms_(rooms), channel_(channel), send_(std::move(send)), config_(config) {}

void Gateway::handlePacket(const Engine::Net::NetPacket& packet, double now) {
    const std::string text = packet.text();
    handleMessage(packet.from, text, now);
}

void Gateway::handleMessage(const NetAddress& from, std::string_view text, double now) {
    auto it = subscribers_.find(from.key());
    if (it != subscribers_.end()) {
        it->second->lastHeard = now;
    }

    DecodeResult decoded = decodeEnvelope(text);
    if (!decoded.ok) {
        Engine::logWarn("Gateway: " + std::string(toString(SimError::MalformedMessage)) + " from " + from.key() + ": " +
                        decoded.error);
        return;
    }
    const Envelope& env = decoded.envelope;

    switch (env.type) {
        case MessageType::JoinRoom: handleJoin(from, env, now); break;
        case MessageType::LeaveRoom: handleLeave(from); break;
        case MessageType::Ping:
            // lastHeard was refreshed above; nothing else to do.
            break;
        default: handleRoomCommand(from, env); break;
    }
}

void Gateway::handleJoin(const NetAddress& from, const Envelope& env, double now) {
    if (env.roomId.empty()) {
        Engine::logWarn("Gateway: " + std::string(toString(SimError::MalformedMessage)) + " from " + from.key() +
                        ": join_room without room_id");
        return;
    }
    auto room = rooms_.createRoom(env.roomId);
    subscribe(from, env.roomId, now);

    const std::string clientId = from.key();
    Room& target = *room;
    const bool queued = target.post([&target, from, clientId](Simulation& sim) {
        const bool added = sim.addMember(clientId);
        target.publishTo(from, encodeMessage(toString(MessageType::JoinRoom), target.id(),
                                             json{{"status", "joined"}, {"clientId", clientId}}));
        target.publishTo(from, encodeGameState(sim.state()));
        return added;
    });
    if (queued) {
        Engine::logInfo("Gateway: " + clientId + " joined room " + env.roomId);
    }
}

void Gateway::handleLeave(const NetAddress& from) {
    const std::string key = from.key();
    if (subscribers_.find(key) == subscribers_.end()) {
        Engine::logWarn("Gateway: leave_room from " + key + " which is not in a room");
        return;
    }
    unsubscribe(key, "left");
}

void Gateway::handleRoomCommand(const NetAddress& from, const Envelope& env) {
    const std::string typeName(toString(env.type));
    if (env.roomId.empty()) {
        Engine::logWarn("Gateway: " + std::string(toString(SimError::MalformedMessage)) + " from " + from.key() + ": " +
                        typeName + " without room_id");
        return;
    }
    auto room = rooms_.getRoom(env.roomId);
    if (!room) {
        Engine::logWarn("Gateway: " + std::string(toString(SimError::RoomNotFound)) + " for " + typeName + " from " +
                        from.key() + ": " + env.roomId);
        return;
    }
    Room& target = *room;
    const std::string roomId = env.roomId;
    Room::Command command;

    switch (env.type) {
        case MessageType::PlaceTower: {
            PlaceTowerMsg msg;
            if (!msg.deserialize(env.payload)) break;
            command = [&target, from, roomId, msg](Simulation& sim) {
                const PlaceTowerResult result = sim.placeTower(msg.cell, msg.towerType);
                if (result.ok) {
                    target.publishTo(from, encodeMessage(kTowerPlacedType, roomId, json{{"tower", toJson(result.tower)}}));
                } else {
                    target.publishTo(from, encodeError(roomId, result.error, describe(result.error, msg.cell)));
                }
                return result.ok;
            };
            break;
        }
        case MessageType::RemoveTower: {
            RemoveTowerMsg msg;
            if (!msg.deserialize(env.payload)) break;
            command = [&target, from, roomId, msg](Simulation& sim) {
                const RemoveTowerResult result = sim.removeTower(msg.cell);
                if (result.ok) {
                    target.publishTo(from, encodeMessage(kTowerRemovedType, roomId, json{{"tower", toJson(result.tower)}}));
                } else {
                    target.publishTo(from, encodeError(roomId, result.error, describe(result.error, msg.cell)));
                }
                return result.ok;
            };
            break;
        }
        case MessageType::SpawnEnemy: {
            SpawnEnemyMsg msg;
            if (!msg.deserialize(env.payload)) break;
            command = [&target, from, roomId, msg](Simulation& sim) {
                const SpawnEnemyResult result = sim.spawnEnemy(msg.enemyType, msg.path);
                if (result.ok) {
                    target.publishTo(from, encodeMessage(kEnemySpawnedType, roomId, json{{"enemy", toJson(result.enemy, true)}}));
                } else if (result.error == SimError::MalformedMessage) {
                    Engine::logWarn("Gateway: " + std::string(toString(result.error)) + " from " + from.key() + ": " +
                                    describeSpawn(result.error));
                } else {
                    target.publishTo(from, encodeError(roomId, result.error, describeSpawn(result.error)));
                }
                return result.ok;
            };
            break;
        }
        case MessageType::ClearAll:
            command = [](Simulation& sim) {
                sim.clearAll();
                return true;
            };
            break;
        case MessageType::StartWave:
            command = [&target, from, roomId](Simulation& sim) {
                target.publishTo(from, encodeMessage(toString(MessageType::StartWave), roomId,
                                                     json{{"action", "wave_started"}, {"wave", sim.state().wave}}));
                return false;
            };
            break;
        case MessageType::PauseGame: {
            PauseGameMsg msg;
            if (!msg.deserialize(env.payload)) break;
            command = [msg](Simulation& sim) {
                if (msg.paused) {
                    sim.setPaused(*msg.paused);
                } else {
                    sim.togglePaused();
                }
                return true;
            };
            break;
        }
        case MessageType::JoinRoom:
        case MessageType::LeaveRoom:
        case MessageType::Ping:
            break;
    }

    if (!command) {
        Engine::logWarn("Gateway: " + std::string(toString(SimError::MalformedMessage)) + " from " + from.key() +
                        ": bad payload for " + typeName);
        return;
    }
    target.post(std::move(command));
}

void Gateway::subscribe(const NetAddress& addr, const std::string& roomId, double now) {
    const std::string key = addr.key();
    auto it = subscribers_.find(key);
    if (it != subscribers_.end()) {
        if (it->second->roomId == roomId) {
            it->second->lastHeard = now;
            return;
        }
        // Switching rooms: leave the old one first.
        unsubscribe(key, "switched rooms");
    }
    subscribers_.emplace(key, std::make_unique<Subscriber>(addr, roomId, now, config_.subscriberQueueCapacity));
}

void Gateway::unsubscribe(const std::string& key, std::string_view reason) {
    auto it = subscribers_.find(key);
    if (it == subscribers_.end()) return;
    const std::string roomId = it->second->roomId;
    subscribers_.erase(it);
    Engine::logInfo("Gateway: " + key + " unsubscribed from room " + roomId + " (" + std::string(reason) + ")");

    // The room outlives its viewers; only an explicit teardown deletes it.
    rooms_.removeMember(roomId, key);
}

std::optional<std::string> Gateway::roomOf(const NetAddress& addr) const {
    auto it = subscribers_.find(addr.key());
    if (it == subscribers_.end()) return std::nullopt;
    return it->second->roomId;
}

void Gateway::enqueue(Subscriber& sub, std::string payload) {
    if (sub.outbox.push(std::move(payload)) == Engine::PushResult::Accepted) return;
    ++droppedFrames_;
    const auto dropped = sub.outbox.droppedCount();
    if (dropped % kSaturationLogInterval == 1) {
        Engine::logWarn("Gateway: subscriber queue " + std::string(toString(SimError::ChannelSaturated)) + " for " +
                        sub.addr.key() + " (" + std::to_string(dropped) + " dropped)");
    }
}

void Gateway::route(Frame& frame) {
    if (frame.target) {
        auto it = subscribers_.find(frame.target->key());
        if (it != subscribers_.end()) {
            enqueue(*it->second, std::move(frame.payload));
        } else if (!send_(*frame.target, frame.payload)) {
            Engine::logError("Gateway: reply to " + frame.target->key() + " failed");
        }
        return;
    }
    for (auto& [key, sub] : subscribers_) {
        (void)key;
        if (sub->roomId == frame.roomId) {
            enqueue(*sub, frame.payload);
        }
    }
}

std::size_t Gateway::pump() {
    std::vector<Frame> frames;
    channel_.drain(frames, config_.maxFramesPerPump);
    for (auto& frame : frames) {
        route(frame);
    }

    std::size_t sent = 0;
    std::vector<std::string> failed;
    for (auto& [key, sub] : subscribers_) {
        std::string payload;
        while (sub->outbox.tryPop(payload)) {
            if (payload.size() > config_.maxPayloadBytes) {
                Engine::logError("Gateway: dropped " + std::to_string(payload.size()) + " byte frame for " + key +
                                 "; exceeds datagram limit");
                continue;
            }
            if (!send_(sub->addr, payload)) {
                Engine::logError("Gateway: send to " + key + " failed");
                failed.push_back(key);
                break;
            }
            ++sent;
        }
    }
    for (const auto& key : failed) {
        unsubscribe(key, "send failed");
    }
    return sent;
}

void Gateway::expireIdle(double now) {
    std::vector<std::string> idle;
    for (const auto& [key, sub] : subscribers_) {
        if (now - sub->lastHeard > config_.subscriberTimeoutSeconds) {
            idle.push_back(key);
        }
    }
    for (const auto& key : idle) {
        unsubscribe(key, "timed out");
    }
}

}  // namespace Game::Net
