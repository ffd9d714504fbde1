// JSON envelope and message definitions for client <-> server traffic.
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../../engine/gameplay/GridMap.h"
#include "../../engine/gameplay/PathPlanner.h"
#include "../Definitions.h"
#include "../RoomState.h"
#include "../SimError.h"

namespace Game::Net {

enum class MessageType {
    JoinRoom,
    LeaveRoom,
    PlaceTower,
    RemoveTower,
    SpawnEnemy,
    ClearAll,
    StartWave,
    PauseGame,
    Ping  // keepalive for viewers that only watch
};

std::optional<MessageType> parseMessageType(std::string_view name);
std::string_view toString(MessageType type);

// Outbound message type names.
inline constexpr std::string_view kGameStateType = "game_state";
inline constexpr std::string_view kErrorType = "error";
inline constexpr std::string_view kTowerPlacedType = "tower_placed";
inline constexpr std::string_view kTowerRemovedType = "tower_removed";
inline constexpr std::string_view kEnemySpawnedType = "enemy_spawned";

struct Envelope {
    MessageType type{MessageType::JoinRoom};
    std::string roomId;  // empty when absent
    nlohmann::json payload = nlohmann::json::object();
};

struct DecodeResult {
    bool ok{false};
    Envelope envelope{};
    std::string error;  // reason, for the log line
};

// Parses `{type, room_id?, payload?}`. Never throws.
DecodeResult decodeEnvelope(std::string_view text);

struct PlaceTowerMsg {
    Engine::Gameplay::Cell cell{};
    TowerType towerType{TowerType::Basic};

    bool deserialize(const nlohmann::json& payload);
};

struct RemoveTowerMsg {
    Engine::Gameplay::Cell cell{};

    bool deserialize(const nlohmann::json& payload);
};

struct SpawnEnemyMsg {
    EnemyType enemyType{EnemyType::Basic};
    std::optional<Engine::Gameplay::Route> path{};

    bool deserialize(const nlohmann::json& payload);
};

struct PauseGameMsg {
    std::optional<bool> paused{};  // absent = toggle

    bool deserialize(const nlohmann::json& payload);
};

nlohmann::json toJson(const Engine::Vec2& position);
nlohmann::json toJson(const Engine::Gameplay::Cell& cell);
nlohmann::json toJson(const Tower& tower);
// Snapshots carry only the next waypoint so a room's state fits one
// datagram; the full route goes out once, in the enemy_spawned reply.
nlohmann::json toJson(const Enemy& enemy, bool withPath);
nlohmann::json toJson(const Projectile& projectile);
nlohmann::json toJson(const Effect& effect, bool withRadius);
nlohmann::json toJson(const RoomState& state);

// Serialized `{type, room_id, payload}`; room_id omitted when empty.
std::string encodeMessage(std::string_view type, const std::string& roomId, const nlohmann::json& payload);
std::string encodeGameState(const RoomState& state);
std::string encodeError(const std::string& roomId, SimError error, std::string_view message);

}  // namespace Game::Net
