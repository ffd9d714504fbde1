#include "NetMessages.h"

#include <cmath>
#include <utility>

namespace Game::Net {

using nlohmann::json;

namespace {
struct TypeName {
    MessageType type;
    std::string_view name;
};

constexpr TypeName kTypeNames[] = {
    {MessageType::JoinRoom, "join_room"},     {MessageType::LeaveRoom, "leave_room"},
    {MessageType::PlaceTower, "place_tower"}, {MessageType::RemoveTower, "remove_tower"},
    {MessageType::SpawnEnemy, "spawn_enemy"}, {MessageType::ClearAll, "clear_all"},
    {MessageType::StartWave, "start_wave"},   {MessageType::PauseGame, "pause_game"},
    {MessageType::Ping, "ping"},
};

bool readNumber(const json& obj, const char* key, double& out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return false;
    out = it->get<double>();
    return std::isfinite(out);
}

bool readString(const json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

bool readCell(const json& obj, Engine::Gameplay::Cell& out) {
    double x{};
    double y{};
    if (!readNumber(obj, "x", x) || !readNumber(obj, "y", y)) return false;
    out = Engine::Gameplay::Cell{static_cast<int>(std::lround(x)), static_cast<int>(std::lround(y))};
    return true;
}
}  // namespace

std::optional<MessageType> parseMessageType(std::string_view name) {
    for (const auto& entry : kTypeNames) {
        if (entry.name == name) return entry.type;
    }
    return std::nullopt;
}

std::string_view toString(MessageType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

DecodeResult decodeEnvelope(std::string_view text) {
    DecodeResult result;
    json j;
    try {
        j = json::parse(text.begin(), text.end());
    } catch (const json::exception& ex) {
        result.error = std::string("invalid JSON: ") + ex.what();
        return result;
    }
    if (!j.is_object()) {
        result.error = "envelope is not an object";
        return result;
    }

    std::string typeName;
    if (!readString(j, "type", typeName)) {
        result.error = "missing string field 'type'";
        return result;
    }
    auto type = parseMessageType(typeName);
    if (!type) {
        result.error = "unknown message type '" + typeName + "'";
        return result;
    }
    result.envelope.type = *type;

    auto roomIt = j.find("room_id");
    if (roomIt != j.end() && !roomIt->is_null()) {
        if (!roomIt->is_string()) {
            result.error = "'room_id' must be a string";
            return result;
        }
        result.envelope.roomId = roomIt->get<std::string>();
    }

    auto payloadIt = j.find("payload");
    if (payloadIt != j.end() && !payloadIt->is_null()) {
        if (!payloadIt->is_object()) {
            result.error = "'payload' must be an object";
            return result;
        }
        result.envelope.payload = *payloadIt;
    }

    result.ok = true;
    return result;
}

bool PlaceTowerMsg::deserialize(const json& payload) {
    std::string typeName;
    if (!readCell(payload, cell) || !readString(payload, "tower_type", typeName)) return false;
    auto parsed = parseTowerType(typeName);
    if (!parsed) return false;
    towerType = *parsed;
    return true;
}

bool RemoveTowerMsg::deserialize(const json& payload) { return readCell(payload, cell); }

bool SpawnEnemyMsg::deserialize(const json& payload) {
    std::string typeName;
    if (!readString(payload, "enemy_type", typeName)) return false;
    auto parsed = parseEnemyType(typeName);
    if (!parsed) return false;
    enemyType = *parsed;

    path.reset();
    auto pathIt = payload.find("path");
    if (pathIt == payload.end() || pathIt->is_null()) {
        return true;
    }
    if (!pathIt->is_array()) return false;
    Engine::Gameplay::Route route;
    route.reserve(pathIt->size());
    for (const auto& point : *pathIt) {
        double x{};
        double y{};
        if (!point.is_object() || !readNumber(point, "x", x) || !readNumber(point, "y", y)) return false;
        route.emplace_back(static_cast<float>(x), static_cast<float>(y));
    }
    path = std::move(route);
    return true;
}

bool PauseGameMsg::deserialize(const json& payload) {
    paused.reset();
    auto it = payload.find("paused");
    if (it == payload.end() || it->is_null()) return true;
    if (!it->is_boolean()) return false;
    paused = it->get<bool>();
    return true;
}

json toJson(const Engine::Vec2& position) { return json{{"x", position.x}, {"y", position.y}}; }

json toJson(const Engine::Gameplay::Cell& cell) { return json{{"x", cell.x}, {"y", cell.y}}; }

json toJson(const Tower& tower) {
    json j;
    j["id"] = tower.id;
    j["position"] = toJson(tower.position());
    j["tower_type"] = std::string(toString(tower.type));
    j["level"] = tower.level;
    j["range"] = tower.range;
    j["damage"] = tower.damage;
    j["fire_rate"] = tower.fireRate;
    j["cooldown"] = tower.cooldown;
    j["rotation"] = tower.rotation;
    if (tower.currentTarget != 0) {
        j["current_target"] = tower.currentTarget;
    }
    return j;
}

json toJson(const Enemy& enemy, bool withPath) {
    json j;
    j["id"] = enemy.id;
    j["position"] = toJson(enemy.position);
    j["enemy_type"] = std::string(toString(enemy.type));
    j["health"] = enemy.health.currentHealth;
    j["max_health"] = enemy.health.maxHealth;
    j["speed"] = enemy.speed;
    if (withPath) {
        json path = json::array();
        for (const auto& waypoint : enemy.path) {
            path.push_back(toJson(waypoint));
        }
        j["path"] = std::move(path);
    }
    j["path_index"] = enemy.pathIndex;
    if (!enemy.routeExhausted()) {
        j["next_waypoint"] = toJson(enemy.path[enemy.pathIndex]);
    }
    j["trapped"] = enemy.trapped;
    return j;
}

json toJson(const Projectile& projectile) {
    return json{{"id", projectile.id},         {"position", toJson(projectile.position)},
                {"target_id", projectile.targetId}, {"speed", projectile.speed},
                {"damage", projectile.damage}, {"tower_id", projectile.towerId}};
}

json toJson(const Effect& effect, bool withRadius) {
    json j{{"id", effect.id}, {"position", toJson(effect.position)}, {"duration", effect.duration}};
    if (withRadius) {
        j["radius"] = effect.radius;
    }
    return j;
}

json toJson(const RoomState& state) {
    json towers = json::array();
    for (const auto& t : state.towers) towers.push_back(toJson(t));
    json enemies = json::array();
    for (const auto& e : state.enemies) enemies.push_back(toJson(e, false));
    json projectiles = json::array();
    for (const auto& p : state.projectiles) projectiles.push_back(toJson(p));
    json flashes = json::array();
    for (const auto& f : state.muzzleFlashes) flashes.push_back(toJson(f, false));
    json explosions = json::array();
    for (const auto& x : state.explosions) explosions.push_back(toJson(x, true));

    json j;
    j["room_id"] = state.roomId;
    j["players"] = state.players;
    j["towers"] = std::move(towers);
    j["enemies"] = std::move(enemies);
    j["projectiles"] = std::move(projectiles);
    j["muzzle_flashes"] = std::move(flashes);
    j["explosions"] = std::move(explosions);
    j["gold"] = state.gold;
    j["health"] = state.health;
    j["wave"] = state.wave;
    j["game_time"] = state.gameTime;
    j["paused"] = state.paused;
    j["spawn_point"] = toJson(state.spawn);
    j["goal_point"] = toJson(state.goal);
    return j;
}

std::string encodeMessage(std::string_view type, const std::string& roomId, const json& payload) {
    json j;
    j["type"] = std::string(type);
    if (!roomId.empty()) {
        j["room_id"] = roomId;
    }
    j["payload"] = payload;
    return j.dump();
}

std::string encodeGameState(const RoomState& state) {
    return encodeMessage(kGameStateType, state.roomId, json{{"state", toJson(state)}});
}

std::string encodeError(const std::string& roomId, SimError error, std::string_view message) {
    return encodeMessage(kErrorType, roomId, json{{"code", std::string(toString(error))}, {"message", std::string(message)}});
}

}  // namespace Game::Net
