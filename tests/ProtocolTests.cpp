// JSON envelope decoding and snapshot encoding.
#undef NDEBUG
#include <cassert>
#include <string>

#include <nlohmann/json.hpp>

#include "../engine/net/UdpSocket.h"
#include "../game/Simulation.h"
#include "../game/net/NetMessages.h"

using namespace Game;
using namespace Game::Net;
using Engine::Gameplay::Cell;
using nlohmann::json;

int main() {
    {
        for (MessageType type : {MessageType::JoinRoom, MessageType::LeaveRoom, MessageType::PlaceTower,
                                 MessageType::RemoveTower, MessageType::SpawnEnemy, MessageType::ClearAll,
                                 MessageType::StartWave, MessageType::PauseGame, MessageType::Ping}) {
            auto parsed = parseMessageType(toString(type));
            assert(parsed && *parsed == type);
        }
        assert(toString(MessageType::PlaceTower) == "place_tower");
        assert(!parseMessageType("PLACE_TOWER"));
    }
    {
        assert(!decodeEnvelope("not json").ok);
        assert(!decodeEnvelope("").ok);
        assert(!decodeEnvelope("[1,2]").ok);
        assert(!decodeEnvelope(R"({"room_id":"r"})").ok);
        assert(!decodeEnvelope(R"({"type":7})").ok);
        assert(!decodeEnvelope(R"({"type":"fly_away"})").ok);
        assert(!decodeEnvelope(R"({"type":"join_room","room_id":5})").ok);
        assert(!decodeEnvelope(R"({"type":"join_room","room_id":"r","payload":[1]})").ok);

        DecodeResult join = decodeEnvelope(R"({"type":"join_room","room_id":"r1"})");
        assert(join.ok);
        assert(join.envelope.type == MessageType::JoinRoom);
        assert(join.envelope.roomId == "r1");
        assert(join.envelope.payload.is_object() && join.envelope.payload.empty());

        DecodeResult leave = decodeEnvelope(R"({"type":"leave_room"})");
        assert(leave.ok && leave.envelope.roomId.empty());
    }
    {
        PlaceTowerMsg msg;
        assert(msg.deserialize(json::parse(R"({"x":3.4,"y":4,"tower_type":"sniper"})")));
        assert(msg.cell == (Cell{3, 4}));
        assert(msg.towerType == TowerType::Sniper);
        assert(!msg.deserialize(json::parse(R"({"x":3,"y":4,"tower_type":"laser"})")));
        assert(!msg.deserialize(json::parse(R"({"x":3,"tower_type":"basic"})")));
        assert(!msg.deserialize(json::parse(R"({"x":"3","y":4,"tower_type":"basic"})")));

        RemoveTowerMsg remove;
        assert(remove.deserialize(json::parse(R"({"x":-1,"y":2})")));
        assert(remove.cell == (Cell{-1, 2}));
    }
    {
        SpawnEnemyMsg msg;
        assert(msg.deserialize(json::parse(R"({"enemy_type":"boss"})")));
        assert(msg.enemyType == EnemyType::Boss && !msg.path);
        assert(msg.deserialize(json::parse(R"({"enemy_type":"fast","path":[{"x":0,"y":7},{"x":1,"y":7}]})")));
        assert(msg.path && msg.path->size() == 2);
        assert((*msg.path)[1] == (Engine::Vec2{1.0f, 7.0f}));
        assert(!msg.deserialize(json::parse(R"({"enemy_type":"fast","path":[{"x":0}]})")));
        assert(!msg.deserialize(json::parse(R"({"enemy_type":"fast","path":"0,7"})")));
        assert(!msg.deserialize(json::parse(R"({"enemy_type":"dragon"})")));

        PauseGameMsg pause;
        assert(pause.deserialize(json::object()) && !pause.paused);
        assert(pause.deserialize(json::parse(R"({"paused":true})")) && pause.paused && *pause.paused);
        assert(!pause.deserialize(json::parse(R"({"paused":"yes"})")));
    }
    {
        Simulation sim("r9");
        sim.addMember("127.0.0.1:5000");
        assert(sim.placeTower(Cell{10, 6}, TowerType::Basic).ok);
        assert(sim.spawnEnemy(EnemyType::Tank).ok);

        const std::string encoded = encodeGameState(sim.state());
        json j = json::parse(encoded);
        assert(j["type"] == "game_state");
        assert(j["room_id"] == "r9");
        const json& s = j["payload"]["state"];
        assert(s["room_id"] == "r9");
        assert(s["players"].size() == 1);
        assert(s["gold"] == 200 && s["health"] == 100 && s["wave"] == 1);
        assert(s["paused"] == false);
        assert(s["spawn_point"]["x"] == 0 && s["spawn_point"]["y"] == 7);
        assert(s["goal_point"]["x"] == 19);
        for (const char* key : {"towers", "enemies", "projectiles", "muzzle_flashes", "explosions", "game_time"}) {
            assert(s.contains(key));
        }

        const json& tower = s["towers"][0];
        assert(tower["id"] == 1);
        assert(tower["tower_type"] == "basic");
        assert(tower["position"]["x"] == 10.0 && tower["position"]["y"] == 6.0);
        assert(tower["level"] == 1);
        assert(tower["fire_rate"] == 1.0);
        assert(!tower.contains("current_target"));

        const json& enemy = s["enemies"][0];
        assert(enemy["enemy_type"] == "tank");
        assert(enemy["health"] == 300.0 && enemy["max_health"] == 300.0);
        assert(!enemy.contains("path"));
        assert(enemy["path_index"] == 0);
        assert(enemy["next_waypoint"]["x"] == 0.0 && enemy["next_waypoint"]["y"] == 7.0);
        // The spawn reply carries the whole route.
        assert(toJson(sim.state().enemies[0], true)["path"].size() == 20);
        assert(enemy["trapped"] == false);

        // Snapshots are total: encoding the same state twice is identical.
        assert(encodeGameState(sim.state()) == encoded);
    }
    {
        // A crowded room still fits in one datagram.
        Simulation sim("crowd");
        assert(sim.placeTower(Cell{5, 7}, TowerType::Basic).ok);
        for (int i = 0; i < 200; ++i) {
            assert(sim.spawnEnemy(EnemyType::Basic).ok);
        }
        Engine::TimeStep step{};
        for (int i = 0; i < 30; ++i) {
            step = Engine::advance(step, 1.0 / 60.0);
            sim.tick(step);
        }
        assert(sim.state().enemies.size() == 200);
        assert(encodeGameState(sim.state()).size() < Engine::Net::kMaxDatagramBytes);
    }
    {
        Tower t = makeTower(3, Cell{1, 1}, TowerType::Slow);
        t.currentTarget = 12;
        assert(toJson(t)["current_target"] == 12);

        Effect flash;
        flash.id = 1;
        flash.duration = 0.1f;
        assert(!toJson(flash, false).contains("radius"));
        assert(toJson(flash, true).contains("radius"));

        Projectile p;
        p.targetId = 4;
        p.towerId = 2;
        json pj = toJson(p);
        assert(pj["target_id"] == 4 && pj["tower_id"] == 2);
    }
    {
        json err = json::parse(encodeError("r1", SimError::CellOccupied, "cell (1,1) already holds a tower"));
        assert(err["type"] == "error");
        assert(err["room_id"] == "r1");
        assert(err["payload"]["code"] == "CellOccupied");
        assert(err["payload"]["message"] == "cell (1,1) already holds a tower");

        json bare = json::parse(encodeMessage("start_wave", "", json{{"wave", 1}}));
        assert(!bare.contains("room_id"));
        assert(bare["payload"]["wave"] == 1);
    }
    return 0;
}
