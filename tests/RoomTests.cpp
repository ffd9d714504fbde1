// Room tick driver, command queue and registry.
#undef NDEBUG
#include <cassert>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "../game/room/Room.h"
#include "../game/room/RoomRegistry.h"

using namespace Game;
using Engine::Gameplay::Cell;

namespace {
constexpr double kDt = 1.0 / 60.0;

class RecordingSink : public SnapshotSink {
public:
    bool publish(Frame frame) override {
        std::scoped_lock lk(mutex_);
        frames_.push_back(std::move(frame));
        return true;
    }

    std::vector<Frame> take() {
        std::scoped_lock lk(mutex_);
        std::vector<Frame> out;
        out.swap(frames_);
        return out;
    }

    std::size_t count() const {
        std::scoped_lock lk(mutex_);
        return frames_.size();
    }

private:
    mutable std::mutex mutex_{};
    std::vector<Frame> frames_{};
};
}  // namespace

int main() {
    {
        // Idle step: one tick snapshot.
        RecordingSink sink;
        Room room("r1", sink);
        room.step(kDt);
        auto frames = sink.take();
        assert(frames.size() == 1);
        assert(frames[0].roomId == "r1");
        assert(!frames[0].target);
        auto j = nlohmann::json::parse(frames[0].payload);
        assert(j["type"] == "game_state");
        assert(j["room_id"] == "r1");
        assert(j["payload"]["state"]["game_time"].get<double>() > 0.0);
        assert(room.tickCount() == 1);
    }
    {
        // A mutating command adds an immediate snapshot before the tick one.
        RecordingSink sink;
        Room room("r1", sink);
        assert(room.post([](Simulation& sim) { return sim.placeTower(Cell{4, 4}, TowerType::Slow).ok; }));
        room.step(kDt);
        auto frames = sink.take();
        assert(frames.size() == 2);
        auto immediate = nlohmann::json::parse(frames[0].payload);
        assert(immediate["payload"]["state"]["towers"].size() == 1);
        assert(immediate["payload"]["state"]["game_time"].get<double>() == 0.0);
        assert(room.simulation().state().towers.size() == 1);

        // Non-mutating commands still run but add no extra snapshot.
        bool ran = false;
        room.post([&ran](Simulation&) {
            ran = true;
            return false;
        });
        room.step(kDt);
        assert(ran);
        assert(sink.take().size() == 1);
    }
    {
        // Targeted replies carry the address through to the sink.
        RecordingSink sink;
        Room room("r1", sink);
        Engine::Net::NetAddress who{"10.0.0.2", 4000};
        room.publishTo(who, "hello");
        auto frames = sink.take();
        assert(frames.size() == 1 && frames[0].target && *frames[0].target == who);
        assert(frames[0].payload == "hello");
    }
    {
        // A full command queue rejects immediately.
        RecordingSink sink;
        RoomConfig cfg;
        cfg.commandCapacity = 2;
        Room room("r1", sink, cfg);
        assert(room.post([](Simulation&) { return false; }));
        assert(room.post([](Simulation&) { return false; }));
        assert(!room.post([](Simulation&) { return false; }));
        assert(room.pendingCommands() == 2);
        room.step(kDt);
        assert(room.pendingCommands() == 0);
        assert(room.post([](Simulation&) { return false; }));
    }
    {
        // Paused rooms keep publishing.
        RecordingSink sink;
        Room room("r1", sink);
        room.post([](Simulation& sim) {
            sim.setPaused(true);
            return true;
        });
        room.step(kDt);
        room.step(kDt);
        auto frames = sink.take();
        assert(frames.size() == 3);
        auto last = nlohmann::json::parse(frames.back().payload);
        assert(last["payload"]["state"]["paused"] == true);
        assert(last["payload"]["state"]["game_time"].get<double>() == 0.0);
    }
    {
        // Driver thread ticks on its own and stops cleanly.
        RecordingSink sink;
        Room room("live", sink);
        room.start();
        assert(room.isRunning());
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        room.stop();
        assert(!room.isRunning());
        const auto ticks = room.tickCount();
        assert(ticks > 0);
        assert(sink.count() >= ticks);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(room.tickCount() == ticks);
    }
    {
        RecordingSink sink;
        RegistryConfig cfg;
        cfg.autoStartRooms = false;
        RoomRegistry registry(sink, cfg);
        auto a = registry.createRoom("alpha");
        auto again = registry.createRoom("alpha");
        assert(a && a == again);
        assert(!a->isRunning());
        registry.createRoom("beta");
        assert(registry.roomCount() == 2);
        auto ids = registry.roomIds();
        assert(ids.size() == 2 && ids[0] == "alpha" && ids[1] == "beta");

        assert(!registry.addMember("gamma", "p1"));
        assert(registry.addMember("alpha", "p1"));
        assert(registry.addMember("alpha", "p2"));
        a->step(kDt);
        assert(a->simulation().state().players.size() == 2);
        assert(registry.removeMember("alpha", "p1"));
        a->step(kDt);
        assert(a->simulation().state().players.size() == 1);
        assert(a->simulation().state().players[0] == "p2");

        assert(!registry.getRoom("gamma"));
        assert(registry.deleteRoom("alpha"));
        assert(!registry.deleteRoom("alpha"));
        assert(!registry.getRoom("alpha"));
        assert(registry.roomCount() == 1);
        registry.shutdown();
        assert(registry.roomCount() == 0);
    }
    {
        RecordingSink sink;
        RoomRegistry registry(sink);
        auto room = registry.createRoom("auto");
        assert(room->isRunning());
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        registry.shutdown();
        assert(!room->isRunning());
        assert(room->tickCount() > 0);
    }
    return 0;
}
