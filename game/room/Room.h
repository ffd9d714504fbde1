// One independent game instance: a Simulation, its command queue and the
// fixed-rate thread that drives it.
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include "../../engine/core/BoundedQueue.h"
#include "../../engine/core/Time.h"
#include "../../engine/net/NetAddress.h"
#include "../Simulation.h"
#include "SnapshotSink.h"

namespace Game {

struct RoomConfig {
    double tickRate{60.0};
    std::size_t commandCapacity{256};
};

class Room {
public:
    // Runs on the tick thread; returns true when it changed room state.
    using Command = std::function<bool(Simulation&)>;

    Room(std::string id, SnapshotSink& sink, RoomConfig config = {}, SimulationSettings settings = {});
    ~Room();

    Room(const Room&) = delete;
    Room& operator=(const Room&) = delete;

    const std::string& id() const { return id_; }

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // Never blocks. A full queue rejects the command (ChannelSaturated).
    bool post(Command command);
    std::size_t pendingCommands() const { return commands_.size(); }

    // Drain commands, publish if anything changed, tick, publish.
    void step(double deltaSeconds);
    std::uint64_t tickCount() const { return ticks_; }

    void publishTo(const Engine::Net::NetAddress& target, std::string payload);
    void publishSnapshot(const RoomState& state);

    // Only valid while the driver thread is stopped.
    const Simulation& simulation() const { return simulation_; }

private:
    void run();
    void logDiagnostics();

    std::string id_;
    SnapshotSink& sink_;
    RoomConfig config_;
    Simulation simulation_;
    Engine::BoundedQueue<Command> commands_;
    Engine::TimeStep time_{};

    std::thread thread_{};
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> ticks_{0};
    std::atomic<std::uint64_t> rejectedCommands_{0};

    std::chrono::steady_clock::time_point diagStart_{};
    std::uint64_t diagTicks_{0};
};

}  // namespace Game
