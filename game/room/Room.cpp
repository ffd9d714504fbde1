#include "Room.h"

#include <utility>
#include <vector>

#include "../../engine/core/Logger.h"
#include "../net/NetMessages.h"

namespace Game {

namespace {
constexpr std::uint64_t kDiagnosticsInterval = 60;
constexpr std::uint64_t kSaturationLogInterval = 300;
}  // namespace

Room::Room(std::string id, SnapshotSink& sink, RoomConfig config, SimulationSettings settings)
    : id_(std::move(id)),
      sink_(sink),
      config_(config),
      simulation_(id_, settings),
      commands_(config.commandCapacity, Engine::DropPolicy::DropNewest) {
    if (config_.tickRate <= 0.0) {
        config_.tickRate = 60.0;
    }
}

Room::~Room() { stop(); }

void Room::start() {
    if (running_) return;
    running_ = true;
    diagStart_ = std::chrono::steady_clock::now();
    diagTicks_ = 0;
    thread_ = std::thread(&Room::run, this);
    Engine::logInfo("Room " + id_ + " started at " + std::to_string(static_cast<int>(config_.tickRate)) + " Hz");
}

void Room::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    Engine::logInfo("Room " + id_ + " stopped after " + std::to_string(ticks_.load()) + " ticks");
}

bool Room::post(Command command) {
    if (commands_.push(std::move(command)) == Engine::PushResult::Accepted) {
        return true;
    }
    const auto rejected = ++rejectedCommands_;
    if (rejected % kSaturationLogInterval == 1) {
        Engine::logWarn("Room " + id_ + ": command queue " + std::string(toString(SimError::ChannelSaturated)) + " (" +
                        std::to_string(rejected) + " rejected)");
    }
    return false;
}

void Room::step(double deltaSeconds) {
    std::vector<Command> pending;
    commands_.drain(pending, commands_.capacity());
    bool mutated = false;
    for (auto& command : pending) {
        if (command && command(simulation_)) {
            mutated = true;
        }
    }
    if (mutated) {
        publishSnapshot(simulation_.state());
    }

    time_ = Engine::advance(time_, deltaSeconds);
    simulation_.tick(time_);
    publishSnapshot(simulation_.state());

    ++ticks_;
    if (++diagTicks_ >= kDiagnosticsInterval) {
        logDiagnostics();
    }
}

void Room::publishTo(const Engine::Net::NetAddress& target, std::string payload) {
    sink_.publish(Frame{id_, target, std::move(payload)});
}

void Room::publishSnapshot(const RoomState& state) {
    sink_.publish(Frame{id_, std::nullopt, Net::encodeGameState(state)});
}

void Room::run() {
    using clock = std::chrono::steady_clock;
    const double delta = 1.0 / config_.tickRate;
    const auto interval = std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>(delta));
    auto next = clock::now();
    while (running_) {
        step(delta);
        next += interval;
        const auto now = clock::now();
        if (next < now) {
            // Fell behind; skip the backlog instead of bursting.
            next = now;
        }
        std::this_thread::sleep_until(next);
    }
}

void Room::logDiagnostics() {
    const auto now = std::chrono::steady_clock::now();
    const double seconds = std::chrono::duration<double>(now - diagStart_).count();
    const double measured = seconds > 0.0 ? static_cast<double>(diagTicks_) / seconds : 0.0;
    const RoomState& state = simulation_.state();
    Engine::logDebug("Room " + id_ + ": " + std::to_string(measured) + " ticks/s, towers=" +
                     std::to_string(state.towers.size()) + " enemies=" + std::to_string(state.enemies.size()) +
                     " projectiles=" + std::to_string(state.projectiles.size()));
    diagStart_ = now;
    diagTicks_ = 0;
}

}  // namespace Game
