#include "RoomRegistry.h"

#include <algorithm>
#include <mutex>
#include <utility>

#include "../../engine/core/Logger.h"

namespace Game {

RoomRegistry::RoomRegistry(SnapshotSink& sink, RegistryConfig config) : sink_(sink), config_(config) {}

RoomRegistry::~RoomRegistry() { shutdown(); }

std::shared_ptr<Room> RoomRegistry::createRoom(const std::string& roomId) {
    std::shared_ptr<Room> room;
    {
        std::unique_lock lock(mutex_);
        auto it = rooms_.find(roomId);
        if (it != rooms_.end()) {
            return it->second;
        }
        room = std::make_shared<Room>(roomId, sink_, config_.room, config_.settings);
        rooms_.emplace(roomId, room);
    }
    Engine::logInfo("Created room " + roomId);
    if (config_.autoStartRooms) {
        room->start();
    }
    return room;
}

std::shared_ptr<Room> RoomRegistry::getRoom(const std::string& roomId) const {
    std::shared_lock lock(mutex_);
    auto it = rooms_.find(roomId);
    if (it == rooms_.end()) {
        return nullptr;
    }
    return it->second;
}

bool RoomRegistry::deleteRoom(const std::string& roomId) {
    std::shared_ptr<Room> room;
    {
        std::unique_lock lock(mutex_);
        auto it = rooms_.find(roomId);
        if (it == rooms_.end()) {
            return false;
        }
        room = std::move(it->second);
        rooms_.erase(it);
    }
    room->stop();
    Engine::logInfo("Deleted room " + roomId);
    return true;
}

bool RoomRegistry::addMember(const std::string& roomId, const std::string& memberId) {
    auto room = getRoom(roomId);
    if (!room) {
        return false;
    }
    return room->post([memberId](Simulation& sim) { return sim.addMember(memberId); });
}

bool RoomRegistry::removeMember(const std::string& roomId, const std::string& memberId) {
    auto room = getRoom(roomId);
    if (!room) {
        return false;
    }
    return room->post([memberId](Simulation& sim) { return sim.removeMember(memberId); });
}

std::size_t RoomRegistry::roomCount() const {
    std::shared_lock lock(mutex_);
    return rooms_.size();
}

std::vector<std::string> RoomRegistry::roomIds() const {
    std::vector<std::string> ids;
    {
        std::shared_lock lock(mutex_);
        ids.reserve(rooms_.size());
        for (const auto& [id, room] : rooms_) {
            (void)room;
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void RoomRegistry::shutdown() {
    std::unordered_map<std::string, std::shared_ptr<Room>> rooms;
    {
        std::unique_lock lock(mutex_);
        rooms.swap(rooms_);
    }
    for (auto& [id, room] : rooms) {
        (void)id;
        room->stop();
    }
    if (!rooms.empty()) {
        Engine::logInfo("Room registry shut down (" + std::to_string(rooms.size()) + " rooms)");
    }
}

}  // namespace Game
