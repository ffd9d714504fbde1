// Table of live rooms keyed by id, shared between the gateway and shutdown.
#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "Room.h"
#include "SnapshotSink.h"

namespace Game {

struct RegistryConfig {
    RoomConfig room{};
    SimulationSettings settings{};
    bool autoStartRooms{true};
};

class RoomRegistry {
public:
    explicit RoomRegistry(SnapshotSink& sink, RegistryConfig config = {});
    ~RoomRegistry();

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    // Returns the existing room when the id is taken.
    std::shared_ptr<Room> createRoom(const std::string& roomId);
    std::shared_ptr<Room> getRoom(const std::string& roomId) const;
    bool deleteRoom(const std::string& roomId);

    // False when the room does not exist or its queue is saturated.
    bool addMember(const std::string& roomId, const std::string& memberId);
    bool removeMember(const std::string& roomId, const std::string& memberId);

    std::size_t roomCount() const;
    std::vector<std::string> roomIds() const;

    // Stops every room driver and empties the table.
    void shutdown();

private:
    SnapshotSink& sink_;
    RegistryConfig config_;
    mutable std::shared_mutex mutex_{};
    std::unordered_map<std::string, std::shared_ptr<Room>> rooms_{};
};

}  // namespace Game
