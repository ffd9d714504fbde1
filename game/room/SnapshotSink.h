// Outbound side of a room: serialized frames handed to the fan-out layer.
#pragma once

#include <optional>
#include <string>

#include "../../engine/net/NetAddress.h"

namespace Game {

struct Frame {
    std::string roomId;
    // Set for direct replies; unset frames go to every subscriber of the room.
    std::optional<Engine::Net::NetAddress> target{};
    std::string payload;
};

class SnapshotSink {
public:
    virtual ~SnapshotSink() = default;

    // Must not block. Returns false when the frame was dropped.
    virtual bool publish(Frame frame) = 0;
};

}  // namespace Game
