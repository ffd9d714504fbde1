#include "BroadcastChannel.h"

#include <string>
#include <utility>

#include "../../engine/core/Logger.h"
#include "../SimError.h"

namespace Game::Net {

namespace {
constexpr std::uint64_t kSaturationLogInterval = 300;
}

BroadcastChannel::BroadcastChannel(std::size_t capacity) : frames_(capacity, Engine::DropPolicy::DropNewest) {}

bool BroadcastChannel::publish(Frame frame) {
    const std::string roomId = frame.roomId;
    if (frames_.push(std::move(frame)) == Engine::PushResult::Accepted) {
        return true;
    }
    const auto dropped = frames_.droppedCount();
    if (dropped % kSaturationLogInterval == 1) {
        Engine::logWarn("Broadcast queue " + std::string(toString(SimError::ChannelSaturated)) + ": dropped frame for room " +
                        roomId + " (" + std::to_string(dropped) + " total)");
    }
    return false;
}

std::size_t BroadcastChannel::drain(std::vector<Frame>& out, std::size_t maxFrames) {
    return frames_.drain(out, maxFrames);
}

}  // namespace Game::Net
