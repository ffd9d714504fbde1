// Bounded many-producer queue between room tick threads and the gateway.
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "../../engine/core/BoundedQueue.h"
#include "../room/SnapshotSink.h"

namespace Game::Net {

class BroadcastChannel : public SnapshotSink {
public:
    explicit BroadcastChannel(std::size_t capacity = 256);

    // Drop-newest: a tick thread never waits on a slow gateway.
    bool publish(Frame frame) override;

    std::size_t drain(std::vector<Frame>& out, std::size_t maxFrames);
    std::size_t size() const { return frames_.size(); }
    std::size_t capacity() const { return frames_.capacity(); }
    std::uint64_t droppedFrames() const { return frames_.droppedCount(); }

private:
    Engine::BoundedQueue<Frame> frames_;
};

}  // namespace Game::Net
