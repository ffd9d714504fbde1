// Capacity and overflow rules of the bounded queue.
#undef NDEBUG
#include <cassert>
#include <string>
#include <vector>

#include "../engine/core/BoundedQueue.h"

using Engine::BoundedQueue;
using Engine::DropPolicy;
using Engine::PushResult;

int main() {
    {
        BoundedQueue<int> q(3, DropPolicy::DropNewest);
        assert(q.push(1) == PushResult::Accepted);
        assert(q.push(2) == PushResult::Accepted);
        assert(q.push(3) == PushResult::Accepted);
        // Full: the newcomer is rejected, contents untouched.
        assert(q.push(4) == PushResult::Rejected);
        assert(q.size() == 3);
        assert(q.droppedCount() == 1);
        int v = 0;
        assert(q.tryPop(v) && v == 1);
        assert(q.push(5) == PushResult::Accepted);
    }
    {
        BoundedQueue<int> q(2, DropPolicy::DropOldest);
        q.push(1);
        q.push(2);
        assert(q.push(3) == PushResult::DroppedOldest);
        assert(q.size() == 2);
        std::vector<int> out;
        assert(q.drain(out, 10) == 2);
        assert(out[0] == 2 && out[1] == 3);
        assert(q.empty());
        assert(q.droppedCount() == 1);
    }
    {
        BoundedQueue<std::string> q(8, DropPolicy::DropNewest);
        for (int i = 0; i < 5; ++i) q.push("m" + std::to_string(i));
        std::vector<std::string> out;
        assert(q.drain(out, 2) == 2);
        assert(out.back() == "m1");
        assert(q.size() == 3);
        q.clear();
        std::string s;
        assert(!q.tryPop(s));
    }
    {
        // Zero capacity is clamped so the queue stays usable.
        BoundedQueue<int> q(0, DropPolicy::DropOldest);
        assert(q.capacity() == 1);
        assert(q.policy() == DropPolicy::DropOldest);
    }
    return 0;
}
