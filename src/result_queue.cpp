#include "task_agg/result_queue.hpp"

namespace task_agg {

BufferedResultQueue::BufferedResultQueue(std::size_t capacity)
    : capacity_(capacity), queue_(capacity) {}

bool BufferedResultQueue::Put(Result value) {
    if (queue_.TryPush(value)) {
        return true;
    }
    if (queue_.Closed()) {
        return false;
    }
    suspensions_.fetch_add(1, std::memory_order_relaxed);
    return queue_.WaitPush(value);
}

bool BufferedResultQueue::Get(Result& out) {
    return queue_.WaitPop(out);
}

void BufferedResultQueue::Close() {
    queue_.Close();
}

bool BufferedResultQueue::Closed() const {
    return queue_.Closed();
}

bool RendezvousResultQueue::Put(Result value) {
    return channel_.Send(value);
}

bool RendezvousResultQueue::Get(Result& out) {
    return channel_.Receive(out);
}

void RendezvousResultQueue::Close() {
    channel_.Close();
}

bool RendezvousResultQueue::Closed() const {
    return channel_.Closed();
}

Sum DrainSum(ResultQueue& queue) {
    Sum sum = 0;
    Result value = 0;
    while (queue.Get(value)) {
        sum += value;
    }
    return sum;
}

Sum DrainSum(ResultQueue& queue, std::size_t reads, std::size_t* received) {
    Sum sum = 0;
    Result value = 0;
    std::size_t got = 0;
    for (; got < reads && queue.Get(value); ++got) {
        sum += value;
    }
    if (received != nullptr) {
        *received = got;
    }
    return sum;
}

}
