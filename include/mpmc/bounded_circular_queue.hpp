#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

/*
Lock-free bounded MPMC ring buffer (per-cell sequence numbers).

Slot index is pos % capacity, so any capacity >= 2 is kept as requested.
A failed push leaves its argument untouched.
*/
template <typename T>
class BoundedCircularQueue {
public:
    explicit BoundedCircularQueue(std::size_t capacity)
        : capacity_(capacity < 2 ? 2 : capacity),
          cells_(new Cell[capacity_]) {
        for (std::size_t i = 0; i < capacity_; ++i) {
            cells_[i].seq.store(i, std::memory_order_relaxed);
        }
        enqueue_pos_.store(0, std::memory_order_relaxed);
        dequeue_pos_.store(0, std::memory_order_relaxed);
    }

    ~BoundedCircularQueue() {
        const std::size_t tail = enqueue_pos_.load(std::memory_order_relaxed);
        for (std::size_t pos = dequeue_pos_.load(std::memory_order_relaxed); pos != tail; ++pos) {
            Cell& cell = cells_[pos % capacity_];
            if (cell.seq.load(std::memory_order_relaxed) == pos + 1) {
                std::launder(reinterpret_cast<T*>(cell.storage))->~T();
            }
        }
    }

    BoundedCircularQueue(const BoundedCircularQueue&) = delete;
    BoundedCircularQueue& operator=(const BoundedCircularQueue&) = delete;

    bool TryPush(const T& item) {
        return TryEmplace(item);
    }

    bool TryPush(T&& item) {
        return TryEmplace(std::move(item));
    }

    template <typename... Args>
    bool TryEmplace(Args&&... args) {
        Cell* cell = nullptr;
        std::size_t pos = enqueue_pos_.load(std::memory_order_relaxed);
        for (;;) {
            cell = &cells_[pos % capacity_];
            const std::size_t seq = cell->seq.load(std::memory_order_acquire);
            const auto diff = static_cast<std::intptr_t>(seq) - static_cast<std::intptr_t>(pos);
            if (diff == 0) {
                if (enqueue_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    break;
                }
            } else if (diff < 0) {
                return false; // full
            } else {
                pos = enqueue_pos_.load(std::memory_order_relaxed);
            }
        }
        ::new (static_cast<void*>(cell->storage)) T(std::forward<Args>(args)...);
        cell->seq.store(pos + 1, std::memory_order_release);
        return true;
    }

    bool TryPop(T& out) {
        Cell* cell = nullptr;
        std::size_t pos = dequeue_pos_.load(std::memory_order_relaxed);
        for (;;) {
            cell = &cells_[pos % capacity_];
            const std::size_t seq = cell->seq.load(std::memory_order_acquire);
            const auto diff = static_cast<std::intptr_t>(seq) - static_cast<std::intptr_t>(pos + 1);
            if (diff == 0) {
                if (dequeue_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    break;
                }
            } else if (diff < 0) {
                return false; // empty
            } else {
                pos = dequeue_pos_.load(std::memory_order_relaxed);
            }
        }
        T* slot = std::launder(reinterpret_cast<T*>(cell->storage));
        out = std::move(*slot);
        slot->~T();
        cell->seq.store(pos + capacity_, std::memory_order_release);
        return true;
    }

    std::size_t Capacity() const noexcept {
        return capacity_;
    }

    std::size_t ApproxSize() const noexcept {
        const std::size_t tail = enqueue_pos_.load(std::memory_order_acquire);
        const std::size_t head = dequeue_pos_.load(std::memory_order_acquire);
        return tail > head ? tail - head : 0;
    }

    bool Empty() const noexcept {
        return ApproxSize() == 0;
    }

    bool Full() const noexcept {
        return ApproxSize() >= capacity_;
    }

private:
    struct Cell {
        std::atomic<std::size_t> seq;
        alignas(T) unsigned char storage[sizeof(T)];
    };

    const std::size_t capacity_;
    std::unique_ptr<Cell[]> cells_;
    alignas(64) std::atomic<std::size_t> enqueue_pos_;
    alignas(64) std::atomic<std::size_t> dequeue_pos_;
};
