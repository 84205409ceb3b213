#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace sqlgate {

/**
 * @brief Bounded lossless MPSC queue feeding the audit writer
 *
 * Producers reserve a position with one fetch_add, so the reservation
 * order is the order the consumer sees. A full queue makes the producer
 * yield until its slot is free; records are never dropped.
 *
 * Per-slot sequence numbers:
 *   sequence == p          slot is free for the producer that reserved p
 *   sequence == p + 1      item p is published, the consumer may take it
 *   sequence == p + Cap    consumed, free for the producer one lap ahead
 *
 * @tparam T        Element type (move-constructible)
 * @tparam Capacity Slot count, a power of 2
 */
template <typename T, size_t Capacity = 4096>
class MPSCRingBuffer {
    static_assert(Capacity > 0 && (Capacity & (Capacity - 1)) == 0,
                  "Capacity must be a power of 2");
    static_assert(std::is_move_constructible_v<T>,
                  "T must be move-constructible");

public:
    MPSCRingBuffer() {
        for (size_t i = 0; i < Capacity; ++i) {
            slots_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    MPSCRingBuffer(const MPSCRingBuffer&) = delete;
    MPSCRingBuffer& operator=(const MPSCRingBuffer&) = delete;

    /// Enqueue (any thread). Waits only while this producer's slot is still occupied.
    void push(T item) {
        const size_t pos = write_pos_.fetch_add(1, std::memory_order_relaxed);
        Slot& slot = slots_[pos & kMask];

        if (slot.sequence.load(std::memory_order_acquire) != pos) {
            backpressure_waits_.fetch_add(1, std::memory_order_relaxed);
            while (slot.sequence.load(std::memory_order_acquire) != pos) {
                std::this_thread::yield();
            }
        }

        slot.data.emplace(std::move(item));
        slot.sequence.store(pos + 1, std::memory_order_release);
    }

    /**
     * @brief Move up to max_count published items into batch (consumer thread only)
     *
     * Stops at the first reserved-but-unpublished slot, so a slow producer
     * holds back everything reserved after it.
     *
     * @return Number of items appended
     */
    size_t drain(std::vector<T>& batch, size_t max_count) {
        size_t count = 0;
        while (count < max_count) {
            Slot& slot = slots_[read_pos_ & kMask];
            if (slot.sequence.load(std::memory_order_acquire) != read_pos_ + 1) {
                break;
            }
            batch.emplace_back(std::move(*slot.data));
            slot.data.reset();
            slot.sequence.store(read_pos_ + Capacity, std::memory_order_release);
            ++read_pos_;
            ++count;
        }
        return count;
    }

    /// Positions handed out so far; a flush waits until the consumer has passed this mark
    [[nodiscard]] size_t reserved() const noexcept {
        return write_pos_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t backpressure_waits() const noexcept {
        return backpressure_waits_.load(std::memory_order_relaxed);
    }

private:
    static constexpr size_t kMask = Capacity - 1;

    struct alignas(64) Slot {
        std::optional<T> data;
        std::atomic<size_t> sequence{0};
    };

    // Producer and consumer cursors on separate cache lines
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) size_t read_pos_{0};

    alignas(64) std::atomic<uint64_t> backpressure_waits_{0};

    std::array<Slot, Capacity> slots_;
};

} // namespace sqlgate
