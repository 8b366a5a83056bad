#pragma once

#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace promptshield {

/**
 * @brief Bounded lock-free MPSC ring buffer for event records
 *
 * Each slot carries a sequence number: producers claim a position with a
 * CAS on the write cursor and publish the slot by bumping its sequence;
 * the single consumer only reads slots whose sequence says "published".
 * A producer that finds the buffer full gets false back and keeps its
 * item (nothing is moved out on failure).
 *
 * Capacity is rounded up to a power of two.
 */
template<typename T>
class MpscRingBuffer {
public:
    explicit MpscRingBuffer(size_t capacity)
        : capacity_(std::bit_ceil(capacity < 2 ? size_t{2} : capacity)),
          mask_(capacity_ - 1),
          slots_(std::make_unique<Slot[]>(capacity_)) {
        for (size_t i = 0; i < capacity_; ++i) {
            slots_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    MpscRingBuffer(const MpscRingBuffer&) = delete;
    MpscRingBuffer& operator=(const MpscRingBuffer&) = delete;

    /**
     * @brief Push an item (multiple producers)
     * @return false if the buffer is full; item is left untouched
     */
    bool try_push(T& item) {
        size_t pos = write_pos_.load(std::memory_order_relaxed);
        Slot* slot = nullptr;
        for (;;) {
            slot = &slots_[pos & mask_];
            const size_t seq = slot->sequence.load(std::memory_order_acquire);
            const auto diff = static_cast<std::intptr_t>(seq) - static_cast<std::intptr_t>(pos);
            if (diff == 0) {
                if (write_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    break;
                }
            } else if (diff < 0) {
                return false;   // full
            } else {
                pos = write_pos_.load(std::memory_order_relaxed);
            }
        }

        slot->value = std::move(item);
        slot->sequence.store(pos + 1, std::memory_order_release);
        return true;
    }

    /**
     * @brief Pop an item (single consumer only)
     */
    std::optional<T> try_pop() {
        Slot& slot = slots_[read_pos_ & mask_];
        const size_t seq = slot.sequence.load(std::memory_order_acquire);
        if (seq != read_pos_ + 1) {
            return std::nullopt;    // empty, or claimed but not yet published
        }

        std::optional<T> out(std::move(slot.value));
        slot.value = T{};
        slot.sequence.store(read_pos_ + capacity_, std::memory_order_release);
        ++read_pos_;
        read_pos_snapshot_.store(read_pos_, std::memory_order_relaxed);
        return out;
    }

    /**
     * @brief Drain up to max_items into a vector (single consumer only)
     * @return Number of items drained
     */
    size_t drain(std::vector<T>& out, size_t max_items) {
        size_t count = 0;
        while (count < max_items) {
            auto item = try_pop();
            if (!item) break;
            out.push_back(std::move(*item));
            ++count;
        }
        return count;
    }

    [[nodiscard]] size_t capacity() const { return capacity_; }

    /// Approximate number of published items (may be stale under contention)
    [[nodiscard]] size_t size_approx() const {
        const size_t w = write_pos_.load(std::memory_order_relaxed);
        const size_t r = read_pos_snapshot_.load(std::memory_order_relaxed);
        return w >= r ? w - r : 0;
    }

private:
    struct alignas(64) Slot {
        std::atomic<size_t> sequence{0};
        T value{};
    };

    const size_t capacity_;
    const size_t mask_;
    std::unique_ptr<Slot[]> slots_;

    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) size_t read_pos_ = 0;
    std::atomic<size_t> read_pos_snapshot_{0};
};

} // namespace promptshield
