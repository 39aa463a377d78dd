#pragma once

#include <atomic>
#include <cstdint>

namespace hb {

// Per-epoch sequence numbers. Lock-free; every value is handed out at most
// once. A fresh allocator is created with every commitment epoch, which is
// how the counter resets on rotation.
class NonceAllocator {
public:
    NonceAllocator() = default;
    NonceAllocator(const NonceAllocator&) = delete;
    NonceAllocator& operator=(const NonceAllocator&) = delete;

    std::uint64_t next() { return reserve(1); }

    // First of `span` consecutive values, all owned by the caller.
    std::uint64_t reserve(std::uint64_t span);

    // Takes [first, first + span) for a caller that picked its own numbers.
    // False when any of them may already have been handed out.
    bool claim(std::uint64_t first, std::uint64_t span);

    std::uint64_t issued() const { return next_.load(std::memory_order_acquire); }

private:
    std::atomic<std::uint64_t> next_{ 0 };
};

} // namespace hb
