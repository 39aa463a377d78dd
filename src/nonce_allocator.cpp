#include "nonce_allocator.hpp"

#include <limits>
#include <stdexcept>

namespace hb {

std::uint64_t NonceAllocator::reserve(std::uint64_t span) {
    if (span == 0) {
        throw std::invalid_argument("nonce reservation span must be positive");
    }
    std::uint64_t first = next_.load(std::memory_order_relaxed);
    do {
        if (first > std::numeric_limits<std::uint64_t>::max() - span) {
            throw std::overflow_error("nonce space exhausted for this epoch");
        }
    } while (!next_.compare_exchange_weak(
        first, first + span, std::memory_order_acq_rel, std::memory_order_relaxed));
    return first;
}

bool NonceAllocator::claim(std::uint64_t first, std::uint64_t span) {
    if (span == 0) {
        throw std::invalid_argument("nonce claim span must be positive");
    }
    if (first > std::numeric_limits<std::uint64_t>::max() - span) {
        throw std::overflow_error("nonce space exhausted for this epoch");
    }
    std::uint64_t current = next_.load(std::memory_order_relaxed);
    do {
        if (current > first) {
            return false;
        }
    } while (!next_.compare_exchange_weak(
        current, first + span, std::memory_order_acq_rel, std::memory_order_relaxed));
    return true;
}

} // namespace hb
