#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <sodium.h>

namespace hb {

inline void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }

    sodium_memzero(ptr, numBytes);
}

// Constant-time comparison for secrets and digests.
inline bool secureEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

// Heap copy of a secret that is wiped when it goes away. Not copyable or
// movable, so the bytes live in exactly one place.
template <typename T>
class SecureBuffer {
public:
    SecureBuffer(const T* data, std::size_t count) : buffer_(data, data + count) {}

    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    ~SecureBuffer() { wipe(); }

    std::size_t size() const { return buffer_.size(); }

    const T* data() const { return buffer_.data(); }

    const unsigned char* bytes() const {
        return reinterpret_cast<const unsigned char*>(buffer_.data());
    }
    std::size_t byteSize() const { return sizeof(T) * buffer_.size(); }

private:
    void wipe() {
        if (!buffer_.empty()) {
            secureZero(static_cast<void*>(buffer_.data()), sizeof(T) * buffer_.size());
        }
    }

    std::vector<T> buffer_;
};

} // namespace hb
