#include "secure_random.hpp"

#include "errors.hpp"
#include "hex.hpp"
#include "secure_memory.hpp"

#include <sodium.h>

namespace hb {

void ensureSodiumReady() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) {
        throw EntropyFailure("Unable to initialize libsodium");
    }
}

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes) {
    std::vector<std::uint8_t> buffer(numBytes);
    if (numBytes == 0) {
        return buffer;
    }

    ensureSodiumReady();
    randombytes_buf(buffer.data(), buffer.size());
    return buffer;
}

std::string secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    std::string hex = bytesToHex(bytes.data(), bytes.size());
    secureZero(bytes.data(), bytes.size());
    return hex;
}

} // namespace hb
