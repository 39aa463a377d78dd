#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hb {

// Both throw EntropyFailure when the OS source cannot be initialized.
std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes);
std::string secureRandomHex(std::size_t numBytes);

// Makes sure libsodium is initialized; throws EntropyFailure otherwise.
void ensureSodiumReady();

} // namespace hb
