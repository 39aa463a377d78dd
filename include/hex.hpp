#pragma once

#include <cstddef>
#include <string>

namespace hb {

std::string bytesToHex(const unsigned char* data, std::size_t len);
bool isLowerHex(const std::string& text);

} // namespace hb
