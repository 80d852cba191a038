#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ferry {

std::string base64_encode(const std::vector<std::uint8_t>& data);
std::string base64_encode(const std::string& data);

/// Lenient decoder: skips characters outside the alphabet, stops at padding
std::vector<std::uint8_t> base64_decode(const std::string& encoded);

} // namespace ferry
