#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace plughost::core {

// Standard base64 with '=' padding
std::string base64_encode(const uint8_t* data, size_t len);
std::string base64_encode(const std::vector<uint8_t>& data);

// Returns nullopt on characters outside the alphabet or a bad length
std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded);

} // namespace plughost::core
