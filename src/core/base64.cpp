#include "core/base64.hpp"

namespace plughost::core {

namespace {

constexpr char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(((len + 2) / 3) * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);

        result.push_back(ALPHABET[(n >> 18) & 0x3F]);
        result.push_back(ALPHABET[(n >> 12) & 0x3F]);
        result.push_back(i + 1 < len ? ALPHABET[(n >> 6) & 0x3F] : '=');
        result.push_back(i + 2 < len ? ALPHABET[n & 0x3F] : '=');
    }

    return result;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded) {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve(encoded.size() / 4 * 3);

    for (size_t i = 0; i < encoded.size(); i += 4) {
        int values[4];
        int padding = 0;
        for (size_t j = 0; j < 4; j++) {
            char c = encoded[i + j];
            if (c == '=') {
                // Padding only in the last two positions of the final group
                if (i + 4 != encoded.size() || j < 2) {
                    return std::nullopt;
                }
                values[j] = 0;
                padding++;
                continue;
            }
            if (padding > 0) {
                return std::nullopt;
            }
            values[j] = decode_char(c);
            if (values[j] < 0) {
                return std::nullopt;
            }
        }

        uint32_t n = (static_cast<uint32_t>(values[0]) << 18) |
                     (static_cast<uint32_t>(values[1]) << 12) |
                     (static_cast<uint32_t>(values[2]) << 6) |
                     static_cast<uint32_t>(values[3]);

        result.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) result.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) result.push_back(static_cast<uint8_t>(n & 0xFF));
    }

    return result;
}

} // namespace plughost::core
