#include "plug_protocol/hex.hpp"
#include "plug_protocol/error.hpp"

#include <algorithm>

namespace plug_protocol {
namespace hex {

namespace {

constexpr char DIGITS[] = "0123456789abcdef";

int nibbleValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string encode(const uint8_t* data, size_t length) {
    std::string text;
    text.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        text.push_back(DIGITS[data[i] >> 4]);
        text.push_back(DIGITS[data[i] & 0x0F]);
    }
    return text;
}

std::string encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

std::vector<uint8_t> decode(const std::string& text) {
    if (text.size() % 2 != 0) {
        throw HexDecodeError("odd number of characters (" + std::to_string(text.size()) + ")");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int high = nibbleValue(text[i]);
        int low = nibbleValue(text[i + 1]);
        if (high < 0 || low < 0) {
            throw HexDecodeError("invalid character at offset " + std::to_string(high < 0 ? i : i + 1));
        }
        bytes.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return bytes;
}

bool isHex(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](char c) { return nibbleValue(c) >= 0; });
}

} // namespace hex
} // namespace plug_protocol
