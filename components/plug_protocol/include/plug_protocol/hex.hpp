#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace plug_protocol {
namespace hex {

/**
 * @brief Encode bytes as lowercase hex
 */
std::string encode(const uint8_t* data, size_t length);
std::string encode(const std::vector<uint8_t>& data);

/**
 * @brief Decode hex text (either case) to bytes
 * @throws HexDecodeError on odd length or a non-hex character
 */
std::vector<uint8_t> decode(const std::string& text);

/**
 * @brief True if every character is a hex digit
 */
bool isHex(const std::string& text);

} // namespace hex
} // namespace plug_protocol
