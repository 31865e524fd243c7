#ifndef CUBEPROG_STRING_UTILS_H
#define CUBEPROG_STRING_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cubeprog {
namespace utils {

/**
 * @brief Encode a wide string (UTF-32 on Unix, UTF-16 on Windows) as UTF-8
 *
 * Invalid code units are replaced with U+FFFD.
 */
std::string wideToUtf8(const std::wstring& text);

/**
 * @brief Decode UTF-8 into the platform wide encoding
 *
 * Malformed sequences are replaced with U+FFFD.
 */
std::wstring utf8ToWide(const std::string& text);

/**
 * @brief Text of a fixed size, possibly unterminated char field
 */
std::string fixedFieldToString(const char* field, size_t capacity);

std::string trim(const std::string& text);

std::string toUpper(const std::string& text);

/**
 * @brief Parse a 32-bit unsigned number, decimal or 0x-prefixed hex
 *
 * @throws std::invalid_argument on malformed text or overflow
 */
uint32_t parseUint32(const std::string& text);

/**
 * @brief Parse a hex byte string ("DEADBEEF", "de ad be ef" or "0xdeadbeef")
 *
 * @throws std::invalid_argument on odd length or non-hex characters
 */
std::vector<uint8_t> parseHexBytes(const std::string& text);

/**
 * @brief Classic 16 bytes per line hex/ASCII dump starting at baseAddress
 */
std::string hexDump(const std::vector<uint8_t>& data, uint32_t baseAddress);

/**
 * @brief Uppercase hex without prefix, e.g. 0x450 -> "450"
 */
std::string toHex(uint32_t value);

} // namespace utils
} // namespace cubeprog

#endif // CUBEPROG_STRING_UTILS_H
