#include "utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace cubeprog {
namespace utils {

namespace {

constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

void appendUtf8(std::string& out, uint32_t codePoint) {
    if (codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
        codePoint = REPLACEMENT_CHARACTER;
    }

    if (codePoint < 0x80) {
        out.push_back(static_cast<char>(codePoint));
    } else if (codePoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else if (codePoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

void appendWide(std::wstring& out, uint32_t codePoint) {
    if (sizeof(wchar_t) == 2 && codePoint >= 0x10000) {
        codePoint -= 0x10000;
        out.push_back(static_cast<wchar_t>(0xD800 + (codePoint >> 10)));
        out.push_back(static_cast<wchar_t>(0xDC00 + (codePoint & 0x3FF)));
    } else {
        out.push_back(static_cast<wchar_t>(codePoint));
    }
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string wideToUtf8(const std::wstring& text) {
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        uint32_t unit = static_cast<uint32_t>(text[i]);
        if (sizeof(wchar_t) == 2) {
            unit &= 0xFFFF;
            if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < text.size()) {
                uint32_t low = static_cast<uint32_t>(text[i + 1]) & 0xFFFF;
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    appendUtf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                    ++i;
                    continue;
                }
            }
        }
        appendUtf8(out, unit);
    }

    return out;
}

std::wstring utf8ToWide(const std::string& text) {
    std::wstring out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        uint32_t codePoint = 0;
        size_t length = 0;

        if (lead < 0x80) {
            codePoint = lead;
            length = 1;
        } else if ((lead & 0xE0) == 0xC0) {
            codePoint = lead & 0x1F;
            length = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            codePoint = lead & 0x0F;
            length = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            codePoint = lead & 0x07;
            length = 4;
        } else {
            appendWide(out, REPLACEMENT_CHARACTER);
            ++i;
            continue;
        }

        if (i + length > text.size()) {
            appendWide(out, REPLACEMENT_CHARACTER);
            break;
        }

        bool valid = true;
        for (size_t k = 1; k < length; ++k) {
            auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            codePoint = (codePoint << 6) | (cont & 0x3F);
        }

        if (!valid) {
            appendWide(out, REPLACEMENT_CHARACTER);
            ++i;
            continue;
        }

        // Overlong forms, surrogates and values past U+10FFFF are malformed
        static const uint32_t minimumForLength[] = {0, 0, 0x80, 0x800, 0x10000};
        if (codePoint < minimumForLength[length] || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            codePoint = REPLACEMENT_CHARACTER;
        }

        appendWide(out, codePoint);
        i += length;
    }

    return out;
}

std::string fixedFieldToString(const char* field, size_t capacity) {
    const void* terminator = std::memchr(field, '\0', capacity);
    size_t length = terminator
        ? static_cast<size_t>(static_cast<const char*>(terminator) - field)
        : capacity;
    return std::string(field, length);
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string toUpper(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

uint32_t parseUint32(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        throw std::invalid_argument("Expected a number");
    }

    int base = 10;
    if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
        base = 16;
        value = value.substr(2);
    }

    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        if (value[0] == '-' || value[0] == '+') {
            throw std::invalid_argument("sign");
        }
        parsed = std::stoull(value, &consumed, base);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number: " + text);
    }

    if (consumed != value.size() || parsed > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("Invalid number: " + text);
    }

    return static_cast<uint32_t>(parsed);
}

std::vector<uint8_t> parseHexBytes(const std::string& text) {
    std::string digits;
    std::string value = trim(text);
    if (value.size() >= 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
        value = value.substr(2);
    }

    for (char c : value) {
        if (c == ' ' || c == ':' || c == '-') {
            continue;
        }
        if (hexValue(c) < 0) {
            throw std::invalid_argument(std::string("Invalid hex character '") + c + "'");
        }
        digits.push_back(c);
    }

    if (digits.size() % 2 != 0) {
        throw std::invalid_argument("Hex byte string has an odd number of digits");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        bytes.push_back(static_cast<uint8_t>((hexValue(digits[i]) << 4) | hexValue(digits[i + 1])));
    }
    return bytes;
}

std::string hexDump(const std::vector<uint8_t>& data, uint32_t baseAddress) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');

    for (size_t offset = 0; offset < data.size(); offset += 16) {
        oss << "0x" << std::setw(8) << static_cast<uint32_t>(baseAddress + offset) << ": ";

        for (size_t i = 0; i < 16; ++i) {
            if (offset + i < data.size()) {
                oss << std::setw(2) << static_cast<int>(data[offset + i]) << ' ';
            } else {
                oss << "   ";
            }
        }

        oss << ' ';
        for (size_t i = 0; i < 16 && offset + i < data.size(); ++i) {
            auto c = data[offset + i];
            oss << (std::isprint(c) ? static_cast<char>(c) : '.');
        }
        oss << '\n';
    }

    return oss.str();
}

std::string toHex(uint32_t value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << value;
    return oss.str();
}

} // namespace utils
} // namespace cubeprog
