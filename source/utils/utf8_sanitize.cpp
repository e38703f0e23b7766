#include "utils/utf8_sanitize.hpp"

#include <cstddef>
#include <utility>

namespace utf8_sanitize {

namespace {

const char kReplacementCharacter[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at text[offset], or 0 if the
// byte there does not begin one. Follows the table in Unicode 15, section 3.9.
std::size_t sequence_length_at(const std::string &text, std::size_t offset) {
    const std::size_t remaining = text.size() - offset;
    const auto byte_at = [&](std::size_t index) {
        return static_cast<unsigned char>(text[offset + index]);
    };
    const auto in_range = [](unsigned char byte, unsigned char low, unsigned char high) {
        return byte >= low && byte <= high;
    };

    unsigned char lead = byte_at(0);
    if (lead < 0x80u) {
        return 1;
    }
    if (in_range(lead, 0xC2u, 0xDFu)) {
        return (remaining >= 2 && in_range(byte_at(1), 0x80u, 0xBFu)) ? 2 : 0;
    }
    if (in_range(lead, 0xE0u, 0xEFu)) {
        if (remaining < 3) {
            return 0;
        }
        unsigned char low = (lead == 0xE0u) ? 0xA0u : 0x80u;
        unsigned char high = (lead == 0xEDu) ? 0x9Fu : 0xBFu;
        bool well_formed = in_range(byte_at(1), low, high) && in_range(byte_at(2), 0x80u, 0xBFu);
        return well_formed ? 3 : 0;
    }
    if (in_range(lead, 0xF0u, 0xF4u)) {
        if (remaining < 4) {
            return 0;
        }
        unsigned char low = (lead == 0xF0u) ? 0x90u : 0x80u;
        unsigned char high = (lead == 0xF4u) ? 0x8Fu : 0xBFu;
        bool well_formed = in_range(byte_at(1), low, high) &&
                           in_range(byte_at(2), 0x80u, 0xBFu) &&
                           in_range(byte_at(3), 0x80u, 0xBFu);
        return well_formed ? 4 : 0;
    }
    return 0;
}

} // namespace

bool is_valid(const std::string &text) {
    std::size_t offset = 0;
    while (offset < text.size()) {
        std::size_t length = sequence_length_at(text, offset);
        if (length == 0) {
            return false;
        }
        offset += length;
    }
    return true;
}

void sanitize(std::string &text) {
    if (is_valid(text)) {
        return;
    }

    std::string result;
    result.reserve(text.size() + 8);

    std::size_t offset = 0;
    while (offset < text.size()) {
        std::size_t length = sequence_length_at(text, offset);
        if (length == 0) {
            result += kReplacementCharacter;
            ++offset;
            continue;
        }
        result.append(text, offset, length);
        offset += length;
    }

    text = std::move(result);
}

std::string sanitize(const std::string &text) {
    std::string copy = text;
    sanitize(copy);
    return copy;
}

} // namespace utf8_sanitize
