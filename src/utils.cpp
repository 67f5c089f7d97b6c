#include "utils.h"
#include <cctype>

namespace livetalk {
namespace utils {

namespace {

const char* const BASE64_ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_value(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

std::string strip_think_tags(const std::string& text) {
    static const std::string OPEN = "<think>";
    static const std::string CLOSE = "</think>";

    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find(OPEN, pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, open - pos);
        size_t close = text.find(CLOSE, open + OPEN.size());
        if (close == std::string::npos) {
            break;  // unterminated block: reasoning ran to the end
        }
        pos = close + CLOSE.size();
    }
    return trim(out);
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::string utf8_truncate(const std::string& text, size_t max_code_points) {
    size_t count = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (count == max_code_points) return text.substr(0, i);
            ++count;
        }
    }
    return text;
}

std::string base64_encode(const std::string& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        uint32_t n = (static_cast<uint8_t>(data[i]) << 16) |
                     (static_cast<uint8_t>(data[i + 1]) << 8) |
                     static_cast<uint8_t>(data[i + 2]);
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += BASE64_ALPHABET[(n >> 6) & 0x3F];
        out += BASE64_ALPHABET[n & 0x3F];
        i += 3;
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(data[i]) << 16;
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(data[i]) << 16) |
                     (static_cast<uint8_t>(data[i + 1]) << 8);
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += BASE64_ALPHABET[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::optional<std::string> base64_decode(const std::string& encoded) {
    std::string clean;
    clean.reserve(encoded.size());
    for (unsigned char c : encoded) {
        if (!std::isspace(c)) clean += static_cast<char>(c);
    }
    if (clean.size() % 4 != 0) return std::nullopt;

    std::string out;
    out.reserve((clean.size() / 4) * 3);
    for (size_t i = 0; i < clean.size(); i += 4) {
        int v[4];
        int padding = 0;
        for (int k = 0; k < 4; ++k) {
            unsigned char c = static_cast<unsigned char>(clean[i + k]);
            if (c == '=') {
                // Padding only in the last group, last two positions
                if (i + 4 != clean.size() || k < 2) return std::nullopt;
                v[k] = 0;
                ++padding;
            } else {
                if (padding > 0) return std::nullopt;
                v[k] = base64_value(c);
                if (v[k] < 0) return std::nullopt;
            }
        }
        uint32_t n = (v[0] << 18) | (v[1] << 12) | (v[2] << 6) | v[3];
        out += static_cast<char>((n >> 16) & 0xFF);
        if (padding < 2) out += static_cast<char>((n >> 8) & 0xFF);
        if (padding < 1) out += static_cast<char>(n & 0xFF);
    }
    return out;
}

} // namespace utils
} // namespace livetalk
