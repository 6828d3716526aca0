#include "hcert/types.hpp"

namespace hcert {

namespace {

constexpr const char* BASE64_ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_index(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

} // namespace

std::string bytes_to_hex(const Bytes& data) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t b : data) {
        result.push_back(hex_chars[(b >> 4) & 0x0F]);
        result.push_back(hex_chars[b & 0x0F]);
    }
    return result;
}

std::string base64_encode(const Bytes& data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);
    size_t i = 0;
    while (i + 3 <= data.size()) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) | data[i + 2];
        out.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 6) & 0x3F]);
        out.push_back(BASE64_ALPHABET[n & 0x3F]);
        i += 3;
    }
    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) | (static_cast<uint32_t>(data[i + 1]) << 8);
        out.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

// Accepts standard and URL-safe alphabets, padding optional
std::optional<Bytes> base64_decode(const std::string& text) {
    Bytes out;
    uint32_t acc = 0;
    int bits = 0;
    size_t padding = 0;
    for (char c : text) {
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) return std::nullopt; // data after padding
        if (c == '\n' || c == '\r' || c == ' ') continue;
        int idx = base64_index(c);
        if (idx < 0) return std::nullopt;
        acc = (acc << 6) | static_cast<uint32_t>(idx);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }
    if (padding > 2 || bits >= 6) return std::nullopt;
    return out;
}

} // namespace hcert
