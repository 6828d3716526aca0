#include "hcert/base45.hpp"

#include <array>

namespace hcert {

namespace {

constexpr uint32_t BASE = 45;
constexpr uint32_t BASE_SQUARED = BASE * BASE;

// Reverse lookup, -1 for characters outside the alphabet
std::array<int8_t, 256> build_index() {
    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (int i = 0; BASE45_ALPHABET[i] != '\0'; ++i) {
        table[static_cast<unsigned char>(BASE45_ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

const std::array<int8_t, 256>& index_table() {
    static const std::array<int8_t, 256> table = build_index();
    return table;
}

std::string describe_char(char c, size_t pos) {
    auto u = static_cast<unsigned char>(c);
    std::string shown = (u >= 0x20 && u < 0x7F) ? std::string("'") + c + "'"
                                                : "0x" + std::to_string(static_cast<int>(u));
    return "invalid base45 character " + shown + " at offset " + std::to_string(pos);
}

} // namespace

Result<Bytes> base45_decode(const std::string& text) {
    const auto& index = index_table();

    if (text.size() % 3 == 1) {
        return Result<Bytes>::err(make_error(
            ErrorCode::DECODE_ERROR,
            "invalid base45 length " + std::to_string(text.size()) + ": dangling character"));
    }

    Bytes out;
    out.reserve(text.size() / 3 * 2 + 1);

    for (size_t pos = 0; pos < text.size(); pos += 3) {
        size_t group = text.size() - pos >= 3 ? 3 : 2;
        uint32_t digits[3] = {0, 0, 0};
        for (size_t i = 0; i < group; ++i) {
            int8_t v = index[static_cast<unsigned char>(text[pos + i])];
            if (v < 0) {
                return Result<Bytes>::err(
                    make_error(ErrorCode::DECODE_ERROR, describe_char(text[pos + i], pos + i)));
            }
            digits[i] = static_cast<uint32_t>(v);
        }

        uint32_t n = digits[0] + digits[1] * BASE + digits[2] * BASE_SQUARED;
        if (group == 3) {
            if (n > 0xFFFF) {
                return Result<Bytes>::err(make_error(
                    ErrorCode::DECODE_ERROR,
                    "base45 group at offset " + std::to_string(pos) + " exceeds 65535"));
            }
            out.push_back(static_cast<uint8_t>(n >> 8));
            out.push_back(static_cast<uint8_t>(n & 0xFF));
        } else {
            if (n > 0xFF) {
                return Result<Bytes>::err(make_error(
                    ErrorCode::DECODE_ERROR,
                    "trailing base45 pair at offset " + std::to_string(pos) + " exceeds 255"));
            }
            out.push_back(static_cast<uint8_t>(n));
        }
    }

    return Result<Bytes>::ok(std::move(out));
}

std::string base45_encode(const Bytes& data) {
    std::string out;
    out.reserve((data.size() / 2) * 3 + 2);

    size_t i = 0;
    for (; i + 2 <= data.size(); i += 2) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 8) | data[i + 1];
        out.push_back(BASE45_ALPHABET[n % BASE]);
        out.push_back(BASE45_ALPHABET[(n / BASE) % BASE]);
        out.push_back(BASE45_ALPHABET[n / BASE_SQUARED]);
    }
    if (i < data.size()) {
        uint32_t n = data[i];
        out.push_back(BASE45_ALPHABET[n % BASE]);
        out.push_back(BASE45_ALPHABET[n / BASE]);
    }
    return out;
}

} // namespace hcert
