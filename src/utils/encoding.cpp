/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "encoding.h"

namespace nska::encoding {
std::string base64url_encode(std::span<const std::uint8_t> bytes) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string out;
    out.reserve((bytes.size() * 4 + 2) / 3);

    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const std::uint32_t v = (static_cast<std::uint32_t>(bytes[i]) << 16)
                                | (static_cast<std::uint32_t>(bytes[i + 1]) << 8)
                                | static_cast<std::uint32_t>(bytes[i + 2]);
        out.push_back(alphabet[(v >> 18) & 0x3Fu]);
        out.push_back(alphabet[(v >> 12) & 0x3Fu]);
        out.push_back(alphabet[(v >> 6) & 0x3Fu]);
        out.push_back(alphabet[v & 0x3Fu]);
    }

    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t v = static_cast<std::uint32_t>(bytes[i]) << 16;
        out.push_back(alphabet[(v >> 18) & 0x3Fu]);
        out.push_back(alphabet[(v >> 12) & 0x3Fu]);
    } else if (rest == 2) {
        const std::uint32_t v = (static_cast<std::uint32_t>(bytes[i]) << 16)
                                | (static_cast<std::uint32_t>(bytes[i + 1]) << 8);
        out.push_back(alphabet[(v >> 18) & 0x3Fu]);
        out.push_back(alphabet[(v >> 12) & 0x3Fu]);
        out.push_back(alphabet[(v >> 6) & 0x3Fu]);
    }
    return out;
}

std::string format_uuid(std::span<const std::uint8_t, 16> bytes) {
    static const char hexdig[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(hexdig[(bytes[i] >> 4) & 0xFu]);
        out.push_back(hexdig[bytes[i] & 0xFu]);
    }
    return out;
}
}  // namespace nska::encoding
