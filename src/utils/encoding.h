/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace nska::encoding {
// RFC 4648 section 5 alphabet, padding stripped.
std::string base64url_encode(std::span<const std::uint8_t> bytes);

// Lowercase 8-4-4-4-12 form.
std::string format_uuid(std::span<const std::uint8_t, 16> bytes);
}  // namespace nska::encoding
