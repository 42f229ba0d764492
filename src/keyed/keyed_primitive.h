/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "keyed_value.h"

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace nska::keyed {

inline constexpr std::string_view kNullMarker = "$null";

// Decoded form of a terminal value. References, sequences and mappings are
// not terminal and yield nullopt; the dispatcher handles those.
std::optional<nlohmann::ordered_json> normalize_primitive(const Value& value);

// Values a composite drops instead of decoding: null, false, zero, and
// empty text, data, sequences or mappings. A reference is never empty.
bool is_empty_value(const Value& value);

}  // namespace nska::keyed
