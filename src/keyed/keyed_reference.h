/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "keyed_value.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace nska::keyed {

inline constexpr std::string_view kXmlUidKey = "CF$UID";

// Index carried by a reference in either encoding: a native Uid, or a
// single-entry {"CF$UID": n} mapping. Returns nullopt for anything else.
// Throws Malformed when a CF$UID mapping carries a non-integer value.
std::optional<std::int64_t> reference_index(const Value& value);

inline bool is_reference(const Value& value) {
    return reference_index(value).has_value();
}

// Single table lookup, no recursion. `owner` is the index of the object
// holding the reference and is only used for error reporting.
const Value& resolve(
    ObjectTable table,
    std::int64_t index,
    std::optional<std::size_t> owner = std::nullopt
);

const Value& resolve(
    ObjectTable table,
    const Value& reference,
    std::optional<std::size_t> owner = std::nullopt
);

}  // namespace nska::keyed
