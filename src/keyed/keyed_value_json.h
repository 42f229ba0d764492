/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "keyed_value.h"

#include <nlohmann/json.hpp>

namespace nska::keyed {

// Builds the container tree from a JSON rendering of a property list.
// References stay in their {"CF$UID": n} form; binary values become data.
// Nesting deeper than max_depth levels (0 = unlimited) throws a Malformed
// DecodeError.
Value value_from_json(const nlohmann::ordered_json& j, int max_depth = 0);

}  // namespace nska::keyed
