/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "keyed/keyed_value_json.h"

#include "keyed/keyed_error.h"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace nska::keyed {

static void check_depth(int depth, int max_depth) {
    if (max_depth > 0 && depth > max_depth) {
        throw DecodeError(
            ErrorKind::Malformed,
            "document nesting deeper than " + std::to_string(max_depth) + " levels"
        );
    }
}

static Value convert(const nlohmann::ordered_json& j, int depth, int max_depth) {
    switch (j.type()) {
        case nlohmann::ordered_json::value_t::null:
            return Value(nullptr);
        case nlohmann::ordered_json::value_t::boolean:
            return Value(j.get<bool>());
        case nlohmann::ordered_json::value_t::number_integer:
            return Value(j.get<std::int64_t>());
        case nlohmann::ordered_json::value_t::number_unsigned: {
            // Keep small unsigned numbers signed so CF$UID and $version compare
            // the same way they would coming from a property list parser.
            const auto u = j.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value(static_cast<std::int64_t>(u));
            }
            return Value(u);
        }
        case nlohmann::ordered_json::value_t::number_float:
            return Value(j.get<double>());
        case nlohmann::ordered_json::value_t::string:
            return Value(j.get<std::string>());
        case nlohmann::ordered_json::value_t::binary: {
            const auto& bin = j.get_binary();
            return Value(Bytes(bin.begin(), bin.end()));
        }
        case nlohmann::ordered_json::value_t::array: {
            check_depth(depth, max_depth);
            Array out;
            out.reserve(j.size());
            for (const auto& el : j) {
                out.push_back(convert(el, depth + 1, max_depth));
            }
            return Value(std::move(out));
        }
        case nlohmann::ordered_json::value_t::object: {
            check_depth(depth, max_depth);
            Dict out;
            for (auto it = j.begin(); it != j.end(); ++it) {
                out.set(it.key(), convert(it.value(), depth + 1, max_depth));
            }
            return Value(std::move(out));
        }
        case nlohmann::ordered_json::value_t::discarded:
            break;
    }
    throw std::runtime_error(std::string("Unsupported JSON value type: ") + j.type_name());
}

Value value_from_json(const nlohmann::ordered_json& j, int max_depth) {
    return convert(j, 1, max_depth);
}

}  // namespace nska::keyed
