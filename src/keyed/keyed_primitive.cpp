/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "keyed/keyed_primitive.h"

#include "keyed/keyed_reference.h"
#include "utils/encoding.h"

#include <type_traits>
#include <variant>

namespace nska::keyed {

std::optional<nlohmann::ordered_json> normalize_primitive(const Value& value) {
    if (value.is_null()) {
        return nlohmann::ordered_json(nullptr);
    }
    if (const auto* b = value.get_if<bool>()) {
        return nlohmann::ordered_json(*b);
    }
    if (const auto* i = value.get_if<std::int64_t>()) {
        return nlohmann::ordered_json(*i);
    }
    if (const auto* u = value.get_if<std::uint64_t>()) {
        return nlohmann::ordered_json(*u);
    }
    if (const auto* d = value.get_if<double>()) {
        return nlohmann::ordered_json(*d);
    }
    if (const auto* bytes = value.get_if<Bytes>()) {
        return nlohmann::ordered_json(encoding::base64url_encode(*bytes));
    }
    if (const auto* s = value.get_if<std::string>()) {
        if (*s == kNullMarker) {
            return nlohmann::ordered_json(nullptr);
        }
        return nlohmann::ordered_json(*s);
    }
    return std::nullopt;
}

bool is_empty_value(const Value& value) {
    if (is_reference(value)) {
        return false;
    }
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return true;
            } else if constexpr (std::is_same_v<T, bool>) {
                return !v;
            } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::uint64_t>) {
                return v == 0;
            } else if constexpr (std::is_same_v<T, double>) {
                return v == 0.0;
            } else if constexpr (std::is_same_v<T, Uid>) {
                return false;
            } else {
                return v.empty();
            }
        },
        value.data
    );
}

}  // namespace nska::keyed
