/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "keyed/keyed_reference.h"

#include "keyed/keyed_error.h"

#include <limits>
#include <string>

namespace nska::keyed {

std::optional<std::int64_t> reference_index(const Value& value) {
    if (const auto* uid = value.get_if<Uid>()) {
        return static_cast<std::int64_t>(uid->index);
    }

    const auto* dict = value.get_if<Dict>();
    if (dict == nullptr || dict->size() != 1) {
        return std::nullopt;
    }
    const Value* uid_value = dict->find(kXmlUidKey);
    if (uid_value == nullptr) {
        return std::nullopt;
    }
    if (const auto* i = uid_value->get_if<std::int64_t>()) {
        return *i;
    }
    if (const auto* u = uid_value->get_if<std::uint64_t>()) {
        // Larger than any table can be; resolve() rejects it.
        if (*u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        return static_cast<std::int64_t>(*u);
    }
    throw DecodeError(
        ErrorKind::Malformed,
        std::string("CF$UID holds ") + uid_value->type_name() + " instead of an integer"
    );
}

const Value& resolve(ObjectTable table, std::int64_t index, std::optional<std::size_t> owner) {
    if (index < 0 || static_cast<std::uint64_t>(index) >= table.size()) {
        throw DecodeError(
            ErrorKind::OutOfRange,
            "reference " + std::to_string(index) + " outside object table of "
                + std::to_string(table.size()) + " entries",
            owner
        );
    }
    return table[static_cast<std::size_t>(index)];
}

const Value& resolve(ObjectTable table, const Value& reference, std::optional<std::size_t> owner) {
    const auto index = reference_index(reference);
    if (!index.has_value()) {
        throw DecodeError(
            ErrorKind::Malformed,
            std::string("expected a reference, found ") + reference.type_name(),
            owner
        );
    }
    return resolve(table, *index, owner);
}

}  // namespace nska::keyed
