/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "keyed/keyed_value.h"

#include <utility>

namespace nska::keyed {

Dict::Dict(std::initializer_list<DictEntry> entries) {
    _entries.reserve(entries.size());
    for (const auto& e : entries) {
        set(e.key, e.value);
    }
}

const Value* Dict::find(std::string_view key) const {
    const auto it = _index.find(key);
    return it == _index.end() ? nullptr : &_entries[it->second].value;
}

void Dict::set(std::string key, Value value) {
    const auto it = _index.find(key);
    if (it != _index.end()) {
        _entries[it->second].value = std::move(value);
        return;
    }
    _index.emplace(key, _entries.size());
    _entries.push_back(DictEntry{std::move(key), std::move(value)});
}

Dict::const_iterator Dict::begin() const {
    return _entries.begin();
}

Dict::const_iterator Dict::end() const {
    return _entries.end();
}

const char* Value::type_name() const {
    if (is<std::nullptr_t>()) {
        return "null";
    }
    if (is<bool>()) {
        return "boolean";
    }
    if (is<std::int64_t>() || is<std::uint64_t>()) {
        return "integer";
    }
    if (is<double>()) {
        return "real";
    }
    if (is<std::string>()) {
        return "string";
    }
    if (is<Bytes>()) {
        return "data";
    }
    if (is<Uid>()) {
        return "uid";
    }
    if (is<Array>()) {
        return "array";
    }
    if (is<Dict>()) {
        return "dict";
    }
    return "unknown";
}

}  // namespace nska::keyed
