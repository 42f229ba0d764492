/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace nska::keyed {

struct Value;
struct DictEntry;

using Bytes = std::vector<std::uint8_t>;
using Array = std::vector<Value>;

// Native reference marker as produced by a binary property list parser.
struct Uid {
    std::uint32_t index = 0;

    bool operator==(const Uid&) const = default;
};

// Mapping that keeps the key order of the source document. Setting an
// existing key replaces its value in place. Lookups go through a key index.
class Dict {
   public:
    using const_iterator = std::vector<DictEntry>::const_iterator;

    Dict() = default;
    Dict(std::initializer_list<DictEntry> entries);

    const Value* find(std::string_view key) const;
    bool contains(std::string_view key) const { return find(key) != nullptr; }
    void set(std::string key, Value value);

    std::size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }
    const_iterator begin() const;
    const_iterator end() const;

   private:
    std::vector<DictEntry> _entries;
    std::map<std::string, std::size_t, std::less<>> _index;
};

// One node of the parsed container tree handed to the decoder.
struct Value {
    using Storage = std::variant<
        std::nullptr_t,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        Bytes,
        Uid,
        Array,
        Dict>;

    Storage data;

    Value() : data(nullptr) {}
    Value(std::nullptr_t) : data(nullptr) {}
    Value(bool v) : data(v) {}
    Value(int v) : data(static_cast<std::int64_t>(v)) {}
    Value(std::int64_t v) : data(v) {}
    Value(std::uint64_t v) : data(v) {}
    Value(double v) : data(v) {}
    Value(const char* v) : data(std::string(v)) {}
    Value(std::string v) : data(std::move(v)) {}
    Value(Bytes v) : data(std::move(v)) {}
    Value(Uid v) : data(v) {}
    Value(Array v) : data(std::move(v)) {}
    Value(Dict v) : data(std::move(v)) {}

    template <typename T>
    bool is() const {
        return std::holds_alternative<T>(data);
    }

    template <typename T>
    const T* get_if() const {
        return std::get_if<T>(&data);
    }

    bool is_null() const { return is<std::nullptr_t>(); }
    const char* type_name() const;
};

struct DictEntry {
    std::string key;
    Value value;
};

using ObjectTable = std::span<const Value>;

}  // namespace nska::keyed
