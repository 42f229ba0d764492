/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "keyed_class_table.h"
#include "keyed_error.h"
#include "keyed_value.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

namespace nska::keyed {

enum class SetDecodeMode {
    // Every member, in archive order.
    AllElements,
    // Only the last decoded member; null for an empty set.
    LastElement,
};

struct DecodeOptions {
    SetDecodeMode set_mode = SetDecodeMode::AllElements;
    int max_depth = 1000;
    bool memoize = true;
    bool debug = false;
};

// Walks one object table. An instance holds the per-call memo and the set of
// indices currently being resolved, so it must not be shared between threads.
class ObjectDecoder {
   public:
    ObjectDecoder(ObjectTable objects, const ClassTable& classes, DecodeOptions options = {});

    nlohmann::ordered_json decode(const Value& encoded);
    nlohmann::ordered_json decode_index(std::int64_t index);

    // Number of table entries dispatched so far; memo hits are not counted.
    std::size_t entries_decoded() const { return _entries_decoded; }

   private:
    class ResolutionScope;
    class DepthScope;

    nlohmann::ordered_json dispatch(const Value& encoded);
    nlohmann::ordered_json decode_mapping(const Dict& dict);
    nlohmann::ordered_json decode_generic(const Dict& dict);
    nlohmann::ordered_json decode_composite(const Dict& dict, bool skip_container);
    nlohmann::ordered_json decode_ordered_collection(const Dict& dict);
    nlohmann::ordered_json decode_keyed_collection(const Dict& dict);
    nlohmann::ordered_json decode_set(const Dict& dict);
    nlohmann::ordered_json decode_hash_table(const Dict& dict);
    nlohmann::ordered_json decode_url(const Dict& dict);
    nlohmann::ordered_json decode_uuid(const Dict& dict);
    nlohmann::ordered_json decode_container_member(const Value& reference, std::string_view field);

    std::optional<std::string> class_name_of(const Value& class_ref);
    const Value& require_member(const Dict& dict, std::string_view name) const;
    const Array& require_array(const Dict& dict, std::string_view name) const;
    std::optional<std::size_t> current_index() const;
    DecodeError error(ErrorKind kind, std::string detail) const;

    ObjectTable _objects;
    const ClassTable& _classes;
    DecodeOptions _options;

    std::unordered_map<std::size_t, nlohmann::ordered_json> _decoded;
    std::unordered_set<std::size_t> _in_progress;
    std::vector<std::size_t> _chain;
    int _depth = 0;
    std::size_t _entries_decoded = 0;
};

}  // namespace nska::keyed
