/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "keyed/keyed_object_decoder.h"

#include "keyed/keyed_primitive.h"
#include "keyed/keyed_reference.h"
#include "utils/encoding.h"
#include "utils/log.h"

#include <span>

namespace nska::keyed {

static constexpr std::string_view kClassKey = "$class";
static constexpr std::string_view kClassNameKey = "$classname";
static constexpr std::string_view kContainerKey = "container";
static constexpr std::string_view kObjectsKey = "NS.objects";
static constexpr std::string_view kKeysKey = "NS.keys";
static constexpr std::string_view kHashTableValuesKey = "$1";
static constexpr std::string_view kUrlBaseKey = "NS.base";
static constexpr std::string_view kUrlRelativeKey = "NS.relative";
static constexpr std::string_view kUuidBytesKey = "NS.uuidbytes";
static constexpr std::size_t kUuidSize = 16;

// Marks a table index as being resolved for the lifetime of the scope.
class ObjectDecoder::ResolutionScope {
   public:
    ResolutionScope(ObjectDecoder& decoder, std::size_t index) : _decoder(decoder), _index(index) {
        _decoder._in_progress.insert(index);
        _decoder._chain.push_back(index);
    }
    ~ResolutionScope() {
        _decoder._chain.pop_back();
        _decoder._in_progress.erase(_index);
    }

    ResolutionScope(const ResolutionScope&) = delete;
    ResolutionScope& operator=(const ResolutionScope&) = delete;

   private:
    ObjectDecoder& _decoder;
    std::size_t _index;
};

class ObjectDecoder::DepthScope {
   public:
    explicit DepthScope(ObjectDecoder& decoder) : _decoder(decoder) {
        _decoder._depth++;
        if (_decoder._options.max_depth > 0 && _decoder._depth > _decoder._options.max_depth) {
            _decoder._depth--;
            throw _decoder.error(
                ErrorKind::Malformed,
                "nesting deeper than " + std::to_string(_decoder._options.max_depth) + " levels"
            );
        }
    }
    ~DepthScope() { _decoder._depth--; }

    DepthScope(const DepthScope&) = delete;
    DepthScope& operator=(const DepthScope&) = delete;

   private:
    ObjectDecoder& _decoder;
};

ObjectDecoder::ObjectDecoder(ObjectTable objects, const ClassTable& classes, DecodeOptions options)
    : _objects(objects), _classes(classes), _options(options) {}

nlohmann::ordered_json ObjectDecoder::decode(const Value& encoded) {
    return dispatch(encoded);
}

nlohmann::ordered_json ObjectDecoder::decode_index(std::int64_t index) {
    const Value& encoded = resolve(_objects, index, current_index());
    const auto slot = static_cast<std::size_t>(index);

    if (_options.memoize) {
        const auto it = _decoded.find(slot);
        if (it != _decoded.end()) {
            return it->second;
        }
    }
    if (_in_progress.count(slot) != 0) {
        throw error(
            ErrorKind::CyclicReference,
            "object #" + std::to_string(slot) + " references itself through its members"
        );
    }

    ResolutionScope scope(*this, slot);
    auto out = dispatch(encoded);
    _entries_decoded++;
    if (_options.memoize) {
        _decoded.emplace(slot, out);
    }
    return out;
}

nlohmann::ordered_json ObjectDecoder::dispatch(const Value& encoded) {
    DepthScope depth(*this);

    if (const auto index = reference_index(encoded)) {
        return decode_index(*index);
    }
    if (auto primitive = normalize_primitive(encoded)) {
        return std::move(*primitive);
    }
    if (const auto* array = encoded.get_if<Array>()) {
        auto out = nlohmann::ordered_json::array();
        for (const auto& element : *array) {
            out.push_back(dispatch(element));
        }
        return out;
    }
    if (const auto* dict = encoded.get_if<Dict>()) {
        return decode_mapping(*dict);
    }
    throw error(
        ErrorKind::Malformed, std::string("unsupported encoded value type ") + encoded.type_name()
    );
}

nlohmann::ordered_json ObjectDecoder::decode_mapping(const Dict& dict) {
    const Value* class_ref = dict.find(kClassKey);
    if (class_ref == nullptr || is_empty_value(*class_ref)) {
        return decode_generic(dict);
    }

    const auto class_name = class_name_of(*class_ref);
    if (!class_name.has_value()) {
        return decode_generic(dict);
    }

    const auto strategy = _classes.find(*class_name);
    if (!strategy.has_value()) {
        throw error(ErrorKind::UnsupportedClass, *class_name);
    }

    if (_options.debug) {
        const auto owner = current_index();
        NSKA_LOG_DEBUG(
            "object #%lld: %s -> %s",
            owner.has_value() ? static_cast<long long>(*owner) : -1LL,
            class_name->c_str(),
            std::string(class_strategy_name(*strategy)).c_str()
        );
    }

    switch (*strategy) {
        case ClassStrategy::Composite:
            return decode_composite(dict, false);
        case ClassStrategy::OrderedCollection:
            return decode_ordered_collection(dict);
        case ClassStrategy::KeyedCollection:
            return decode_keyed_collection(dict);
        case ClassStrategy::Set:
            return decode_set(dict);
        case ClassStrategy::HashTable:
            return decode_hash_table(dict);
        case ClassStrategy::Url:
            return decode_url(dict);
        case ClassStrategy::Uuid:
            return decode_uuid(dict);
    }
    throw error(ErrorKind::UnsupportedClass, *class_name);
}

nlohmann::ordered_json ObjectDecoder::decode_generic(const Dict& dict) {
    auto out = nlohmann::ordered_json::object();
    for (const auto& entry : dict) {
        out[entry.key] = dispatch(entry.value);
    }
    return out;
}

nlohmann::ordered_json ObjectDecoder::decode_composite(const Dict& dict, bool skip_container) {
    auto out = nlohmann::ordered_json::object();
    for (const auto& entry : dict) {
        if (entry.key == kClassKey) {
            continue;
        }
        if (skip_container && entry.key == kContainerKey) {
            continue;
        }
        if (is_empty_value(entry.value)) {
            continue;
        }
        out[entry.key] = dispatch(entry.value);
    }
    return out;
}

nlohmann::ordered_json ObjectDecoder::decode_ordered_collection(const Dict& dict) {
    const Array& objects = require_array(dict, kObjectsKey);

    auto out = nlohmann::ordered_json::array();
    for (const auto& element : objects) {
        out.push_back(dispatch(element));
    }
    return out;
}

nlohmann::ordered_json ObjectDecoder::decode_keyed_collection(const Dict& dict) {
    const Array& keys = require_array(dict, kKeysKey);
    const Array& objects = require_array(dict, kObjectsKey);
    if (keys.size() != objects.size()) {
        throw error(
            ErrorKind::LengthMismatch,
            "NS.keys has " + std::to_string(keys.size()) + " entries, NS.objects has "
                + std::to_string(objects.size())
        );
    }

    auto out = nlohmann::ordered_json::object();
    for (std::size_t i = 0; i < keys.size(); i++) {
        const auto key = dispatch(keys[i]);
        auto value = dispatch(objects[i]);
        const std::string key_text = key.is_string() ? key.get<std::string>() : key.dump();
        out[key_text] = std::move(value);
    }
    return out;
}

nlohmann::ordered_json ObjectDecoder::decode_set(const Dict& dict) {
    const Array& objects = require_array(dict, kObjectsKey);

    auto members = nlohmann::ordered_json::array();
    for (const auto& element : objects) {
        members.push_back(decode_container_member(element, kObjectsKey));
    }

    if (_options.set_mode == SetDecodeMode::LastElement) {
        if (members.empty()) {
            return nullptr;
        }
        return members.back();
    }
    return members;
}

nlohmann::ordered_json ObjectDecoder::decode_hash_table(const Dict& dict) {
    // $0 (count) and $2 are not needed to rebuild the values.
    const Value& values = require_member(dict, kHashTableValuesKey);
    return decode_container_member(values, kHashTableValuesKey);
}

nlohmann::ordered_json ObjectDecoder::decode_url(const Dict& dict) {
    const Value& encoded_base = require_member(dict, kUrlBaseKey);
    const Value& encoded_relative = require_member(dict, kUrlRelativeKey);

    const auto base = dispatch(encoded_base);
    auto relative = dispatch(encoded_relative);
    if (!base.is_null() && !base.is_string()) {
        throw error(ErrorKind::Malformed, std::string("NS.base decodes to ") + base.type_name());
    }
    if (!relative.is_null() && !relative.is_string()) {
        throw error(
            ErrorKind::Malformed, std::string("NS.relative decodes to ") + relative.type_name()
        );
    }

    if (base.is_null() || base.get_ref<const std::string&>().empty()) {
        return relative;
    }
    if (relative.is_null()) {
        throw error(ErrorKind::Malformed, std::string("NS.relative is null while NS.base is set"));
    }
    return base.get<std::string>() + "/" + relative.get<std::string>();
}

nlohmann::ordered_json ObjectDecoder::decode_uuid(const Dict& dict) {
    const Value* encoded = &require_member(dict, kUuidBytesKey);
    if (is_reference(*encoded)) {
        encoded = &resolve(_objects, *encoded, current_index());
    }

    const auto* bytes = encoded->get_if<Bytes>();
    if (bytes == nullptr) {
        throw error(
            ErrorKind::Malformed, std::string("NS.uuidbytes holds ") + encoded->type_name()
        );
    }
    if (bytes->size() != kUuidSize) {
        throw error(
            ErrorKind::InvalidLength,
            "NS.uuidbytes holds " + std::to_string(bytes->size()) + " bytes, expected 16"
        );
    }
    return encoding::format_uuid(std::span<const std::uint8_t, kUuidSize>(bytes->data(), kUuidSize));
}

// Set and hash-table members are decoded member-wise without class dispatch.
// A member slot holding another reference is followed on the same path.
// Non-mapping members (strings, numbers) still take the regular path.
nlohmann::ordered_json
ObjectDecoder::decode_container_member(const Value& reference, std::string_view field) {
    const auto index = reference_index(reference);
    if (!index.has_value()) {
        throw error(
            ErrorKind::Malformed,
            std::string(field) + " entry is " + reference.type_name() + ", expected a reference"
        );
    }

    const Value& target = resolve(_objects, *index, current_index());
    const auto slot = static_cast<std::size_t>(*index);
    if (_in_progress.count(slot) != 0) {
        throw error(
            ErrorKind::CyclicReference,
            "object #" + std::to_string(slot) + " references itself through its members"
        );
    }

    DepthScope depth(*this);
    ResolutionScope scope(*this, slot);
    if (is_reference(target)) {
        return decode_container_member(target, field);
    }
    if (const auto* dict = target.get_if<Dict>()) {
        return decode_composite(*dict, true);
    }
    return dispatch(target);
}

std::optional<std::string> ObjectDecoder::class_name_of(const Value& class_ref) {
    // Follow reference chains; more hops than table entries means a loop.
    const Value* descriptor = &class_ref;
    std::size_t hops = 0;
    while (const auto index = reference_index(*descriptor)) {
        if (hops++ > _objects.size()) {
            throw error(ErrorKind::CyclicReference, std::string("$class reference chain loops"));
        }
        descriptor = &resolve(_objects, *index, current_index());
    }

    const auto* dict = descriptor->get_if<Dict>();
    if (dict == nullptr) {
        throw error(
            ErrorKind::Malformed,
            std::string("$class resolves to ") + descriptor->type_name() + ", expected a dict"
        );
    }

    const Value* name = dict->find(kClassNameKey);
    if (name == nullptr) {
        return std::nullopt;
    }
    const auto* text = name->get_if<std::string>();
    if (text == nullptr) {
        throw error(ErrorKind::Malformed, std::string("$classname holds ") + name->type_name());
    }
    if (text->empty()) {
        return std::nullopt;
    }
    return *text;
}

const Value& ObjectDecoder::require_member(const Dict& dict, std::string_view name) const {
    const Value* value = dict.find(name);
    if (value == nullptr) {
        throw error(ErrorKind::MissingField, std::string(name));
    }
    return *value;
}

const Array& ObjectDecoder::require_array(const Dict& dict, std::string_view name) const {
    const Value& value = require_member(dict, name);
    const auto* array = value.get_if<Array>();
    if (array == nullptr) {
        throw error(
            ErrorKind::Malformed,
            std::string(name) + " holds " + value.type_name() + ", expected an array"
        );
    }
    return *array;
}

std::optional<std::size_t> ObjectDecoder::current_index() const {
    if (_chain.empty()) {
        return std::nullopt;
    }
    return _chain.back();
}

DecodeError ObjectDecoder::error(ErrorKind kind, std::string detail) const {
    return DecodeError(kind, std::move(detail), current_index());
}

}  // namespace nska::keyed
