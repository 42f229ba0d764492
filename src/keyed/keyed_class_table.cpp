/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "keyed/keyed_class_table.h"

#include <array>
#include <stdexcept>
#include <utility>

namespace nska::keyed {

static const std::array<std::pair<std::string_view, ClassStrategy>, 16> kDefaultClasses = {{
    {"NSArray", ClassStrategy::OrderedCollection},
    {"NSMutableArray", ClassStrategy::OrderedCollection},
    {"NSDictionary", ClassStrategy::KeyedCollection},
    {"NSMutableDictionary", ClassStrategy::KeyedCollection},
    {"NSSet", ClassStrategy::Set},
    {"NSMutableSet", ClassStrategy::Set},
    {"NSHashTable", ClassStrategy::HashTable},
    {"NSURL", ClassStrategy::Url},
    {"NSUUID", ClassStrategy::Uuid},
    // Background task management and shared file list records.
    {"BackgroundItemContainer", ClassStrategy::Composite},
    {"BackgroundItems", ClassStrategy::Composite},
    {"BackgroundLoginItem", ClassStrategy::Composite},
    {"Bookmark", ClassStrategy::Composite},
    {"BTMUserSettings", ClassStrategy::Composite},
    {"ItemRecord", ClassStrategy::Composite},
    {"Storage", ClassStrategy::Composite},
}};

std::string_view class_strategy_name(ClassStrategy strategy) {
    switch (strategy) {
        case ClassStrategy::Composite:
            return "composite";
        case ClassStrategy::OrderedCollection:
            return "ordered-collection";
        case ClassStrategy::KeyedCollection:
            return "keyed-collection";
        case ClassStrategy::Set:
            return "set";
        case ClassStrategy::HashTable:
            return "hash-table";
        case ClassStrategy::Url:
            return "url";
        case ClassStrategy::Uuid:
            return "uuid";
    }
    return "unknown";
}

ClassTable ClassTable::with_defaults() {
    ClassTable table;
    for (const auto& [name, strategy] : kDefaultClasses) {
        table.register_class(std::string(name), strategy);
    }
    return table;
}

void ClassTable::register_class(std::string name, ClassStrategy strategy) {
    if (name.empty()) {
        throw std::invalid_argument(std::string("Class name must not be empty"));
    }
    _entries[std::move(name)] = strategy;
}

std::optional<ClassStrategy> ClassTable::find(std::string_view name) const {
    const auto it = _entries.find(name);
    if (it == _entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace nska::keyed
