/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace nska::keyed {

enum class ClassStrategy {
    Composite,
    OrderedCollection,
    KeyedCollection,
    Set,
    HashTable,
    Url,
    Uuid,
};

std::string_view class_strategy_name(ClassStrategy strategy);

// Maps archived class names to the strategy that decodes them. Lookup is
// exact and case-sensitive.
class ClassTable {
   public:
    ClassTable() = default;

    // Foundation collection classes plus the record classes known to appear
    // in system archives.
    static ClassTable with_defaults();

    // Throws std::invalid_argument for an empty name. Re-registering a name
    // replaces its strategy.
    void register_class(std::string name, ClassStrategy strategy);

    std::optional<ClassStrategy> find(std::string_view name) const;
    bool contains(std::string_view name) const { return find(name).has_value(); }
    std::size_t size() const { return _entries.size(); }

   private:
    std::map<std::string, ClassStrategy, std::less<>> _entries;
};

}  // namespace nska::keyed
