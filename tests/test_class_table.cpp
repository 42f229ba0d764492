/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "keyed/keyed_class_table.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

namespace {

using namespace nska::keyed;  // NOLINT

using testing::Optional;

TEST(ClassTable, DefaultsCoverFoundationCollections) {
    const auto table = ClassTable::with_defaults();

    EXPECT_THAT(table.find("NSArray"), Optional(ClassStrategy::OrderedCollection));
    EXPECT_THAT(table.find("NSMutableArray"), Optional(ClassStrategy::OrderedCollection));
    EXPECT_THAT(table.find("NSDictionary"), Optional(ClassStrategy::KeyedCollection));
    EXPECT_THAT(table.find("NSMutableDictionary"), Optional(ClassStrategy::KeyedCollection));
    EXPECT_THAT(table.find("NSSet"), Optional(ClassStrategy::Set));
    EXPECT_THAT(table.find("NSMutableSet"), Optional(ClassStrategy::Set));
    EXPECT_THAT(table.find("NSHashTable"), Optional(ClassStrategy::HashTable));
    EXPECT_THAT(table.find("NSURL"), Optional(ClassStrategy::Url));
    EXPECT_THAT(table.find("NSUUID"), Optional(ClassStrategy::Uuid));
}

TEST(ClassTable, DefaultsCoverRecordClasses) {
    const auto table = ClassTable::with_defaults();
    for (const auto* name : {"BackgroundItemContainer", "BackgroundItems", "BackgroundLoginItem",
                             "Bookmark", "BTMUserSettings", "ItemRecord", "Storage"}) {
        EXPECT_THAT(table.find(name), Optional(ClassStrategy::Composite)) << name;
    }
    EXPECT_EQ(table.size(), 16u);
}

TEST(ClassTable, LookupIsExactAndCaseSensitive) {
    const auto table = ClassTable::with_defaults();
    EXPECT_FALSE(table.contains("nsarray"));
    EXPECT_FALSE(table.contains("NSArray "));
    EXPECT_FALSE(table.contains("NSString"));
    EXPECT_FALSE(table.contains(""));
}

TEST(ClassTable, RegistersAndReplacesClasses) {
    auto table = ClassTable::with_defaults();
    table.register_class("SFLListItem", ClassStrategy::Composite);
    EXPECT_THAT(table.find("SFLListItem"), Optional(ClassStrategy::Composite));

    table.register_class("NSArray", ClassStrategy::Set);
    EXPECT_THAT(table.find("NSArray"), Optional(ClassStrategy::Set));
    EXPECT_EQ(table.size(), 17u);
}

TEST(ClassTable, RejectsEmptyName) {
    ClassTable table;
    EXPECT_THROW(table.register_class("", ClassStrategy::Composite), std::invalid_argument);
    EXPECT_EQ(table.size(), 0u);
}

TEST(ClassTable, NamesStrategies) {
    EXPECT_EQ(class_strategy_name(ClassStrategy::KeyedCollection), "keyed-collection");
    EXPECT_EQ(class_strategy_name(ClassStrategy::Uuid), "uuid");
}

}  // namespace
