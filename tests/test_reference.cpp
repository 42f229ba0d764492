/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "keyed/keyed_reference.h"

#include "archive_builder.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using namespace nska::keyed;  // NOLINT
using nska::test_support::capture_decode_error;
using nska::test_support::xml_ref;

using testing::HasSubstr;
using testing::Optional;

TEST(ReferenceIndex, AcceptsBothEncodings) {
    EXPECT_THAT(reference_index(Value(Uid{7})), Optional(7));
    EXPECT_THAT(reference_index(xml_ref(3)), Optional(3));
    EXPECT_THAT(reference_index(Value(Dict{{"CF$UID", std::uint64_t{12}}})), Optional(12));
}

TEST(ReferenceIndex, IgnoresOtherValues) {
    EXPECT_FALSE(reference_index(Value(7)).has_value());
    EXPECT_FALSE(reference_index(Value("CF$UID")).has_value());
    EXPECT_FALSE(reference_index(Value(Dict{})).has_value());
    EXPECT_FALSE(reference_index(Value(Dict{{"CF$UID", 1}, {"extra", 2}})).has_value());
    EXPECT_FALSE(reference_index(Value(Dict{{"$class", Uid{1}}})).has_value());
}

TEST(ReferenceIndex, RejectsNonIntegerXmlUid) {
    const auto err = capture_decode_error([] {
        (void)reference_index(Value(Dict{{"CF$UID", "three"}}));
    });
    EXPECT_EQ(err.kind(), ErrorKind::Malformed);
    EXPECT_THAT(err.detail(), HasSubstr("string"));
}

TEST(Resolve, ReturnsTableEntry) {
    const Array table = {"$null", "first", 42};
    EXPECT_EQ(*resolve(table, 1).get_if<std::string>(), "first");
    EXPECT_EQ(*resolve(table, Value(Uid{2})).get_if<std::int64_t>(), 42);
    EXPECT_EQ(*resolve(table, xml_ref(0)).get_if<std::string>(), "$null");
}

TEST(Resolve, RejectsIndicesOutsideTable) {
    const Array table = {"$null", "first"};

    const auto past_end = capture_decode_error([&] { (void)resolve(table, 2); });
    EXPECT_EQ(past_end.kind(), ErrorKind::OutOfRange);
    EXPECT_FALSE(past_end.object_index().has_value());

    const auto negative = capture_decode_error([&] { (void)resolve(table, xml_ref(-1), 1); });
    EXPECT_EQ(negative.kind(), ErrorKind::OutOfRange);
    EXPECT_THAT(negative.object_index(), Optional(1u));
    EXPECT_THAT(std::string(negative.what()), HasSubstr("(object #1)"));

    const auto huge = capture_decode_error([&] {
        (void)resolve(table, Value(Dict{{"CF$UID", std::uint64_t{0xFFFFFFFFFFFFFFFFull}}}));
    });
    EXPECT_EQ(huge.kind(), ErrorKind::OutOfRange);
}

TEST(Resolve, RejectsNonReference) {
    const Array table = {"$null"};
    const auto err = capture_decode_error([&] { (void)resolve(table, Value("text")); });
    EXPECT_EQ(err.kind(), ErrorKind::Malformed);
}

}  // namespace
