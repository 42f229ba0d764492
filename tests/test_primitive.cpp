/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "keyed/keyed_primitive.h"

#include "archive_builder.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

namespace {

using namespace nska::keyed;  // NOLINT
using nska::test_support::xml_ref;
using json = nlohmann::ordered_json;

json normalized(const Value& value) {
    auto out = normalize_primitive(value);
    EXPECT_TRUE(out.has_value()) << value.type_name();
    return out.value_or(json("<not normalized>"));
}

TEST(NormalizePrimitive, MapsNullMarkerToNull) {
    const auto out = normalize_primitive(Value("$null"));
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->is_null());

    const auto null_value = normalize_primitive(Value(nullptr));
    ASSERT_TRUE(null_value.has_value());
    EXPECT_TRUE(null_value->is_null());
}

TEST(NormalizePrimitive, PassesScalarsThrough) {
    EXPECT_EQ(normalized(Value(true)), json(true));
    EXPECT_EQ(normalized(Value(false)), json(false));
    EXPECT_EQ(normalized(Value(-17)), json(-17));
    EXPECT_EQ(normalized(Value(std::uint64_t{18446744073709551615ull})),
              json(std::uint64_t{18446744073709551615ull}));
    EXPECT_EQ(normalized(Value(2.5)), json(2.5));
    EXPECT_EQ(normalized(Value("NSObject")), json("NSObject"));
    EXPECT_EQ(normalized(Value("")), json(""));
}

TEST(NormalizePrimitive, RendersBytesAsUnpaddedUrlSafeBase64) {
    const Bytes data = {0x00, 0xFB, 0xFF, 0x10};
    EXPECT_EQ(normalized(Value(data)), json("APv_EA"));
    EXPECT_EQ(normalized(Value(Bytes{})), json(""));
}

TEST(NormalizePrimitive, LeavesContainersAndReferencesToDispatch) {
    EXPECT_FALSE(normalize_primitive(Value(Uid{1})).has_value());
    EXPECT_FALSE(normalize_primitive(xml_ref(1)).has_value());
    EXPECT_FALSE(normalize_primitive(Value(Array{1, 2})).has_value());
    EXPECT_FALSE(normalize_primitive(Value(Dict{{"a", 1}})).has_value());
}

TEST(IsEmptyValue, FollowsTruthiness) {
    EXPECT_TRUE(is_empty_value(Value(nullptr)));
    EXPECT_TRUE(is_empty_value(Value(false)));
    EXPECT_TRUE(is_empty_value(Value(0)));
    EXPECT_TRUE(is_empty_value(Value(std::uint64_t{0})));
    EXPECT_TRUE(is_empty_value(Value(0.0)));
    EXPECT_TRUE(is_empty_value(Value("")));
    EXPECT_TRUE(is_empty_value(Value(Bytes{})));
    EXPECT_TRUE(is_empty_value(Value(Array{})));
    EXPECT_TRUE(is_empty_value(Value(Dict{})));

    EXPECT_FALSE(is_empty_value(Value(true)));
    EXPECT_FALSE(is_empty_value(Value(3)));
    EXPECT_FALSE(is_empty_value(Value("$null")));
    EXPECT_FALSE(is_empty_value(Value(Uid{0})));
    EXPECT_FALSE(is_empty_value(xml_ref(0)));
    EXPECT_FALSE(is_empty_value(Value(Array{0})));
}

}  // namespace
