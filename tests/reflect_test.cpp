#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <rapidjson/document.h>

#include <gtest/gtest.h>

#include "reflect.h"

namespace reflect
{

struct scalar_record
{
    bool b = false;
    std::uint8_t u8 = 0;
    std::int8_t i8 = 0;
    short s = 0;
    unsigned short us = 0;
    int i = 0;
    unsigned u = 0;
    long long ll = 0;
    unsigned long long ull = 0;
    double d = 0;
    std::string str;
    std::optional<int> opt_i;
    std::vector<int> vec_i;
};

struct nested_record
{
    std::string name;
    std::vector<scalar_record> items;
};

REFLECT_STRUCT_BEGIN(scalar_record)
REFLECT_MEMBER(b);
REFLECT_MEMBER(u8);
REFLECT_MEMBER(i8);
REFLECT_MEMBER(s);
REFLECT_MEMBER(us);
REFLECT_MEMBER(i);
REFLECT_MEMBER(u);
REFLECT_MEMBER(ll);
REFLECT_MEMBER(ull);
REFLECT_MEMBER(d);
REFLECT_MEMBER(str);
REFLECT_MEMBER_AS(opt_i, "optI");
REFLECT_MEMBER_AS(vec_i, "vecI");
REFLECT_STRUCT_END()

struct slashed_record
{
    int value = 0;
};

REFLECT_STRUCT_BEGIN(slashed_record)
REFLECT_MEMBER_AS(value, "a/b~c");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(nested_record)
REFLECT_MEMBER(name);
REFLECT_MEMBER(items);
REFLECT_STRUCT_END()

}    // namespace reflect

namespace xnode
{

TEST(ReflectTest, FullRoundTrip)
{
    reflect::scalar_record t;
    t.b = true;
    t.u8 = 255;
    t.i8 = 127;
    t.s = -32768;
    t.us = 65535;
    t.i = -123456;
    t.u = 123456;
    t.ll = -123456789012345LL;
    t.ull = 123456789012345ULL;
    t.d = 3.14159;
    t.str = "hello reflection";
    t.opt_i = 42;
    t.vec_i = {1, 2, 3};

    const std::string json = reflect::serialize_struct(t);
    reflect::scalar_record t2;
    ASSERT_TRUE(reflect::deserialize_struct(t2, json));

    EXPECT_EQ(t.b, t2.b);
    EXPECT_EQ(t.u8, t2.u8);
    EXPECT_EQ(t.i8, t2.i8);
    EXPECT_EQ(t.s, t2.s);
    EXPECT_EQ(t.us, t2.us);
    EXPECT_EQ(t.i, t2.i);
    EXPECT_EQ(t.u, t2.u);
    EXPECT_EQ(t.ll, t2.ll);
    EXPECT_EQ(t.ull, t2.ull);
    EXPECT_DOUBLE_EQ(t.d, t2.d);
    EXPECT_EQ(t.str, t2.str);
    EXPECT_EQ(t.opt_i, t2.opt_i);
    EXPECT_EQ(t.vec_i, t2.vec_i);
}

TEST(ReflectTest, RenamedMembersUseWireKeys)
{
    reflect::scalar_record t;
    t.opt_i = 7;
    t.vec_i = {9};
    const std::string json = reflect::serialize_struct(t);
    EXPECT_NE(json.find("\"optI\":7"), std::string::npos);
    EXPECT_NE(json.find("\"vecI\":[9]"), std::string::npos);
    EXPECT_EQ(json.find("opt_i"), std::string::npos);
}

TEST(ReflectTest, EmptyOptionalIsOmitted)
{
    reflect::scalar_record t;
    const std::string json = reflect::serialize_struct(t);
    EXPECT_EQ(json.find("optI"), std::string::npos);

    reflect::scalar_record t2;
    t2.opt_i = 5;
    ASSERT_TRUE(reflect::deserialize_struct(t2, json));
    EXPECT_EQ(t2.opt_i, 5);
}

TEST(ReflectTest, OptionalExplicitNull)
{
    reflect::scalar_record t;
    t.opt_i = 1;
    ASSERT_TRUE(reflect::deserialize_struct(t, R"({"optI": null})"));
    EXPECT_FALSE(t.opt_i.has_value());
}

TEST(ReflectTest, MissingMembersKeepDefaults)
{
    reflect::scalar_record t;
    t.str = "kept";
    ASSERT_TRUE(reflect::deserialize_struct(t, R"({"i": 3})"));
    EXPECT_EQ(t.i, 3);
    EXPECT_EQ(t.str, "kept");
}

TEST(ReflectTest, InvalidJson)
{
    reflect::scalar_record t;
    EXPECT_FALSE(reflect::deserialize_struct(t, "{invalid"));
}

TEST(ReflectTest, TypeMismatchReportsPath)
{
    rapidjson::Document doc;
    doc.Parse(R"({"name": "n", "items": [{"i": 1}, {"i": "two"}]})");
    ASSERT_FALSE(doc.HasParseError());

    reflect::nested_record r;
    const auto invalid_path = reflect::deserialize_value(r, doc);
    ASSERT_TRUE(invalid_path.has_value());
    EXPECT_EQ(*invalid_path, "/items/1/i");
}

TEST(ReflectTest, OutOfRangeIntegerRejected)
{
    reflect::scalar_record t;
    EXPECT_FALSE(reflect::deserialize_struct(t, R"({"u8": 256})"));
    EXPECT_FALSE(reflect::deserialize_struct(t, R"({"us": -1})"));
    EXPECT_FALSE(reflect::deserialize_struct(t, R"({"i8": -129})"));
}

TEST(ReflectTest, RootMustBeObject)
{
    rapidjson::Document doc;
    doc.Parse("[1]");
    reflect::nested_record r;
    const auto invalid_path = reflect::deserialize_value(r, doc);
    ASSERT_TRUE(invalid_path.has_value());
    EXPECT_EQ(*invalid_path, "/");
}

TEST(ReflectTest, PathEscapesPointerTokens)
{
    rapidjson::Document doc;
    doc.Parse(R"({"a/b~c": "x"})");
    reflect::slashed_record r;
    const auto invalid_path = reflect::deserialize_value(r, doc);
    ASSERT_TRUE(invalid_path.has_value());
    EXPECT_EQ(*invalid_path, "/a~1b~0c");
}

}    // namespace xnode
