#include <gtest/gtest.h>

#include "acerelay/util/JsonUtil.hpp"

#include <boost/json.hpp>

#include <cstdint>

using acerelay::util::getBool;
using acerelay::util::getInt;
using acerelay::util::getString;

namespace {

boost::json::object parseObject(const char* text) {
    return boost::json::parse(text).as_object();
}

} // namespace

TEST(JsonUtilTest, GetIntAcceptsWholeNumbers) {
    auto obj = parseObject(R"({"a":7,"b":-3,"c":12.9,"d":"7"})");
    EXPECT_EQ(getInt(obj, "a"), 7);
    EXPECT_EQ(getInt(obj, "b"), -3);
    EXPECT_EQ(getInt(obj, "c"), 12);
    EXPECT_FALSE(getInt(obj, "d").has_value());
    EXPECT_FALSE(getInt(obj, "missing").has_value());
}

// Values that do not fit an int64 are treated as absent.
TEST(JsonUtilTest, GetIntRejectsOutOfRange) {
    auto obj = parseObject(R"({"big":1e300,"small":-1e300,"edge":9223372036854775808.0,"unsigned":18446744073709551615})");
    EXPECT_FALSE(getInt(obj, "big").has_value());
    EXPECT_FALSE(getInt(obj, "small").has_value());
    EXPECT_FALSE(getInt(obj, "edge").has_value());
    EXPECT_FALSE(getInt(obj, "unsigned").has_value());
}

TEST(JsonUtilTest, GetStringAndBoolCheckTypes) {
    auto obj = parseObject(R"({"s":"x","n":1,"t":true})");
    EXPECT_EQ(getString(obj, "s"), "x");
    EXPECT_FALSE(getString(obj, "n").has_value());
    EXPECT_EQ(getBool(obj, "t"), true);
    EXPECT_EQ(getBool(obj, "n"), true);
    EXPECT_FALSE(getBool(obj, "s").has_value());
}
