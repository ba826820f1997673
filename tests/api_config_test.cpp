#include <string>

#include <rapidjson/document.h>

#include <gtest/gtest.h>

#include "api_config.h"

namespace xnode
{

namespace
{

rapidjson::Document parse(const char* json)
{
    rapidjson::Document doc;
    doc.Parse(json);
    EXPECT_FALSE(doc.HasParseError());
    return doc;
}

int count_tagged(const rapidjson::Value& array, const char* key, const char* value)
{
    int count = 0;
    for (const auto& item : array.GetArray())
    {
        if (item.IsObject() && item.HasMember(key) && item[key].IsString() && std::string(item[key].GetString()) == value)
        {
            ++count;
        }
    }
    return count;
}

}    // namespace

TEST(ApiConfigTest, EmptyConfigGetsEverything)
{
    const auto input = parse("{}");
    const auto out = generate_api_config(input, 61012);

    ASSERT_TRUE(out.IsObject());
    ASSERT_TRUE(out["inbounds"].IsArray());
    ASSERT_EQ(out["inbounds"].Size(), 1U);
    const auto& inbound = out["inbounds"][0];
    EXPECT_STREQ(inbound["tag"].GetString(), "api");
    EXPECT_EQ(inbound["port"].GetUint(), 61012U);
    EXPECT_STREQ(inbound["listen"].GetString(), "127.0.0.1");
    EXPECT_STREQ(inbound["protocol"].GetString(), "dokodemo-door");
    EXPECT_STREQ(inbound["settings"]["address"].GetString(), "127.0.0.1");

    const auto& rules = out["routing"]["rules"];
    ASSERT_EQ(rules.Size(), 1U);
    EXPECT_STREQ(rules[0]["outboundTag"].GetString(), "api");
    EXPECT_STREQ(rules[0]["inboundTag"][0].GetString(), "api");
    EXPECT_STREQ(rules[0]["type"].GetString(), "field");

    ASSERT_TRUE(out["api"].IsObject());
    EXPECT_STREQ(out["api"]["tag"].GetString(), "api");
    ASSERT_EQ(out["api"]["services"].Size(), 3U);
    EXPECT_STREQ(out["api"]["services"][0].GetString(), "HandlerService");
    EXPECT_STREQ(out["api"]["services"][2].GetString(), "StatsService");
    EXPECT_TRUE(out["stats"].IsObject());
}

TEST(ApiConfigTest, PanelInboundsAndRulesArePreserved)
{
    const auto input = parse(R"({
      "inbounds": [{"tag": "vless-in", "protocol": "vless", "port": 443}],
      "routing": {"domainStrategy": "AsIs", "rules": [{"type": "field", "ip": ["geoip:private"], "outboundTag": "block"}]}
    })");
    const auto out = generate_api_config(input, 9000);

    ASSERT_EQ(out["inbounds"].Size(), 2U);
    EXPECT_STREQ(out["inbounds"][0]["tag"].GetString(), "vless-in");
    EXPECT_STREQ(out["inbounds"][1]["tag"].GetString(), "api");
    EXPECT_EQ(out["inbounds"][1]["port"].GetUint(), 9000U);

    const auto& rules = out["routing"]["rules"];
    ASSERT_EQ(rules.Size(), 2U);
    EXPECT_STREQ(rules[0]["outboundTag"].GetString(), "api");
    EXPECT_STREQ(rules[1]["outboundTag"].GetString(), "block");
    EXPECT_STREQ(out["routing"]["domainStrategy"].GetString(), "AsIs");
}

TEST(ApiConfigTest, InputIsNotModified)
{
    const auto input = parse(R"({"inbounds": []})");
    const auto out = generate_api_config(input, 1);
    EXPECT_EQ(input["inbounds"].Size(), 0U);
    EXPECT_FALSE(input.HasMember("api"));
    EXPECT_EQ(out["inbounds"].Size(), 1U);
}

TEST(ApiConfigTest, ExistingApiPiecesAreNotDuplicated)
{
    const auto input = parse(R"({
      "inbounds": [{"tag": "api", "port": 10085, "protocol": "dokodemo-door"}],
      "routing": {"rules": [{"type": "field", "outboundTag": "block"}, {"type": "field", "inboundTag": ["api"], "outboundTag": "api"}]},
      "api": {"tag": "api", "services": ["StatsService"]},
      "stats": {"custom": true}
    })");
    const auto out = generate_api_config(input, 61012);

    ASSERT_EQ(out["inbounds"].Size(), 1U);
    EXPECT_EQ(out["inbounds"][0]["port"].GetUint(), 10085U);
    EXPECT_EQ(count_tagged(out["routing"]["rules"], "outboundTag", "api"), 1);
    EXPECT_STREQ(out["routing"]["rules"][0]["outboundTag"].GetString(), "block");
    EXPECT_EQ(out["api"]["services"].Size(), 1U);
    EXPECT_TRUE(out["stats"]["custom"].GetBool());
}

TEST(ApiConfigTest, ApplyingTwiceIsStable)
{
    const auto input = parse(R"({"inbounds": [{"tag": "trojan-in"}]})");
    const auto once = generate_api_config(input, 61012);
    const auto twice = generate_api_config(once, 61012);
    EXPECT_TRUE(static_cast<const rapidjson::Value&>(once) == static_cast<const rapidjson::Value&>(twice));
}

TEST(ApiConfigTest, WrongTypedSectionsAreReplaced)
{
    const auto input = parse(R"({"inbounds": {"tag": "x"}, "routing": {"rules": "none"}})");
    const auto out = generate_api_config(input, 61012);
    ASSERT_TRUE(out["inbounds"].IsArray());
    EXPECT_EQ(count_tagged(out["inbounds"], "tag", "api"), 1);
    ASSERT_TRUE(out["routing"]["rules"].IsArray());
    EXPECT_EQ(out["routing"]["rules"].Size(), 1U);
}

TEST(ApiConfigTest, NonObjectInputBecomesObject)
{
    const auto input = parse("[1, 2]");
    const auto out = generate_api_config(input, 61012);
    ASSERT_TRUE(out.IsObject());
    EXPECT_EQ(count_tagged(out["inbounds"], "tag", "api"), 1);
}

}    // namespace xnode
