#include <cstdint>
#include <string_view>

#include <rapidjson/document.h>

#include "api_config.h"

namespace xnode
{

namespace
{

using allocator_t = rapidjson::Document::AllocatorType;

rapidjson::Value string_value(const std::string_view value, allocator_t& alloc)
{
    rapidjson::Value out;
    out.SetString(value.data(), static_cast<rapidjson::SizeType>(value.size()), alloc);
    return out;
}

bool member_equals(const rapidjson::Value& object, const char* name, const std::string_view expected)
{
    if (!object.IsObject())
    {
        return false;
    }
    const auto it = object.FindMember(name);
    if (it == object.MemberEnd() || !it->value.IsString())
    {
        return false;
    }
    return std::string_view(it->value.GetString(), it->value.GetStringLength()) == expected;
}

// Replaces member name with an empty value of the given type unless it already has that type.
rapidjson::Value& ensure_member(rapidjson::Value& object, const char* name, const rapidjson::Type type, allocator_t& alloc)
{
    auto it = object.FindMember(name);
    if (it != object.MemberEnd())
    {
        const bool matches = (type == rapidjson::kArrayType && it->value.IsArray()) || (type == rapidjson::kObjectType && it->value.IsObject());
        if (!matches)
        {
            it->value = rapidjson::Value(type);
        }
        return it->value;
    }
    object.AddMember(rapidjson::Value(name, alloc), rapidjson::Value(type), alloc);
    return object.FindMember(name)->value;
}

void add_api_inbound(rapidjson::Document& doc, const std::uint16_t api_port)
{
    auto& alloc = doc.GetAllocator();
    auto& inbounds = ensure_member(doc, "inbounds", rapidjson::kArrayType, alloc);
    for (const auto& inbound : inbounds.GetArray())
    {
        if (member_equals(inbound, "tag", kApiTag))
        {
            return;
        }
    }

    rapidjson::Value settings(rapidjson::kObjectType);
    settings.AddMember("address", "127.0.0.1", alloc);

    rapidjson::Value inbound(rapidjson::kObjectType);
    inbound.AddMember("tag", string_value(kApiTag, alloc), alloc);
    inbound.AddMember("port", static_cast<unsigned>(api_port), alloc);
    inbound.AddMember("listen", "127.0.0.1", alloc);
    inbound.AddMember("protocol", "dokodemo-door", alloc);
    inbound.AddMember("settings", settings, alloc);
    inbounds.PushBack(inbound, alloc);
}

void add_api_rule(rapidjson::Document& doc)
{
    auto& alloc = doc.GetAllocator();
    auto& routing = ensure_member(doc, "routing", rapidjson::kObjectType, alloc);
    auto& rules = ensure_member(routing, "rules", rapidjson::kArrayType, alloc);
    for (const auto& rule : rules.GetArray())
    {
        if (member_equals(rule, "outboundTag", kApiTag))
        {
            return;
        }
    }

    rapidjson::Value inbound_tags(rapidjson::kArrayType);
    inbound_tags.PushBack(string_value(kApiTag, alloc), alloc);

    rapidjson::Value rule(rapidjson::kObjectType);
    rule.AddMember("type", "field", alloc);
    rule.AddMember("outboundTag", string_value(kApiTag, alloc), alloc);
    rule.AddMember("inboundTag", inbound_tags, alloc);

    // The api rule must win over every panel rule, so it goes first.
    rapidjson::Value reordered(rapidjson::kArrayType);
    reordered.PushBack(rule, alloc);
    for (auto& existing : rules.GetArray())
    {
        reordered.PushBack(existing, alloc);
    }
    rules = reordered;
}

void add_api_sections(rapidjson::Document& doc)
{
    auto& alloc = doc.GetAllocator();
    if (!doc.HasMember("api"))
    {
        rapidjson::Value services(rapidjson::kArrayType);
        for (const char* service : {"HandlerService", "LoggerService", "StatsService"})
        {
            services.PushBack(rapidjson::StringRef(service), alloc);
        }
        rapidjson::Value api(rapidjson::kObjectType);
        api.AddMember("services", services, alloc);
        api.AddMember("tag", string_value(kApiTag, alloc), alloc);
        doc.AddMember("api", api, alloc);
    }
    if (!doc.HasMember("stats"))
    {
        doc.AddMember("stats", rapidjson::Value(rapidjson::kObjectType), alloc);
    }
}

}    // namespace

rapidjson::Document generate_api_config(const rapidjson::Value& config, const std::uint16_t api_port)
{
    rapidjson::Document doc;
    if (config.IsObject())
    {
        doc.CopyFrom(config, doc.GetAllocator());
    }
    else
    {
        doc.SetObject();
    }

    add_api_inbound(doc, api_port);
    add_api_rule(doc);
    add_api_sections(doc);
    return doc;
}

}    // namespace xnode
