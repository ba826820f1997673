#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <initializer_list>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "error.h"
#include "reflect.h"
#include "accounts.h"
#include "config_sync.h"
#include "node_messages.h"

namespace xnode
{

namespace
{

// Every response body is wrapped as {"response": ...}.
template <typename T>
struct envelope
{
    T response;
};

}    // namespace

}    // namespace xnode

namespace reflect
{

template <typename Vis, typename T>
void reflect(Vis& vis, xnode::envelope<T>& v)
{
    member_start(vis);
    member(vis, "response", v.response);
    member_end(vis);
}

REFLECT_STRUCT_BEGIN(xnode::inbound_fingerprint)
REFLECT_MEMBER(tag);
REFLECT_MEMBER_AS(fingerprint, "hash");
REFLECT_MEMBER_AS(member_count, "usersCount");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::restart_signal)
REFLECT_MEMBER_AS(base_config_fingerprint, "emptyConfig");
REFLECT_MEMBER(inbounds);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::add_user_entry)
REFLECT_MEMBER(tag);
REFLECT_MEMBER(username);
REFLECT_MEMBER(type);
REFLECT_MEMBER(uuid);
REFLECT_MEMBER(flow);
REFLECT_MEMBER(password);
REFLECT_MEMBER_AS(cipher_type, "cipherType");
REFLECT_MEMBER_AS(iv_check, "ivCheck");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::add_user_hashes)
REFLECT_MEMBER_AS(vless_uuid, "vlessUuid");
REFLECT_MEMBER_AS(prev_vless_uuid, "prevVlessUuid");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::add_user_request)
REFLECT_MEMBER(data);
REFLECT_MEMBER_AS(hash_data, "hashData");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::user_data)
REFLECT_MEMBER_AS(user_id, "userId");
REFLECT_MEMBER_AS(hash_uuid, "hashUuid");
REFLECT_MEMBER_AS(vless_uuid, "vlessUuid");
REFLECT_MEMBER_AS(trojan_password, "trojanPassword");
REFLECT_MEMBER_AS(ss_password, "ssPassword");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::bulk_inbound_entry)
REFLECT_MEMBER(tag);
REFLECT_MEMBER(type);
REFLECT_MEMBER(flow);
REFLECT_MEMBER_AS(cipher_type, "cipherType");
REFLECT_MEMBER_AS(iv_check, "ivCheck");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::bulk_user_entry)
REFLECT_MEMBER_AS(user, "userData");
REFLECT_MEMBER_AS(inbounds, "inboundData");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::add_users_request)
REFLECT_MEMBER_AS(affected_inbound_tags, "affectedInboundTags");
REFLECT_MEMBER(users);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::remove_user_hashes)
REFLECT_MEMBER_AS(vless_uuid, "vlessUuid");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::remove_user_request)
REFLECT_MEMBER(username);
REFLECT_MEMBER_AS(hash_data, "hashData");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::bulk_remove_entry)
REFLECT_MEMBER_AS(user_id, "userId");
REFLECT_MEMBER_AS(hash_uuid, "hashUuid");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::remove_users_request)
REFLECT_MEMBER(users);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::node_info)
REFLECT_MEMBER(version);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::start_response)
REFLECT_MEMBER_AS(is_started, "isStarted");
REFLECT_MEMBER(version);
REFLECT_MEMBER_AS(error_message, "error");
REFLECT_MEMBER_AS(node, "nodeInfo");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::stop_response)
REFLECT_MEMBER_AS(is_stopped, "isStopped");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::status_response)
REFLECT_MEMBER_AS(is_running, "isRunning");
REFLECT_MEMBER(version);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::healthcheck_response)
REFLECT_MEMBER_AS(is_healthy, "isHealthy");
REFLECT_MEMBER_AS(is_engine_running, "isXrayRunning");
REFLECT_MEMBER_AS(engine_version, "xrayVersion");
REFLECT_MEMBER_AS(node_version, "nodeVersion");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::user_op_response)
REFLECT_MEMBER(success);
REFLECT_MEMBER_AS(error_message, "error");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::user_traffic)
REFLECT_MEMBER(username);
REFLECT_MEMBER(uplink);
REFLECT_MEMBER(downlink);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::users_stats_response)
REFLECT_MEMBER(users);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::reset_request)
REFLECT_MEMBER(reset);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::username_request)
REFLECT_MEMBER(username);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::tag_reset_request)
REFLECT_MEMBER(tag);
REFLECT_MEMBER(reset);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::block_ip_request)
REFLECT_MEMBER(ip);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::system_stats_response)
REFLECT_MEMBER(uptime);
REFLECT_MEMBER_AS(num_threads, "numThreads");
REFLECT_MEMBER(rss);
REFLECT_MEMBER_AS(open_fds, "openFds");
REFLECT_MEMBER_AS(user_cpu_ms, "userCpuMs");
REFLECT_MEMBER_AS(system_cpu_ms, "systemCpuMs");
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::user_online_response)
REFLECT_MEMBER(online);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::inbound_traffic)
REFLECT_MEMBER(inbound);
REFLECT_MEMBER(uplink);
REFLECT_MEMBER(downlink);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::outbound_traffic)
REFLECT_MEMBER(outbound);
REFLECT_MEMBER(uplink);
REFLECT_MEMBER(downlink);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::all_inbounds_stats_response)
REFLECT_MEMBER(inbounds);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::all_outbounds_stats_response)
REFLECT_MEMBER(outbounds);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::combined_stats_response)
REFLECT_MEMBER(inbounds);
REFLECT_MEMBER(outbounds);
REFLECT_STRUCT_END()

}    // namespace reflect

namespace xnode
{

namespace
{

template <typename T>
std::string wrap_response(const T& response)
{
    const envelope<T> wrapped{.response = response};
    return reflect::serialize_struct(wrapped);
}

error invalid_body(const std::string& reason) { return make_error(error_kind::invalid_argument, "invalid request body: " + reason); }

result<void> parse_document(rapidjson::Document& doc, const std::string& body)
{
    doc.Parse(body.data(), body.size());
    if (doc.HasParseError())
    {
        return std::unexpected(invalid_body("invalid json at offset " + std::to_string(doc.GetErrorOffset()) + " " + rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject())
    {
        return std::unexpected(invalid_body("root must be an object"));
    }
    return {};
}

result<void> require_member(const rapidjson::Value& object, const char* name)
{
    if (!object.HasMember(name))
    {
        return std::unexpected(invalid_body(std::string("/") + name + " is required"));
    }
    return {};
}

result<void> require_value(const std::string& value, const std::string& path)
{
    if (value.empty())
    {
        return std::unexpected(invalid_body(path + " is required"));
    }
    return {};
}

template <typename T>
result<T> decode(rapidjson::Document& doc, std::initializer_list<const char*> required)
{
    for (const char* name : required)
    {
        if (auto present = require_member(doc, name); !present)
        {
            return std::unexpected(present.error());
        }
    }

    T out;
    if (const auto invalid_path = reflect::deserialize_value(out, doc); invalid_path.has_value())
    {
        return std::unexpected(invalid_body(*invalid_path + " type mismatch"));
    }
    return out;
}

}    // namespace

result<start_request> parse_start_request(const std::string& body)
{
    rapidjson::Document doc;
    if (auto parsed = parse_document(doc, body); !parsed)
    {
        return std::unexpected(parsed.error());
    }

    const auto config = doc.FindMember("xrayConfig");
    if (config == doc.MemberEnd() || !config->value.IsObject())
    {
        return std::unexpected(invalid_body("/xrayConfig must be an object"));
    }
    auto internals = doc.FindMember("internals");
    if (internals == doc.MemberEnd() || !internals->value.IsObject())
    {
        return std::unexpected(invalid_body("/internals must be an object"));
    }

    start_request request;
    request.engine_config = std::make_shared<rapidjson::Document>();
    request.engine_config->CopyFrom(config->value, request.engine_config->GetAllocator());

    if (const auto force = internals->value.FindMember("forceRestart"); force != internals->value.MemberEnd())
    {
        if (!force->value.IsBool())
        {
            return std::unexpected(invalid_body("/internals/forceRestart type mismatch"));
        }
        request.force_restart = force->value.GetBool();
    }

    if (auto hashes = internals->value.FindMember("hashes"); hashes != internals->value.MemberEnd())
    {
        if (const auto invalid_path = reflect::deserialize_value(request.hashes, hashes->value); invalid_path.has_value())
        {
            return std::unexpected(invalid_body("/internals/hashes" + *invalid_path + " type mismatch"));
        }
    }
    return request;
}

result<add_user_request> parse_add_user_request(const std::string& body)
{
    rapidjson::Document doc;
    if (auto parsed = parse_document(doc, body); !parsed)
    {
        return std::unexpected(parsed.error());
    }
    auto request = decode<add_user_request>(doc, {"data"});
    if (!request)
    {
        return request;
    }

    for (std::size_t i = 0; i < request->data.size(); ++i)
    {
        const auto& entry = request->data[i];
        const std::string path = "/data/" + std::to_string(i);
        for (const auto& [value, name] : {std::pair{&entry.tag, "/tag"}, std::pair{&entry.username, "/username"}, std::pair{&entry.type, "/type"}})
        {
            if (auto present = require_value(*value, path + name); !present)
            {
                return std::unexpected(present.error());
            }
        }
    }
    return request;
}

result<add_users_request> parse_add_users_request(const std::string& body)
{
    rapidjson::Document doc;
    if (auto parsed = parse_document(doc, body); !parsed)
    {
        return std::unexpected(parsed.error());
    }
    auto request = decode<add_users_request>(doc, {"users"});
    if (!request)
    {
        return request;
    }

    for (std::size_t i = 0; i < request->users.size(); ++i)
    {
        const auto& entry = request->users[i];
        const std::string path = "/users/" + std::to_string(i);
        if (auto present = require_value(entry.user.user_id, path + "/userData/userId"); !present)
        {
            return std::unexpected(present.error());
        }
        for (std::size_t j = 0; j < entry.inbounds.size(); ++j)
        {
            const std::string inbound_path = path + "/inboundData/" + std::to_string(j);
            if (auto present = require_value(entry.inbounds[j].tag, inbound_path + "/tag"); !present)
            {
                return std::unexpected(present.error());
            }
            if (auto present = require_value(entry.inbounds[j].type, inbound_path + "/type"); !present)
            {
                return std::unexpected(present.error());
            }
        }
    }
    return request;
}

result<remove_user_request> parse_remove_user_request(const std::string& body)
{
    rapidjson::Document doc;
    if (auto parsed = parse_document(doc, body); !parsed)
    {
        return std::unexpected(parsed.error());
    }
    auto request = decode<remove_user_request>(doc, {"username"});
    if (!request)
    {
        return request;
    }
    if (auto present = require_value(request->username, "/username"); !present)
    {
        return std::unexpected(present.error());
    }
    return request;
}

result<remove_users_request> parse_remove_users_request(const std::string& body)
{
    rapidjson::Document doc;
    if (auto parsed = parse_document(doc, body); !parsed)
    {
        return std::unexpected(parsed.error());
    }
    auto request = decode<remove_users_request>(doc, {"users"});
    if (!request)
    {
        return request;
    }
    for (std::size_t i = 0; i < request->users.size(); ++i)
    {
        if (auto present = require_value(request->users[i].user_id, "/users/" + std::to_string(i) + "/userId"); !present)
        {
            return std::unexpected(present.error());
        }
    }
    return request;
}

result<username_request> parse_username_request(const std::string& body)
{
    rapidjson::Document doc;
    if (auto parsed = parse_document(doc, body); !parsed)
    {
        return std::unexpected(parsed.error());
    }
    auto request = decode<username_request>(doc, {"username"});
    if (!request)
    {
        return request;
    }
    if (auto present = require_value(request->username, "/username"); !present)
    {
        return std::unexpected(present.error());
    }
    return request;
}

result<tag_reset_request> parse_tag_reset_request(const std::string& body)
{
    rapidjson::Document doc;
    if (auto parsed = parse_document(doc, body); !parsed)
    {
        return std::unexpected(parsed.error());
    }
    auto request = decode<tag_reset_request>(doc, {"tag"});
    if (!request)
    {
        return request;
    }
    if (auto present = require_value(request->tag, "/tag"); !present)
    {
        return std::unexpected(present.error());
    }
    return request;
}

result<block_ip_request> parse_block_ip_request(const std::string& body)
{
    rapidjson::Document doc;
    if (auto parsed = parse_document(doc, body); !parsed)
    {
        return std::unexpected(parsed.error());
    }
    auto request = decode<block_ip_request>(doc, {"ip"});
    if (!request)
    {
        return request;
    }
    if (auto present = require_value(request->ip, "/ip"); !present)
    {
        return std::unexpected(present.error());
    }
    return request;
}

reset_request parse_reset_request(const std::string& body)
{
    rapidjson::Document doc;
    if (!parse_document(doc, body))
    {
        return {};
    }
    auto request = decode<reset_request>(doc, {});
    if (!request)
    {
        return {};
    }
    return *request;
}

std::string to_json(const start_response& response) { return wrap_response(response); }

std::string to_json(const stop_response& response) { return wrap_response(response); }

std::string to_json(const status_response& response) { return wrap_response(response); }

std::string to_json(const healthcheck_response& response) { return wrap_response(response); }

std::string to_json(const user_op_response& response) { return wrap_response(response); }

std::string to_json(const users_stats_response& response) { return wrap_response(response); }

std::string to_json(const system_stats_response& response) { return wrap_response(response); }

std::string to_json(const user_online_response& response) { return wrap_response(response); }

std::string to_json(const inbound_traffic& response) { return wrap_response(response); }

std::string to_json(const outbound_traffic& response) { return wrap_response(response); }

std::string to_json(const all_inbounds_stats_response& response) { return wrap_response(response); }

std::string to_json(const all_outbounds_stats_response& response) { return wrap_response(response); }

std::string to_json(const combined_stats_response& response) { return wrap_response(response); }

}    // namespace xnode
