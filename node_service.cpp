#include <map>
#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <functional>
#include <string_view>

#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

#include <rapidjson/writer.h>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>

#include "log.h"
#include "error.h"
#include "digest.h"
#include "engine.h"
#include "accounts.h"
#include "constants.h"
#include "user_sync.h"
#include "api_config.h"
#include "config_sync.h"
#include "log_context.h"
#include "node_service.h"
#include "engine_handle.h"
#include "node_messages.h"
#include "process_stats.h"

namespace xnode
{

namespace
{

std::string serialize_config(const rapidjson::Document& doc)
{
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
    doc.Accept(writer);
    return std::string(sb.GetString(), sb.GetSize());
}

struct traffic_pair
{
    std::int64_t uplink = 0;
    std::int64_t downlink = 0;
};

// Splits "SCOPE>>>TAG>>>traffic>>>DIRECTION". False for any other layout,
// which keeps online counters out of traffic totals.
bool split_traffic_counter(const std::string_view name, std::string_view& tag, std::string_view& direction)
{
    constexpr std::string_view kSep = constants::stats::kSeparator;
    std::vector<std::string_view> parts;
    std::size_t begin = 0;
    for (;;)
    {
        const auto pos = name.find(kSep, begin);
        if (pos == std::string_view::npos)
        {
            parts.push_back(name.substr(begin));
            break;
        }
        parts.push_back(name.substr(begin, pos - begin));
        begin = pos + kSep.size();
    }
    if (parts.size() < 4 || parts[2] != constants::stats::kTraffic)
    {
        return false;
    }
    tag = parts[1];
    direction = parts[3];
    return true;
}

// Per tag totals of every traffic counter under scope. Only traffic counters
// are reset.
std::map<std::string, traffic_pair, std::less<>> collect_traffic(stats_registry& stats, const std::string_view scope, const bool reset)
{
    const auto prefix = std::string(scope) + std::string(constants::stats::kSeparator);
    std::map<std::string, traffic_pair, std::less<>> totals;
    for (const auto& counter : stats.query_prefix(prefix, false))
    {
        std::string_view tag;
        std::string_view direction;
        if (!split_traffic_counter(counter.name, tag, direction))
        {
            continue;
        }
        const auto value = stats.value(counter.name, reset).value_or(0);
        auto it = totals.find(tag);
        if (it == totals.end())
        {
            it = totals.emplace(std::string(tag), traffic_pair{}).first;
        }
        if (direction == constants::stats::kUplink)
        {
            it->second.uplink = value;
        }
        else if (direction == constants::stats::kDownlink)
        {
            it->second.downlink = value;
        }
    }
    return totals;
}

traffic_pair tag_traffic(stats_registry& stats, const std::string_view scope, const std::string& tag, const bool reset)
{
    const auto name = [&](const std::string_view direction)
    {
        std::string out(scope);
        out.append(constants::stats::kSeparator).append(tag);
        out.append(constants::stats::kSeparator).append(constants::stats::kTraffic);
        out.append(constants::stats::kSeparator).append(direction);
        return out;
    };
    // missing counters read as zero
    return traffic_pair{.uplink = stats.value(name(constants::stats::kUplink), reset).value_or(0),
                        .downlink = stats.value(name(constants::stats::kDownlink), reset).value_or(0)};
}

std::vector<inbound_traffic> to_inbounds(const std::map<std::string, traffic_pair, std::less<>>& totals)
{
    std::vector<inbound_traffic> out;
    out.reserve(totals.size());
    for (const auto& [tag, traffic] : totals)
    {
        out.push_back(inbound_traffic{.inbound = tag, .uplink = traffic.uplink, .downlink = traffic.downlink});
    }
    return out;
}

std::vector<outbound_traffic> to_outbounds(const std::map<std::string, traffic_pair, std::less<>>& totals)
{
    std::vector<outbound_traffic> out;
    out.reserve(totals.size());
    for (const auto& [tag, traffic] : totals)
    {
        out.push_back(outbound_traffic{.outbound = tag, .uplink = traffic.uplink, .downlink = traffic.downlink});
    }
    return out;
}

result<std::string> block_rule_tag(const std::string& ip)
{
    boost::system::error_code ec;
    boost::asio::ip::make_address(ip, ec);
    if (ec)
    {
        return std::unexpected(make_error(error_kind::invalid_argument, "invalid IP address format"));
    }
    return md5_hex(ip);
}

}    // namespace

node_service::node_service(engine_handle& engine, config_sync& mirror, user_sync& users, const std::uint16_t api_port)
    : engine_(engine), mirror_(mirror), users_(users), api_port_(api_port), created_at_(std::chrono::steady_clock::now())
{
}

start_response node_service::started_response() const
{
    start_response response;
    response.is_started = true;
    response.version = engine_.version();
    response.node.version = std::string(constants::version::kNode);
    return response;
}

result<void> node_service::require_running() const
{
    if (!engine_.is_running())
    {
        return std::unexpected(make_error(error_kind::not_running, "engine not running"));
    }
    return {};
}

result<start_response> node_service::start(const start_request& request)
{
    request_context ctx(log_event::kStart);

    const auto flight = start_flight_.try_enter();
    if (!flight.has_value())
    {
        LOG_CTX_WARN(ctx, "start already in progress rejecting duplicate");
        return std::unexpected(make_error(error_kind::conflict, "another start request is already in progress"));
    }

    const std::scoped_lock lock(start_mutex_);

    if (engine_.is_running() && !request.force_restart)
    {
        if (!mirror_.is_restart_needed(request.hashes))
        {
            LOG_CTX_INFO(ctx, "engine up to date {} ms", ctx.elapsed_ms());
            return started_response();
        }
        LOG_CTX_INFO(ctx, "restart required");
    }

    if (request.engine_config == nullptr)
    {
        return std::unexpected(make_error(error_kind::invalid_argument, "missing engine configuration"));
    }

    auto augmented = std::make_shared<rapidjson::Document>(generate_api_config(*request.engine_config, api_port_));
    const auto payload = serialize_config(*augmented);

    if (auto started = engine_.start(payload); !started)
    {
        // The handle is left stopped, so the mirror must not claim a live config.
        mirror_.cleanup();
        LOG_CTX_ERROR(ctx, "engine start failed {}", started.error().reason);
        return std::unexpected(wrap_error("failed to start engine", started.error()));
    }

    if (auto extracted = mirror_.extract_users(request.hashes, std::move(augmented)); !extracted)
    {
        LOG_CTX_ERROR(ctx, "user extraction failed {}", extracted.error().reason);
        return std::unexpected(wrap_error("failed to extract users", extracted.error()));
    }

    install_blocked_rules();

    LOG_CTX_INFO(ctx, "engine {} started in {} ms", engine_.version(), ctx.elapsed_ms());
    return started_response();
}

result<stop_response> node_service::stop()
{
    request_context ctx(log_event::kStop);
    const std::scoped_lock lock(start_mutex_);

    if (auto stopped = engine_.stop(); !stopped)
    {
        LOG_CTX_ERROR(ctx, "engine stop failed {}", stopped.error().reason);
        return std::unexpected(stopped.error());
    }

    mirror_.cleanup();
    LOG_CTX_INFO(ctx, "engine stopped and mirror cleared");
    return stop_response{.is_stopped = true};
}

status_response node_service::status() const
{
    status_response response;
    response.is_running = engine_.is_running();
    if (response.is_running)
    {
        response.version = engine_.version();
    }
    return response;
}

healthcheck_response node_service::healthcheck() const
{
    healthcheck_response response;
    response.is_engine_running = engine_.is_running();
    if (response.is_engine_running)
    {
        response.engine_version = engine_.version();
    }
    response.node_version = std::string(constants::version::kNode);
    return response;
}

result<void> node_service::add_user(const add_user_request& request)
{
    request_context ctx(log_event::kAddUser);

    if (request.data.empty())
    {
        return std::unexpected(make_error(error_kind::invalid_argument, "no inbound data provided"));
    }
    if (auto running = require_running(); !running)
    {
        return running;
    }

    const auto& username = request.data.front().username;
    ctx.user(username);

    const auto tags = mirror_.tracked_tags();
    users_.remove_user_from_all_inbounds(tags, username);

    const auto& stale_hash = request.hash_data.prev_vless_uuid.empty() ? request.hash_data.vless_uuid : request.hash_data.prev_vless_uuid;
    if (!stale_hash.empty())
    {
        for (const auto& tag : tags)
        {
            mirror_.remove_user_from_inbound(tag, stale_hash);
        }
    }

    for (const auto& entry : request.data)
    {
        user_data user;
        user.user_id = entry.username;
        user.vless_uuid = entry.uuid;
        if (entry.type == protocol::kTrojan)
        {
            user.trojan_password = entry.password;
        }
        else if (entry.type == protocol::kShadowsocks)
        {
            user.ss_password = entry.password;
        }

        inbound_user_data inbound;
        inbound.type = entry.type;
        inbound.tag = entry.tag;
        inbound.flow = entry.flow;
        inbound.cipher = parse_cipher_type(entry.cipher_type);
        inbound.iv_check = entry.iv_check;

        const auto account = build_user_for_inbound(inbound, user);
        if (!account.has_value())
        {
            LOG_CTX_ERROR(ctx.with_inbound(entry.tag), "unsupported inbound type {} skipped", entry.type);
            continue;
        }

        if (auto added = users_.add_user(entry.tag, *account); !added)
        {
            LOG_CTX_ERROR(ctx.with_inbound(entry.tag), "add failed {}", added.error().reason);
            return std::unexpected(wrap_error("failed to add user", added.error()));
        }
    }

    if (!request.hash_data.vless_uuid.empty())
    {
        for (const auto& entry : request.data)
        {
            mirror_.add_user_to_inbound(entry.tag, request.hash_data.vless_uuid);
        }
    }

    LOG_CTX_INFO(ctx, "user added to {} inbounds", request.data.size());
    return {};
}

result<void> node_service::add_users(const add_users_request& request)
{
    request_context ctx(log_event::kAddUser);

    if (request.users.empty())
    {
        return {};
    }
    if (auto running = require_running(); !running)
    {
        return running;
    }

    const auto tags = request.affected_inbound_tags.empty() ? mirror_.tracked_tags() : request.affected_inbound_tags;

    for (const auto& entry : request.users)
    {
        const auto& user = entry.user;
        users_.remove_user_from_all_inbounds(tags, user.user_id);
        if (!user.hash_uuid.empty())
        {
            for (const auto& tag : tags)
            {
                mirror_.remove_user_from_inbound(tag, user.hash_uuid);
            }
        }

        for (const auto& inbound_entry : entry.inbounds)
        {
            inbound_user_data inbound;
            inbound.type = inbound_entry.type;
            inbound.tag = inbound_entry.tag;
            inbound.flow = inbound_entry.flow;
            inbound.cipher = parse_cipher_type(inbound_entry.cipher_type);
            inbound.iv_check = inbound_entry.iv_check;

            const auto account = build_user_for_inbound(inbound, user);
            if (!account.has_value())
            {
                LOG_CTX_ERROR(ctx.with_inbound(inbound.tag), "unsupported inbound type {} skipped for {}", inbound.type, user.user_id);
                continue;
            }

            if (auto added = users_.add_user(inbound.tag, *account); !added)
            {
                LOG_CTX_ERROR(ctx.with_inbound(inbound.tag), "bulk add of {} failed {}", user.user_id, added.error().reason);
                return std::unexpected(wrap_error("failed to add user", added.error()));
            }

            if (!user.hash_uuid.empty())
            {
                mirror_.add_user_to_inbound(inbound.tag, user.hash_uuid);
            }
        }
    }

    LOG_CTX_INFO(ctx, "{} users added", request.users.size());
    return {};
}

result<void> node_service::remove_user(const remove_user_request& request)
{
    request_context ctx(log_event::kRemoveUser);
    ctx.user(request.username);

    if (auto running = require_running(); !running)
    {
        return running;
    }

    const auto tags = mirror_.tracked_tags();
    users_.remove_user_from_all_inbounds(tags, request.username);
    if (!request.hash_data.vless_uuid.empty())
    {
        for (const auto& tag : tags)
        {
            mirror_.remove_user_from_inbound(tag, request.hash_data.vless_uuid);
        }
    }

    LOG_CTX_INFO(ctx, "user removed");
    return {};
}

result<void> node_service::remove_users(const remove_users_request& request)
{
    request_context ctx(log_event::kRemoveUser);

    if (request.users.empty())
    {
        return {};
    }
    if (auto running = require_running(); !running)
    {
        return running;
    }

    const auto tags = mirror_.tracked_tags();
    for (const auto& entry : request.users)
    {
        users_.remove_user_from_all_inbounds(tags, entry.user_id);
        if (entry.hash_uuid.empty())
        {
            continue;
        }
        for (const auto& tag : tags)
        {
            mirror_.remove_user_from_inbound(tag, entry.hash_uuid);
        }
    }

    LOG_CTX_INFO(ctx, "{} users removed", request.users.size());
    return {};
}

result<void> node_service::block_ip(const std::string& ip)
{
    request_context ctx(log_event::kRoute);
    const auto rule_tag = block_rule_tag(ip);
    if (!rule_tag)
    {
        LOG_CTX_WARN(ctx, "block {} rejected {}", ip, rule_tag.error().reason);
        return std::unexpected(rule_tag.error());
    }

    const std::scoped_lock lock(blocked_mutex_);
    // Without a running engine the block waits for the next start.
    auto added = engine_.add_routing_rule(*rule_tag, ip, std::string(constants::engine::kBlockOutboundTag));
    if (!added && added.error().kind != error_kind::conflict && added.error().kind != error_kind::not_running)
    {
        LOG_CTX_WARN(ctx, "block {} as {} failed {}", ip, *rule_tag, added.error().reason);
        return added;
    }
    blocked_[*rule_tag] = ip;
    LOG_CTX_INFO(ctx, "blocked {} as {}", ip, *rule_tag);
    return {};
}

result<void> node_service::unblock_ip(const std::string& ip)
{
    request_context ctx(log_event::kRoute);
    const auto rule_tag = block_rule_tag(ip);
    if (!rule_tag)
    {
        LOG_CTX_WARN(ctx, "unblock {} rejected {}", ip, rule_tag.error().reason);
        return std::unexpected(rule_tag.error());
    }

    const std::scoped_lock lock(blocked_mutex_);
    auto removed = engine_.remove_routing_rule(*rule_tag);
    if (!removed && removed.error().kind != error_kind::not_running)
    {
        LOG_CTX_WARN(ctx, "unblock {} as {} failed {}", ip, *rule_tag, removed.error().reason);
        return removed;
    }
    blocked_.erase(*rule_tag);
    LOG_CTX_INFO(ctx, "unblocked {} as {}", ip, *rule_tag);
    return {};
}

std::vector<std::string> node_service::blocked_ips() const
{
    const std::scoped_lock lock(blocked_mutex_);
    std::vector<std::string> ips;
    ips.reserve(blocked_.size());
    for (const auto& [rule_tag, ip] : blocked_)
    {
        ips.push_back(ip);
    }
    return ips;
}

bool node_service::is_blocked(const std::string& ip) const
{
    const auto rule_tag = block_rule_tag(ip);
    if (!rule_tag)
    {
        return false;
    }
    const std::scoped_lock lock(blocked_mutex_);
    return blocked_.contains(*rule_tag);
}

void node_service::install_blocked_rules()
{
    request_context ctx(log_event::kRoute);
    const std::scoped_lock lock(blocked_mutex_);
    for (const auto& [rule_tag, ip] : blocked_)
    {
        auto added = engine_.add_routing_rule(rule_tag, ip, std::string(constants::engine::kBlockOutboundTag));
        if (!added && added.error().kind != error_kind::conflict)
        {
            LOG_CTX_WARN(ctx, "reinstall block {} as {} failed {}", ip, rule_tag, added.error().reason);
        }
    }
    if (!blocked_.empty())
    {
        LOG_CTX_INFO(ctx, "{} blocked addresses installed", blocked_.size());
    }
}

result<std::shared_ptr<stats_registry>> node_service::get_stats() const
{
    const auto instance = engine_.instance();
    if (instance == nullptr)
    {
        return std::unexpected(make_error(error_kind::not_running, "engine not running"));
    }
    auto stats = instance->stats();
    if (!stats)
    {
        return std::unexpected(wrap_error("stats registry not available", stats.error()));
    }
    return stats;
}

result<std::vector<stat_counter>> node_service::query_stats(const std::string& pattern, const bool reset)
{
    auto stats = get_stats();
    if (!stats)
    {
        return std::unexpected(stats.error());
    }
    return (*stats)->query(pattern, reset);
}

result<users_stats_response> node_service::users_stats(const bool reset)
{
    auto stats = get_stats();
    if (!stats)
    {
        return std::unexpected(stats.error());
    }

    users_stats_response response;
    for (const auto& [name, traffic] : collect_traffic(**stats, constants::stats::kUser, reset))
    {
        if (traffic.uplink > 0 || traffic.downlink > 0)
        {
            response.users.push_back(user_traffic{.username = name, .uplink = traffic.uplink, .downlink = traffic.downlink});
        }
    }
    return response;
}

system_stats_response node_service::system_stats() const
{
    const auto usage = read_process_usage();
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - created_at_).count();

    system_stats_response response;
    response.uptime = uptime > 0 ? static_cast<std::uint64_t>(uptime) : 0;
    response.num_threads = usage.threads;
    response.rss = usage.rss_bytes;
    response.open_fds = usage.open_fds;
    response.user_cpu_ms = usage.user_cpu_ms;
    response.system_cpu_ms = usage.system_cpu_ms;
    return response;
}

result<user_online_response> node_service::user_online(const std::string& username)
{
    auto stats = get_stats();
    if (!stats)
    {
        return std::unexpected(stats.error());
    }
    std::string name(constants::stats::kUser);
    name.append(constants::stats::kSeparator).append(username);
    name.append(constants::stats::kSeparator).append(constants::stats::kOnline);
    return user_online_response{.online = (*stats)->value(name, false).value_or(0) > 0};
}

result<inbound_traffic> node_service::inbound_stats(const std::string& tag, const bool reset)
{
    auto stats = get_stats();
    if (!stats)
    {
        return std::unexpected(stats.error());
    }
    const auto traffic = tag_traffic(**stats, constants::stats::kInbound, tag, reset);
    return inbound_traffic{.inbound = tag, .uplink = traffic.uplink, .downlink = traffic.downlink};
}

result<outbound_traffic> node_service::outbound_stats(const std::string& tag, const bool reset)
{
    auto stats = get_stats();
    if (!stats)
    {
        return std::unexpected(stats.error());
    }
    const auto traffic = tag_traffic(**stats, constants::stats::kOutbound, tag, reset);
    return outbound_traffic{.outbound = tag, .uplink = traffic.uplink, .downlink = traffic.downlink};
}

result<all_inbounds_stats_response> node_service::all_inbounds_stats(const bool reset)
{
    auto stats = get_stats();
    if (!stats)
    {
        return std::unexpected(stats.error());
    }
    return all_inbounds_stats_response{.inbounds = to_inbounds(collect_traffic(**stats, constants::stats::kInbound, reset))};
}

result<all_outbounds_stats_response> node_service::all_outbounds_stats(const bool reset)
{
    auto stats = get_stats();
    if (!stats)
    {
        return std::unexpected(stats.error());
    }
    return all_outbounds_stats_response{.outbounds = to_outbounds(collect_traffic(**stats, constants::stats::kOutbound, reset))};
}

result<combined_stats_response> node_service::combined_stats(const bool reset)
{
    auto stats = get_stats();
    if (!stats)
    {
        return std::unexpected(stats.error());
    }
    combined_stats_response response;
    response.inbounds = to_inbounds(collect_traffic(**stats, constants::stats::kInbound, reset));
    response.outbounds = to_outbounds(collect_traffic(**stats, constants::stats::kOutbound, reset));
    return response;
}

std::string node_service::live_config() const
{
    const auto config = mirror_.live_configuration();
    if (config == nullptr)
    {
        return "{}";
    }
    return serialize_config(*config);
}

result<std::vector<std::string>> node_service::inbound_users(const std::string& tag) const { return users_.list_users(tag); }

result<std::size_t> node_service::inbound_users_count(const std::string& tag) const
{
    auto users = users_.list_users(tag);
    if (!users)
    {
        return std::unexpected(users.error());
    }
    return users->size();
}

}    // namespace xnode
