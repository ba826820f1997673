#include <map>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <tuple>
#include <utility>
#include <optional>
#include <algorithm>
#include <filesystem>
#include <string_view>
#include <unordered_set>

#include <boost/system/error_code.hpp>
#include <boost/asio/ip/address.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "log.h"
#include "error.h"
#include "engine.h"
#include "accounts.h"
#include "constants.h"
#include "memory_user.h"
#include "registry_engine.h"

namespace xnode
{

namespace
{

constexpr std::string_view kGeoSiteFile = "geosite.dat";

std::string get_string(const rapidjson::Value& object, const char* name)
{
    if (!object.IsObject())
    {
        return {};
    }
    const auto it = object.FindMember(name);
    if (it == object.MemberEnd() || !it->value.IsString())
    {
        return {};
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::uint32_t get_level(const rapidjson::Value& object)
{
    const auto it = object.FindMember("level");
    if (it == object.MemberEnd() || !it->value.IsUint())
    {
        return 0;
    }
    return it->value.GetUint();
}

bool get_bool(const rapidjson::Value& object, const char* name)
{
    const auto it = object.FindMember(name);
    return it != object.MemberEnd() && it->value.IsBool() && it->value.GetBool();
}

bool is_managed_protocol(const std::string_view name)
{
    return name == protocol::kVless || name == protocol::kTrojan || name == protocol::kShadowsocks;
}

result<user_account> client_to_account(const std::string& protocol_name, const rapidjson::Value& settings, const rapidjson::Value& client)
{
    auto email = get_string(client, "email");
    if (email.empty())
    {
        return std::unexpected(make_error(error_kind::config, "client without email"));
    }

    const auto level = get_level(client);
    if (protocol_name == protocol::kVless)
    {
        return build_vless_user(std::move(email), get_string(client, "id"), get_string(client, "flow"), level);
    }
    if (protocol_name == protocol::kTrojan)
    {
        return build_trojan_user(std::move(email), get_string(client, "password"), level);
    }

    // Shadowsocks clients inherit the inbound method when they do not name one.
    auto method = get_string(client, "method");
    if (method.empty())
    {
        method = get_string(settings, "method");
    }
    return build_shadowsocks_user(std::move(email), get_string(client, "password"), parse_cipher_type(method), get_bool(client, "ivCheck"), level);
}

result<void> preload_clients(inbound_users& users, const std::string& tag, const rapidjson::Value& inbound)
{
    const auto settings = inbound.FindMember("settings");
    if (settings == inbound.MemberEnd() || !settings->value.IsObject())
    {
        return {};
    }
    const auto clients = settings->value.FindMember("clients");
    if (clients == settings->value.MemberEnd())
    {
        return {};
    }
    if (!clients->value.IsArray())
    {
        return std::unexpected(make_error(error_kind::config, "inbound '" + tag + "' settings.clients is not an array"));
    }

    std::size_t index = 0;
    for (const auto& client : clients->value.GetArray())
    {
        const std::string where = "inbound '" + tag + "' client " + std::to_string(index++);
        if (!client.IsObject())
        {
            return std::unexpected(make_error(error_kind::config, where + " is not an object"));
        }
        auto account = client_to_account(users.protocol(), settings->value, client);
        if (!account)
        {
            return std::unexpected(wrap_error(where, account.error()));
        }
        auto user = to_memory_user(*account);
        if (!user)
        {
            return std::unexpected(make_error(error_kind::config, where + ": " + user.error().reason));
        }
        if (auto added = users.add_user(*user); !added)
        {
            return std::unexpected(make_error(error_kind::config, where + ": " + added.error().reason));
        }
    }
    return {};
}

result<void> check_asset(const std::string& asset_dir, const std::string_view entry, const std::string_view file)
{
    if (asset_dir.empty())
    {
        return std::unexpected(make_error(error_kind::config, "'" + std::string(entry) + "' requires " + std::string(file) + " but no asset directory is set"));
    }
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(asset_dir) / file, ec))
    {
        return std::unexpected(make_error(error_kind::config, std::string(file) + " not found in " + asset_dir));
    }
    return {};
}

result<void> check_rule_assets(const rapidjson::Value& rule, const std::string& asset_dir)
{
    for (const auto& [field, prefix, file] : {std::tuple{"ip", std::string_view("geoip:"), constants::engine::kGeoIpFile},
                                              std::tuple{"source", std::string_view("geoip:"), constants::engine::kGeoIpFile},
                                              std::tuple{"domain", std::string_view("geosite:"), kGeoSiteFile}})
    {
        const auto it = rule.FindMember(field);
        if (it == rule.MemberEnd() || !it->value.IsArray())
        {
            continue;
        }
        for (const auto& entry : it->value.GetArray())
        {
            if (!entry.IsString())
            {
                continue;
            }
            const std::string_view value(entry.GetString(), entry.GetStringLength());
            if (!value.starts_with(prefix))
            {
                continue;
            }
            if (auto found = check_asset(asset_dir, value, file); !found)
            {
                return found;
            }
        }
    }
    return {};
}

// Parses "addr" or "addr/prefix". Only single CIDR sources are tracked for
// matching; anything else leaves the rule without a source.
std::optional<std::pair<boost::asio::ip::address, std::uint8_t>> parse_cidr(const std::string& text)
{
    std::string addr_text = text;
    std::optional<int> prefix;
    if (const auto slash = text.find('/'); slash != std::string::npos)
    {
        addr_text = text.substr(0, slash);
        const auto prefix_text = text.substr(slash + 1);
        if (prefix_text.empty() || prefix_text.size() > 3 || !std::ranges::all_of(prefix_text, [](const char c) { return c >= '0' && c <= '9'; }))
        {
            return std::nullopt;
        }
        prefix = std::stoi(prefix_text);
    }

    boost::system::error_code ec;
    const auto addr = boost::asio::ip::make_address(addr_text, ec);
    if (ec)
    {
        return std::nullopt;
    }
    const int max_prefix = addr.is_v4() ? 32 : 128;
    const int bits = prefix.value_or(max_prefix);
    if (bits < 0 || bits > max_prefix)
    {
        return std::nullopt;
    }
    return std::make_pair(addr, static_cast<std::uint8_t>(bits));
}

result<void> load_rules(rule_table& router, const rapidjson::Document& doc, const std::string& asset_dir)
{
    const auto routing = doc.FindMember("routing");
    if (routing == doc.MemberEnd())
    {
        return {};
    }
    if (!routing->value.IsObject())
    {
        return std::unexpected(make_error(error_kind::config, "routing is not an object"));
    }
    const auto rules = routing->value.FindMember("rules");
    if (rules == routing->value.MemberEnd())
    {
        return {};
    }
    if (!rules->value.IsArray())
    {
        return std::unexpected(make_error(error_kind::config, "routing.rules is not an array"));
    }

    std::size_t index = 0;
    for (const auto& rule : rules->value.GetArray())
    {
        const std::string where = "routing rule " + std::to_string(index++);
        if (!rule.IsObject())
        {
            return std::unexpected(make_error(error_kind::config, where + " is not an object"));
        }
        if (auto assets = check_rule_assets(rule, asset_dir); !assets)
        {
            return std::unexpected(wrap_error(where, assets.error()));
        }

        auto rule_tag = get_string(rule, "ruleTag");
        if (rule_tag.empty())
        {
            continue;
        }

        routing_rule seeded;
        seeded.rule_tag = std::move(rule_tag);
        seeded.outbound_tag = get_string(rule, "outboundTag");
        seeded.prefix = 0;
        const auto source = rule.FindMember("source");
        if (source != rule.MemberEnd() && source->value.IsArray() && source->value.Size() == 1 && source->value[0].IsString())
        {
            if (const auto cidr = parse_cidr(source->value[0].GetString()); cidr.has_value())
            {
                seeded.source = cidr->first;
                seeded.prefix = cidr->second;
            }
        }
        if (auto added = router.add_rule(seeded, true); !added)
        {
            return std::unexpected(make_error(error_kind::config, where + ": " + added.error().reason));
        }
    }
    return {};
}

struct engine_parts
{
    std::shared_ptr<inbound_table> inbounds = std::make_shared<inbound_table>();
    std::shared_ptr<rule_table> router = std::make_shared<rule_table>();
    std::shared_ptr<traffic_stats> stats = std::make_shared<traffic_stats>();
};

result<void> load_inbounds(engine_parts& parts, const rapidjson::Document& doc)
{
    const auto inbounds = doc.FindMember("inbounds");
    if (inbounds == doc.MemberEnd())
    {
        return {};
    }
    if (!inbounds->value.IsArray())
    {
        return std::unexpected(make_error(error_kind::config, "inbounds is not an array"));
    }

    std::unordered_set<std::string> seen;
    std::size_t index = 0;
    for (const auto& inbound : inbounds->value.GetArray())
    {
        const std::string where = "inbound " + std::to_string(index++);
        if (!inbound.IsObject())
        {
            return std::unexpected(make_error(error_kind::config, where + " is not an object"));
        }
        auto tag = get_string(inbound, "tag");
        if (tag.empty())
        {
            return std::unexpected(make_error(error_kind::config, where + " has no tag"));
        }
        if (!seen.insert(tag).second)
        {
            return std::unexpected(make_error(error_kind::config, "duplicate inbound tag '" + tag + "'"));
        }
        auto protocol_name = get_string(inbound, "protocol");
        if (protocol_name.empty())
        {
            return std::unexpected(make_error(error_kind::config, "inbound '" + tag + "' has no protocol"));
        }

        parts.stats->register_traffic(constants::stats::kInbound, tag);
        if (!is_managed_protocol(protocol_name))
        {
            parts.inbounds->add_inbound(tag, nullptr);
            continue;
        }

        auto users = std::make_shared<inbound_users>(tag, protocol_name, parts.stats);
        if (auto loaded = preload_clients(*users, tag, inbound); !loaded)
        {
            return loaded;
        }
        parts.inbounds->add_inbound(tag, std::move(users));
    }
    return {};
}

result<void> load_outbounds(engine_parts& parts, const rapidjson::Document& doc)
{
    const auto outbounds = doc.FindMember("outbounds");
    if (outbounds == doc.MemberEnd())
    {
        return {};
    }
    if (!outbounds->value.IsArray())
    {
        return std::unexpected(make_error(error_kind::config, "outbounds is not an array"));
    }

    std::unordered_set<std::string> seen;
    std::size_t index = 0;
    for (const auto& outbound : outbounds->value.GetArray())
    {
        if (!outbound.IsObject())
        {
            return std::unexpected(make_error(error_kind::config, "outbound " + std::to_string(index) + " is not an object"));
        }
        ++index;
        // Untagged outbounds are legal but carry no counters.
        auto tag = get_string(outbound, "tag");
        if (tag.empty())
        {
            continue;
        }
        if (!seen.insert(tag).second)
        {
            return std::unexpected(make_error(error_kind::config, "duplicate outbound tag '" + tag + "'"));
        }
        parts.stats->register_traffic(constants::stats::kOutbound, tag);
    }
    return {};
}

result<engine_parts> load_engine(const std::string& config_json, const std::string& asset_dir)
{
    rapidjson::Document doc;
    if (doc.Parse(config_json.c_str(), config_json.size()).HasParseError())
    {
        return std::unexpected(make_error(error_kind::config,
                                          "invalid json at offset " + std::to_string(doc.GetErrorOffset()) + " " + rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject())
    {
        return std::unexpected(make_error(error_kind::config, "config root is not an object"));
    }

    engine_parts parts;
    if (auto loaded = load_inbounds(parts, doc); !loaded)
    {
        return std::unexpected(loaded.error());
    }
    if (auto loaded = load_outbounds(parts, doc); !loaded)
    {
        return std::unexpected(loaded.error());
    }
    if (auto loaded = load_rules(*parts.router, doc, asset_dir); !loaded)
    {
        return std::unexpected(loaded.error());
    }
    return parts;
}

bool prefix_covers(const routing_rule& rule, const boost::asio::ip::address& addr)
{
    if (rule.source.is_v4() != addr.is_v4())
    {
        return false;
    }
    if (addr.is_v4())
    {
        const std::uint32_t mask = rule.prefix == 0 ? 0 : (0xFFFFFFFFU << (32 - rule.prefix));
        return (rule.source.to_v4().to_uint() & mask) == (addr.to_v4().to_uint() & mask);
    }

    const auto lhs = rule.source.to_v6().to_bytes();
    const auto rhs = addr.to_v6().to_bytes();
    int remaining = rule.prefix;
    for (std::size_t i = 0; i < lhs.size() && remaining > 0; ++i, remaining -= 8)
    {
        const std::uint8_t mask = remaining >= 8 ? 0xFF : static_cast<std::uint8_t>(0xFF << (8 - remaining));
        if ((lhs[i] & mask) != (rhs[i] & mask))
        {
            return false;
        }
    }
    return true;
}

}    // namespace

std::string traffic_stats::counter_name(const std::string_view scope, const std::string& tag, const std::string_view direction)
{
    std::string name(scope);
    name.append(constants::stats::kSeparator);
    name.append(tag);
    name.append(constants::stats::kSeparator);
    name.append(constants::stats::kTraffic);
    name.append(constants::stats::kSeparator);
    name.append(direction);
    return name;
}

std::string traffic_stats::online_name(const std::string& email)
{
    std::string name(constants::stats::kUser);
    name.append(constants::stats::kSeparator);
    name.append(email);
    name.append(constants::stats::kSeparator);
    name.append(constants::stats::kOnline);
    return name;
}

void traffic_stats::register_traffic(const std::string_view scope, const std::string& tag)
{
    const std::scoped_lock lock(mutex_);
    counters_.try_emplace(counter_name(scope, tag, constants::stats::kUplink), 0);
    counters_.try_emplace(counter_name(scope, tag, constants::stats::kDownlink), 0);
}

void traffic_stats::register_user(const std::string& email)
{
    register_traffic(constants::stats::kUser, email);
    const std::scoped_lock lock(mutex_);
    counters_.try_emplace(online_name(email), 0);
}

void traffic_stats::unregister_user(const std::string& email)
{
    const std::scoped_lock lock(mutex_);
    counters_.erase(counter_name(constants::stats::kUser, email, constants::stats::kUplink));
    counters_.erase(counter_name(constants::stats::kUser, email, constants::stats::kDownlink));
    counters_.erase(online_name(email));
}

void traffic_stats::record(const std::string_view scope, const std::string& tag, const std::int64_t uplink, const std::int64_t downlink)
{
    const std::scoped_lock lock(mutex_);
    if (auto it = counters_.find(counter_name(scope, tag, constants::stats::kUplink)); it != counters_.end())
    {
        it->second += uplink;
    }
    if (auto it = counters_.find(counter_name(scope, tag, constants::stats::kDownlink)); it != counters_.end())
    {
        it->second += downlink;
    }
}

void traffic_stats::set_online(const std::string& email, const std::int64_t connections)
{
    const std::scoped_lock lock(mutex_);
    if (auto it = counters_.find(online_name(email)); it != counters_.end())
    {
        it->second = connections;
    }
}

std::vector<stat_counter> traffic_stats::query(const std::string& pattern, const bool reset)
{
    const std::scoped_lock lock(mutex_);
    std::vector<stat_counter> out;
    for (auto& [name, value] : counters_)
    {
        if (!pattern.empty() && name.find(pattern) == std::string::npos)
        {
            continue;
        }
        out.push_back(stat_counter{.name = name, .value = value});
        if (reset)
        {
            value = 0;
        }
    }
    return out;
}

std::vector<stat_counter> traffic_stats::query_prefix(const std::string& prefix, const bool reset)
{
    const std::scoped_lock lock(mutex_);
    std::vector<stat_counter> out;
    for (auto it = counters_.lower_bound(prefix); it != counters_.end() && it->first.starts_with(prefix); ++it)
    {
        out.push_back(stat_counter{.name = it->first, .value = it->second});
        if (reset)
        {
            it->second = 0;
        }
    }
    return out;
}

std::optional<std::int64_t> traffic_stats::value(const std::string& name, const bool reset)
{
    const std::scoped_lock lock(mutex_);
    const auto it = counters_.find(name);
    if (it == counters_.end())
    {
        return std::nullopt;
    }
    const auto current = it->second;
    if (reset)
    {
        it->second = 0;
    }
    return current;
}

inbound_users::inbound_users(std::string tag, std::string protocol, std::shared_ptr<traffic_stats> stats)
    : tag_(std::move(tag)), protocol_(std::move(protocol)), stats_(std::move(stats))
{
}

result<void> inbound_users::add_user(const memory_user& user)
{
    if (user.protocol != protocol_)
    {
        return std::unexpected(make_error(error_kind::invalid_argument, "inbound '" + tag_ + "' accepts " + protocol_ + " users, got " + user.protocol));
    }

    {
        const std::scoped_lock lock(mutex_);
        if (!users_.try_emplace(user.email, user).second)
        {
            return std::unexpected(make_error(error_kind::conflict, "User " + user.email + " already exists."));
        }
    }
    if (stats_ != nullptr)
    {
        stats_->register_user(user.email);
    }
    return {};
}

result<void> inbound_users::remove_user(const std::string& email)
{
    {
        const std::scoped_lock lock(mutex_);
        if (users_.erase(email) == 0)
        {
            return std::unexpected(make_error(error_kind::not_found, "User " + email + " not found."));
        }
    }
    if (stats_ != nullptr)
    {
        stats_->unregister_user(email);
    }
    return {};
}

std::size_t inbound_users::user_count() const
{
    const std::scoped_lock lock(mutex_);
    return users_.size();
}

std::vector<std::string> inbound_users::user_emails() const
{
    const std::scoped_lock lock(mutex_);
    std::vector<std::string> emails;
    emails.reserve(users_.size());
    for (const auto& [email, user] : users_)
    {
        emails.push_back(email);
    }
    return emails;
}

std::optional<memory_user> inbound_users::find_user(const std::string& email) const
{
    const std::scoped_lock lock(mutex_);
    const auto it = users_.find(email);
    if (it == users_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void inbound_table::add_inbound(const std::string& tag, std::shared_ptr<inbound_users> users) { inbounds_[tag] = std::move(users); }

result<std::shared_ptr<user_registry>> inbound_table::find_user_registry(const std::string& tag)
{
    const auto it = inbounds_.find(tag);
    if (it == inbounds_.end())
    {
        return std::unexpected(make_error(error_kind::not_found, "handler not found: " + tag));
    }
    if (it->second == nullptr)
    {
        return std::unexpected(make_error(error_kind::unsupported, "proxy is not a UserManager"));
    }
    return std::static_pointer_cast<user_registry>(it->second);
}

std::vector<std::string> inbound_table::inbound_tags() const
{
    std::vector<std::string> tags;
    tags.reserve(inbounds_.size());
    for (const auto& [tag, users] : inbounds_)
    {
        tags.push_back(tag);
    }
    return tags;
}

result<void> rule_table::add_rule(const routing_rule& rule, const bool append)
{
    if (rule.rule_tag.empty())
    {
        return std::unexpected(make_error(error_kind::invalid_argument, "rule tag is empty"));
    }

    const std::scoped_lock lock(mutex_);
    if (std::ranges::any_of(rules_, [&rule](const routing_rule& existing) { return existing.rule_tag == rule.rule_tag; }))
    {
        return std::unexpected(make_error(error_kind::conflict, "duplicate ruleTag " + rule.rule_tag));
    }
    if (append)
    {
        rules_.push_back(rule);
    }
    else
    {
        rules_.insert(rules_.begin(), rule);
    }
    return {};
}

result<void> rule_table::remove_rule(const std::string& rule_tag)
{
    const std::scoped_lock lock(mutex_);
    const auto removed = std::erase_if(rules_, [&rule_tag](const routing_rule& rule) { return rule.rule_tag == rule_tag; });
    if (removed == 0)
    {
        return std::unexpected(make_error(error_kind::not_found, "rule " + rule_tag + " not found"));
    }
    return {};
}

std::optional<std::string> rule_table::match(const boost::asio::ip::address& addr) const
{
    const std::scoped_lock lock(mutex_);
    for (const auto& rule : rules_)
    {
        // Seeded rules without a single CIDR source carry prefix 0 and match on
        // conditions this table does not evaluate.
        if (rule.prefix == 0)
        {
            continue;
        }
        if (prefix_covers(rule, addr))
        {
            return rule.outbound_tag;
        }
    }
    return std::nullopt;
}

std::vector<routing_rule> rule_table::rules() const
{
    const std::scoped_lock lock(mutex_);
    return rules_;
}

registry_instance::registry_instance(std::shared_ptr<inbound_table> inbounds, std::shared_ptr<rule_table> router, std::shared_ptr<traffic_stats> stats)
    : inbounds_(std::move(inbounds)), router_(std::move(router)), stats_(std::move(stats))
{
}

result<void> registry_instance::start()
{
    const std::scoped_lock lock(mutex_);
    if (closed_)
    {
        return std::unexpected(make_error(error_kind::lifecycle, "instance already closed"));
    }
    if (started_)
    {
        return std::unexpected(make_error(error_kind::lifecycle, "instance already started"));
    }
    started_ = true;
    LOG_DEBUG("registry instance started with {} inbounds", inbounds_->inbound_tags().size());
    return {};
}

result<void> registry_instance::close()
{
    const std::scoped_lock lock(mutex_);
    started_ = false;
    closed_ = true;
    return {};
}

result<std::shared_ptr<inbound_manager>> registry_instance::inbounds() { return std::static_pointer_cast<inbound_manager>(inbounds_); }

result<std::shared_ptr<rule_router>> registry_instance::router() { return std::static_pointer_cast<rule_router>(router_); }

result<std::shared_ptr<stats_registry>> registry_instance::stats() { return std::static_pointer_cast<stats_registry>(stats_); }

bool registry_instance::started() const
{
    const std::scoped_lock lock(mutex_);
    return started_;
}

registry_loader::registry_loader(std::string asset_dir) : asset_dir_(std::move(asset_dir)) {}

result<void> registry_loader::validate(const std::string& config_json) const
{
    auto parts = load_engine(config_json, asset_dir_);
    if (!parts)
    {
        return std::unexpected(parts.error());
    }
    return {};
}

result<std::shared_ptr<engine_instance>> registry_loader::create(const std::string& config_json)
{
    auto parts = load_engine(config_json, asset_dir_);
    if (!parts)
    {
        return std::unexpected(make_error(error_kind::lifecycle, "failed to create instance: " + parts.error().reason));
    }
    return std::make_shared<registry_instance>(std::move(parts->inbounds), std::move(parts->router), std::move(parts->stats));
}

std::string registry_loader::version() const { return std::string(constants::version::kEngine); }

}    // namespace xnode
