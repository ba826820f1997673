#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <algorithm>
#include <shared_mutex>
#include <unordered_set>

#include <rapidjson/document.h>

#include "log.h"
#include "error.h"
#include "hashed_set.h"
#include "config_sync.h"

namespace xnode
{

namespace
{

const inbound_fingerprint* find_inbound(const restart_signal& signal, const std::string& tag)
{
    const auto it = std::ranges::find(signal.inbounds, tag, &inbound_fingerprint::tag);
    if (it == signal.inbounds.end())
    {
        return nullptr;
    }
    return &*it;
}

hashed_set collect_client_ids(const rapidjson::Value& inbound)
{
    hashed_set users;
    const auto settings = inbound.FindMember("settings");
    if (settings == inbound.MemberEnd() || !settings->value.IsObject())
    {
        return users;
    }
    const auto clients = settings->value.FindMember("clients");
    if (clients == settings->value.MemberEnd() || !clients->value.IsArray())
    {
        return users;
    }
    for (const auto& client : clients->value.GetArray())
    {
        if (!client.IsObject())
        {
            continue;
        }
        const auto id = client.FindMember("id");
        if (id == client.MemberEnd() || !id->value.IsString() || id->value.GetStringLength() == 0)
        {
            continue;
        }
        users.add(std::string(id->value.GetString(), id->value.GetStringLength()));
    }
    return users;
}

}    // namespace

bool config_sync::is_restart_needed(const restart_signal& signal) const
{
    const std::shared_lock lock(mutex_);

    if (base_config_fingerprint_.empty())
    {
        return true;
    }

    if (signal.base_config_fingerprint != base_config_fingerprint_)
    {
        LOG_WARN("detected changes in engine base configuration");
        return true;
    }

    if (signal.inbounds.size() != per_inbound_users_.size())
    {
        LOG_WARN("number of engine inbounds has changed {} -> {}", per_inbound_users_.size(), signal.inbounds.size());
        return true;
    }

    for (const auto& [tag, users] : per_inbound_users_)
    {
        const auto* incoming = find_inbound(signal, tag);
        if (incoming == nullptr)
        {
            LOG_WARN("inbound {} no longer exists in engine configuration", tag);
            return true;
        }

        const auto current = users.fingerprint();
        if (current != incoming->fingerprint)
        {
            LOG_WARN("user configuration changed for inbound {} current {} incoming {}", tag, current, incoming->fingerprint);
            return true;
        }
    }

    LOG_INFO("engine configuration is up to date no restart required");
    return false;
}

result<void> config_sync::extract_users(const restart_signal& signal, engine_config_ptr configuration)
{
    const std::unique_lock lock(mutex_);

    cleanup_locked();

    base_config_fingerprint_ = signal.base_config_fingerprint;
    live_configuration_ = std::move(configuration);

    LOG_INFO("starting user extraction base {} inbounds {}", signal.base_config_fingerprint, signal.inbounds.size());

    if (live_configuration_ == nullptr || !live_configuration_->IsObject())
    {
        return {};
    }

    const auto inbounds = live_configuration_->FindMember("inbounds");
    if (inbounds == live_configuration_->MemberEnd() || !inbounds->value.IsArray())
    {
        return {};
    }

    std::unordered_set<std::string> valid_tags;
    for (const auto& inbound : signal.inbounds)
    {
        valid_tags.insert(inbound.tag);
    }

    for (const auto& inbound : inbounds->value.GetArray())
    {
        if (!inbound.IsObject())
        {
            continue;
        }
        const auto tag_member = inbound.FindMember("tag");
        if (tag_member == inbound.MemberEnd() || !tag_member->value.IsString() || tag_member->value.GetStringLength() == 0)
        {
            continue;
        }

        std::string tag(tag_member->value.GetString(), tag_member->value.GetStringLength());
        if (!valid_tags.contains(tag))
        {
            continue;
        }

        auto users = collect_client_ids(inbound);
        LOG_INFO("inbound {} has {} users", tag, users.size());
        active_inbound_tags_.insert(tag);
        per_inbound_users_.insert_or_assign(std::move(tag), std::move(users));
    }

    return {};
}

void config_sync::add_user_to_inbound(const std::string& tag, const std::string& member_id)
{
    const std::unique_lock lock(mutex_);

    auto it = per_inbound_users_.find(tag);
    if (it == per_inbound_users_.end())
    {
        LOG_WARN("inbound {} not tracked creating new user set", tag);
        it = per_inbound_users_.emplace(tag, hashed_set{}).first;
        active_inbound_tags_.insert(tag);
    }
    it->second.add(member_id);
}

void config_sync::remove_user_from_inbound(const std::string& tag, const std::string& member_id)
{
    const std::unique_lock lock(mutex_);

    const auto it = per_inbound_users_.find(tag);
    if (it == per_inbound_users_.end())
    {
        return;
    }

    it->second.remove(member_id);
    if (it->second.empty())
    {
        per_inbound_users_.erase(it);
        active_inbound_tags_.erase(tag);
        LOG_WARN("inbound {} has no users clearing it from the mirror", tag);
    }
}

void config_sync::cleanup()
{
    const std::unique_lock lock(mutex_);
    cleanup_locked();
}

void config_sync::cleanup_locked()
{
    LOG_INFO("cleaning up config mirror");
    per_inbound_users_.clear();
    active_inbound_tags_.clear();
    live_configuration_.reset();
    base_config_fingerprint_.clear();
}

std::string config_sync::current_fingerprint(const std::string& tag) const
{
    const std::shared_lock lock(mutex_);
    const auto it = per_inbound_users_.find(tag);
    if (it == per_inbound_users_.end())
    {
        return {};
    }
    return it->second.fingerprint();
}

std::vector<std::string> config_sync::tracked_tags() const
{
    const std::shared_lock lock(mutex_);
    return {active_inbound_tags_.begin(), active_inbound_tags_.end()};
}

engine_config_ptr config_sync::live_configuration() const
{
    static const engine_config_ptr kEmpty = []
    {
        auto doc = std::make_shared<rapidjson::Document>();
        doc->SetObject();
        return engine_config_ptr(std::move(doc));
    }();

    const std::shared_lock lock(mutex_);
    if (live_configuration_ == nullptr)
    {
        return kEmpty;
    }
    return live_configuration_;
}

}    // namespace xnode
