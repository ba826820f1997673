#include <mutex>
#include <memory>
#include <string>
#include <vector>

#include "log.h"
#include "error.h"
#include "engine.h"
#include "accounts.h"
#include "user_sync.h"
#include "memory_user.h"
#include "engine_handle.h"

namespace xnode
{

user_sync::user_sync(const engine_handle& engine) : engine_(engine) {}

result<std::shared_ptr<user_registry>> user_sync::find_registry(const std::string& tag) const
{
    const auto instance = engine_.instance();
    if (instance == nullptr)
    {
        return std::unexpected(make_error(error_kind::not_running, "engine not running"));
    }

    auto inbounds = instance->inbounds();
    if (!inbounds)
    {
        return std::unexpected(wrap_error("inbound manager not available", inbounds.error()));
    }

    auto registry = (*inbounds)->find_user_registry(tag);
    if (!registry)
    {
        if (registry.error().kind == error_kind::not_found)
        {
            return std::unexpected(make_error(error_kind::not_found, "no such inbound tag '" + tag + "'"));
        }
        return std::unexpected(make_error(registry.error().kind, "handler '" + tag + "' does not manage users: " + registry.error().reason));
    }
    return registry;
}

result<void> user_sync::add_user_locked(const std::shared_ptr<user_registry>& registry, const std::string& tag, const user_account& user)
{
    auto converted = to_memory_user(user);
    if (!converted)
    {
        return std::unexpected(wrap_error("failed to convert user '" + user.email + "' to memory user", converted.error()));
    }

    if (auto added = registry->add_user(*converted); !added)
    {
        return std::unexpected(wrap_error("failed to add user '" + user.email + "' to inbound '" + tag + "'", added.error()));
    }
    return {};
}

result<void> user_sync::add_user(const std::string& tag, const user_account& user)
{
    const std::scoped_lock lock(mutex_);

    auto registry = find_registry(tag);
    if (!registry)
    {
        return std::unexpected(registry.error());
    }

    if (auto added = add_user_locked(*registry, tag, user); !added)
    {
        return added;
    }

    LOG_DEBUG("user {} added to inbound {}", user.email, tag);
    return {};
}

result<void> user_sync::add_users(const std::string& tag, const std::vector<user_account>& users)
{
    const std::scoped_lock lock(mutex_);

    auto registry = find_registry(tag);
    if (!registry)
    {
        return std::unexpected(registry.error());
    }

    for (const auto& user : users)
    {
        if (auto added = add_user_locked(*registry, tag, user); !added)
        {
            return added;
        }
    }

    LOG_DEBUG("{} users added to inbound {}", users.size(), tag);
    return {};
}

result<void> user_sync::remove_user_locked(const std::string& tag, const std::string& email)
{
    auto registry = find_registry(tag);
    if (!registry)
    {
        return std::unexpected(registry.error());
    }

    if (auto removed = (*registry)->remove_user(email); !removed)
    {
        return std::unexpected(wrap_error("failed to remove user '" + email + "' from inbound '" + tag + "'", removed.error()));
    }

    LOG_DEBUG("user {} removed from inbound {}", email, tag);
    return {};
}

result<void> user_sync::remove_user(const std::string& tag, const std::string& email)
{
    const std::scoped_lock lock(mutex_);
    return remove_user_locked(tag, email);
}

result<void> user_sync::remove_users(const std::string& tag, const std::vector<std::string>& emails)
{
    const std::scoped_lock lock(mutex_);

    auto registry = find_registry(tag);
    if (!registry)
    {
        return std::unexpected(registry.error());
    }

    for (const auto& email : emails)
    {
        if (auto removed = (*registry)->remove_user(email); !removed)
        {
            LOG_WARN("remove user {} from inbound {} failed {}", email, tag, removed.error().reason);
        }
    }

    LOG_DEBUG("removal of {} users from inbound {} completed", emails.size(), tag);
    return {};
}

void user_sync::remove_user_from_all_inbounds(const std::vector<std::string>& tags, const std::string& email)
{
    const std::scoped_lock lock(mutex_);
    for (const auto& tag : tags)
    {
        if (auto removed = remove_user_locked(tag, email); !removed)
        {
            LOG_DEBUG("could not remove user {} from inbound {} {}", email, tag, removed.error().reason);
        }
    }
}

result<std::vector<std::string>> user_sync::list_users(const std::string& tag) const
{
    auto registry = find_registry(tag);
    if (!registry)
    {
        return std::unexpected(registry.error());
    }
    return (*registry)->user_emails();
}

}    // namespace xnode
