#ifndef USER_SYNC_H
#define USER_SYNC_H

#include <mutex>
#include <memory>
#include <string>
#include <vector>

#include "error.h"
#include "engine.h"
#include "accounts.h"

namespace xnode
{

class engine_handle;

// Applies user accounts to the live engine's per-inbound user registries.
// One mutex serialises every add/remove sequence.
class user_sync
{
   public:
    explicit user_sync(const engine_handle& engine);

    result<void> add_user(const std::string& tag, const user_account& user);
    // Stops at the first failure; users added before it stay in place.
    result<void> add_users(const std::string& tag, const std::vector<user_account>& users);
    result<void> remove_user(const std::string& tag, const std::string& email);
    // Lookup failures are returned; per-user failures are logged and skipped.
    result<void> remove_users(const std::string& tag, const std::vector<std::string>& emails);
    void remove_user_from_all_inbounds(const std::vector<std::string>& tags, const std::string& email);
    [[nodiscard]] result<std::vector<std::string>> list_users(const std::string& tag) const;

   private:
    [[nodiscard]] result<std::shared_ptr<user_registry>> find_registry(const std::string& tag) const;
    result<void> add_user_locked(const std::shared_ptr<user_registry>& registry, const std::string& tag, const user_account& user);
    result<void> remove_user_locked(const std::string& tag, const std::string& email);

    const engine_handle& engine_;
    std::mutex mutex_;
};

}    // namespace xnode

#endif
