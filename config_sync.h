#ifndef CONFIG_SYNC_H
#define CONFIG_SYNC_H

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

#include <rapidjson/document.h>

#include "error.h"
#include "hashed_set.h"

namespace xnode
{

struct inbound_fingerprint
{
    std::string tag;
    std::string fingerprint;
    std::int64_t member_count = 0;
};

// Expected post-push state supplied by the panel.
struct restart_signal
{
    std::string base_config_fingerprint;
    std::vector<inbound_fingerprint> inbounds;
};

using engine_config_ptr = std::shared_ptr<const rapidjson::Document>;

// Mirror of which users the live engine holds per inbound, used to decide
// whether a configuration push needs an engine restart. A single lock guards
// the whole mirror so a restart decision never observes a torn update.
class config_sync
{
   public:
    config_sync() = default;

    config_sync(const config_sync&) = delete;
    config_sync& operator=(const config_sync&) = delete;

    [[nodiscard]] bool is_restart_needed(const restart_signal& signal) const;

    // Rebuilds the mirror from the configuration the engine was started with.
    // Inbounds missing from the signal are not tracked.
    result<void> extract_users(const restart_signal& signal, engine_config_ptr configuration);

    void add_user_to_inbound(const std::string& tag, const std::string& member_id);
    void remove_user_from_inbound(const std::string& tag, const std::string& member_id);

    void cleanup();

    [[nodiscard]] std::string current_fingerprint(const std::string& tag) const;
    [[nodiscard]] std::vector<std::string> tracked_tags() const;
    [[nodiscard]] engine_config_ptr live_configuration() const;

   private:
    void cleanup_locked();

    mutable std::shared_mutex mutex_;
    std::string base_config_fingerprint_;
    std::unordered_map<std::string, hashed_set> per_inbound_users_;
    std::unordered_set<std::string> active_inbound_tags_;
    engine_config_ptr live_configuration_;
};

}    // namespace xnode

#endif
