#ifndef ENGINE_HANDLE_H
#define ENGINE_HANDLE_H

#include <memory>
#include <string>
#include <shared_mutex>

#include "error.h"
#include "engine.h"

namespace xnode
{

// Owns zero or one running engine instance. start, stop and restart hold the
// exclusive lock for their whole duration; status reads take it shared.
class engine_handle
{
   public:
    explicit engine_handle(std::shared_ptr<engine_loader> loader);
    ~engine_handle();

    engine_handle(const engine_handle&) = delete;
    engine_handle& operator=(const engine_handle&) = delete;

    result<void> start(const std::string& config_json);
    result<void> stop();
    result<void> restart(const std::string& config_json) { return start(config_json); }

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] std::string version() const;
    [[nodiscard]] std::shared_ptr<engine_instance> instance() const;

    // Routes traffic from a single source address to outbound_tag.
    result<void> add_routing_rule(const std::string& rule_tag, const std::string& source_ip, const std::string& outbound_tag);
    // Succeeds when the rule is already gone.
    result<void> remove_routing_rule(const std::string& rule_tag);

    [[nodiscard]] result<void> validate_config(const std::string& config_json) const;

   private:
    result<void> stop_locked();
    [[nodiscard]] result<std::shared_ptr<rule_router>> get_router() const;

    std::shared_ptr<engine_loader> loader_;
    mutable std::shared_mutex mutex_;
    std::shared_ptr<engine_instance> instance_;
    bool running_ = false;
};

}    // namespace xnode

#endif
