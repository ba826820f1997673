#ifndef NODE_SERVICE_H
#define NODE_SERVICE_H

#include <map>
#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "error.h"
#include "engine.h"
#include "user_sync.h"
#include "config_sync.h"
#include "engine_handle.h"
#include "node_messages.h"
#include "single_flight.h"

namespace xnode
{

// Management operations of a node: engine lifecycle driven by panel pushes,
// live user changes kept in step with the restart mirror, ip blocking and
// traffic statistics. Transport independent.
class node_service
{
   public:
    node_service(engine_handle& engine, config_sync& mirror, user_sync& users, std::uint16_t api_port);

    node_service(const node_service&) = delete;
    node_service& operator=(const node_service&) = delete;

    // conflict when another start is in flight.
    result<start_response> start(const start_request& request);
    result<stop_response> stop();
    [[nodiscard]] status_response status() const;
    [[nodiscard]] healthcheck_response healthcheck() const;

    result<void> add_user(const add_user_request& request);
    result<void> add_users(const add_users_request& request);
    result<void> remove_user(const remove_user_request& request);
    result<void> remove_users(const remove_users_request& request);

    // Routes every connection from ip to the block outbound under a rule
    // tagged with the md5 hex of ip. Recorded blocks outlive engine restarts
    // and are installed again on every fresh start.
    result<void> block_ip(const std::string& ip);
    result<void> unblock_ip(const std::string& ip);
    [[nodiscard]] std::vector<std::string> blocked_ips() const;
    [[nodiscard]] bool is_blocked(const std::string& ip) const;

    [[nodiscard]] result<std::vector<stat_counter>> query_stats(const std::string& pattern, bool reset);
    // Users with no traffic in either direction are left out.
    [[nodiscard]] result<users_stats_response> users_stats(bool reset);
    [[nodiscard]] system_stats_response system_stats() const;
    [[nodiscard]] result<user_online_response> user_online(const std::string& username);
    [[nodiscard]] result<inbound_traffic> inbound_stats(const std::string& tag, bool reset);
    [[nodiscard]] result<outbound_traffic> outbound_stats(const std::string& tag, bool reset);
    [[nodiscard]] result<all_inbounds_stats_response> all_inbounds_stats(bool reset);
    [[nodiscard]] result<all_outbounds_stats_response> all_outbounds_stats(bool reset);
    [[nodiscard]] result<combined_stats_response> combined_stats(bool reset);

    // Serialized configuration the running engine was started with, "{}"
    // while stopped.
    [[nodiscard]] std::string live_config() const;
    [[nodiscard]] result<std::vector<std::string>> inbound_users(const std::string& tag) const;
    [[nodiscard]] result<std::size_t> inbound_users_count(const std::string& tag) const;

   private:
    [[nodiscard]] start_response started_response() const;
    [[nodiscard]] result<void> require_running() const;
    [[nodiscard]] result<std::shared_ptr<stats_registry>> get_stats() const;
    void install_blocked_rules();

    engine_handle& engine_;
    config_sync& mirror_;
    user_sync& users_;
    std::uint16_t api_port_;
    std::mutex start_mutex_;
    single_flight start_flight_;
    std::chrono::steady_clock::time_point created_at_;
    mutable std::mutex blocked_mutex_;
    // rule tag -> blocked address
    std::map<std::string, std::string> blocked_;
};

}    // namespace xnode

#endif
