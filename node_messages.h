#ifndef NODE_MESSAGES_H
#define NODE_MESSAGES_H

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <rapidjson/document.h>

#include "error.h"
#include "accounts.h"
#include "config_sync.h"

namespace xnode
{

struct start_request
{
    std::shared_ptr<rapidjson::Document> engine_config;
    bool force_restart = false;
    restart_signal hashes;
};

struct add_user_entry
{
    std::string tag;
    std::string username;
    std::string type;
    std::string uuid;
    std::string flow;
    std::string password;
    std::string cipher_type;
    bool iv_check = false;
};

struct add_user_hashes
{
    std::string vless_uuid;
    std::string prev_vless_uuid;
};

struct add_user_request
{
    std::vector<add_user_entry> data;
    add_user_hashes hash_data;
};

struct bulk_inbound_entry
{
    std::string tag;
    std::string type;
    std::string flow;
    std::string cipher_type;
    bool iv_check = false;
};

struct bulk_user_entry
{
    user_data user;
    std::vector<bulk_inbound_entry> inbounds;
};

struct add_users_request
{
    std::vector<std::string> affected_inbound_tags;
    std::vector<bulk_user_entry> users;
};

struct remove_user_hashes
{
    std::string vless_uuid;
};

struct remove_user_request
{
    std::string username;
    remove_user_hashes hash_data;
};

struct bulk_remove_entry
{
    std::string user_id;
    std::string hash_uuid;
};

struct remove_users_request
{
    std::vector<bulk_remove_entry> users;
};

struct node_info
{
    std::string version;
};

struct start_response
{
    bool is_started = false;
    std::optional<std::string> version;
    std::optional<std::string> error_message;
    node_info node;
};

struct stop_response
{
    bool is_stopped = false;
};

struct status_response
{
    bool is_running = false;
    std::optional<std::string> version;
};

struct healthcheck_response
{
    bool is_healthy = true;
    bool is_engine_running = false;
    std::optional<std::string> engine_version;
    std::string node_version;
};

struct user_op_response
{
    bool success = false;
    std::optional<std::string> error_message;
};

struct user_traffic
{
    std::string username;
    std::int64_t uplink = 0;
    std::int64_t downlink = 0;
};

struct users_stats_response
{
    std::vector<user_traffic> users;
};

struct reset_request
{
    bool reset = false;
};

struct username_request
{
    std::string username;
};

struct tag_reset_request
{
    std::string tag;
    bool reset = false;
};

struct block_ip_request
{
    std::string ip;
};

struct system_stats_response
{
    std::uint64_t uptime = 0;
    std::uint64_t num_threads = 0;
    std::uint64_t rss = 0;
    std::uint64_t open_fds = 0;
    std::uint64_t user_cpu_ms = 0;
    std::uint64_t system_cpu_ms = 0;
};

struct user_online_response
{
    bool online = false;
};

struct inbound_traffic
{
    std::string inbound;
    std::int64_t uplink = 0;
    std::int64_t downlink = 0;
};

struct outbound_traffic
{
    std::string outbound;
    std::int64_t uplink = 0;
    std::int64_t downlink = 0;
};

struct all_inbounds_stats_response
{
    std::vector<inbound_traffic> inbounds;
};

struct all_outbounds_stats_response
{
    std::vector<outbound_traffic> outbounds;
};

struct combined_stats_response
{
    std::vector<inbound_traffic> inbounds;
    std::vector<outbound_traffic> outbounds;
};

// Request decoders. Malformed bodies and missing required fields yield
// invalid_argument with the offending path.
[[nodiscard]] result<start_request> parse_start_request(const std::string& body);
[[nodiscard]] result<add_user_request> parse_add_user_request(const std::string& body);
[[nodiscard]] result<add_users_request> parse_add_users_request(const std::string& body);
[[nodiscard]] result<remove_user_request> parse_remove_user_request(const std::string& body);
[[nodiscard]] result<remove_users_request> parse_remove_users_request(const std::string& body);
[[nodiscard]] result<username_request> parse_username_request(const std::string& body);
[[nodiscard]] result<tag_reset_request> parse_tag_reset_request(const std::string& body);
[[nodiscard]] result<block_ip_request> parse_block_ip_request(const std::string& body);
// Never fails: an empty or malformed body reads as reset = false.
[[nodiscard]] reset_request parse_reset_request(const std::string& body);

[[nodiscard]] std::string to_json(const start_response& response);
[[nodiscard]] std::string to_json(const stop_response& response);
[[nodiscard]] std::string to_json(const status_response& response);
[[nodiscard]] std::string to_json(const healthcheck_response& response);
[[nodiscard]] std::string to_json(const user_op_response& response);
[[nodiscard]] std::string to_json(const users_stats_response& response);
[[nodiscard]] std::string to_json(const system_stats_response& response);
[[nodiscard]] std::string to_json(const user_online_response& response);
[[nodiscard]] std::string to_json(const inbound_traffic& response);
[[nodiscard]] std::string to_json(const outbound_traffic& response);
[[nodiscard]] std::string to_json(const all_inbounds_stats_response& response);
[[nodiscard]] std::string to_json(const all_outbounds_stats_response& response);
[[nodiscard]] std::string to_json(const combined_stats_response& response);

}    // namespace xnode

#endif
