#include <string>

#include <gtest/gtest.h>

#include "error.h"
#include "accounts.h"
#include "node_messages.h"

namespace xnode
{

TEST(NodeMessagesTest, ParseStartRequest)
{
    const auto request = parse_start_request(R"({
      "xrayConfig": {"inbounds": [{"tag": "vless-in", "protocol": "vless"}]},
      "internals": {
        "forceRestart": true,
        "hashes": {"emptyConfig": "0002b606000565d0", "inbounds": [{"tag": "vless-in", "hash": "0002b6090005663f", "usersCount": 3}]}
      }
    })");
    ASSERT_TRUE(request.has_value());
    ASSERT_NE(request->engine_config, nullptr);
    ASSERT_TRUE(request->engine_config->IsObject());
    EXPECT_STREQ((*request->engine_config)["inbounds"][0]["tag"].GetString(), "vless-in");
    EXPECT_TRUE(request->force_restart);
    EXPECT_EQ(request->hashes.base_config_fingerprint, "0002b606000565d0");
    ASSERT_EQ(request->hashes.inbounds.size(), 1U);
    EXPECT_EQ(request->hashes.inbounds[0].tag, "vless-in");
    EXPECT_EQ(request->hashes.inbounds[0].fingerprint, "0002b6090005663f");
    EXPECT_EQ(request->hashes.inbounds[0].member_count, 3);
}

TEST(NodeMessagesTest, StartRequestDefaults)
{
    const auto request = parse_start_request(R"({"xrayConfig": {}, "internals": {}})");
    ASSERT_TRUE(request.has_value());
    EXPECT_FALSE(request->force_restart);
    EXPECT_TRUE(request->hashes.base_config_fingerprint.empty());
    EXPECT_TRUE(request->hashes.inbounds.empty());
}

TEST(NodeMessagesTest, StartRequestRejections)
{
    const auto not_json = parse_start_request("xrayConfig");
    ASSERT_FALSE(not_json.has_value());
    EXPECT_EQ(not_json.error().kind, error_kind::invalid_argument);
    EXPECT_EQ(not_json.error().reason.rfind("invalid request body: invalid json at offset", 0), 0U);

    EXPECT_EQ(parse_start_request("[]").error().reason, "invalid request body: root must be an object");
    EXPECT_EQ(parse_start_request(R"({"internals": {}})").error().reason, "invalid request body: /xrayConfig must be an object");
    EXPECT_EQ(parse_start_request(R"({"xrayConfig": "{}", "internals": {}})").error().reason, "invalid request body: /xrayConfig must be an object");
    EXPECT_EQ(parse_start_request(R"({"xrayConfig": {}})").error().reason, "invalid request body: /internals must be an object");
    EXPECT_EQ(parse_start_request(R"({"xrayConfig": {}, "internals": {"forceRestart": "yes"}})").error().reason,
              "invalid request body: /internals/forceRestart type mismatch");
    EXPECT_EQ(parse_start_request(R"({"xrayConfig": {}, "internals": {"hashes": {"inbounds": [{"tag": "a", "usersCount": "2"}]}}})").error().reason,
              "invalid request body: /internals/hashes/inbounds/0/usersCount type mismatch");
}

TEST(NodeMessagesTest, ParseAddUserRequest)
{
    const auto request = parse_add_user_request(R"({
      "data": [
        {"tag": "vless-in", "username": "alice", "type": "vless", "uuid": "b7a1c3e2-1111-4222-8333-944455556666", "flow": "xtls-rprx-vision"},
        {"tag": "ss-in", "username": "alice", "type": "shadowsocks", "password": "pw", "cipherType": "aes-256-gcm", "ivCheck": true}
      ],
      "hashData": {"vlessUuid": "new-uuid", "prevVlessUuid": "old-uuid"}
    })");
    ASSERT_TRUE(request.has_value());
    ASSERT_EQ(request->data.size(), 2U);
    EXPECT_EQ(request->data[0].flow, "xtls-rprx-vision");
    EXPECT_EQ(request->data[1].cipher_type, "aes-256-gcm");
    EXPECT_TRUE(request->data[1].iv_check);
    EXPECT_FALSE(request->data[0].iv_check);
    EXPECT_EQ(request->hash_data.vless_uuid, "new-uuid");
    EXPECT_EQ(request->hash_data.prev_vless_uuid, "old-uuid");
}

TEST(NodeMessagesTest, AddUserRequiredFields)
{
    EXPECT_EQ(parse_add_user_request(R"({"hashData": {}})").error().reason, "invalid request body: /data is required");
    EXPECT_EQ(parse_add_user_request(R"({"data": [{"username": "a", "type": "vless"}]})").error().reason, "invalid request body: /data/0/tag is required");
    EXPECT_EQ(parse_add_user_request(R"({"data": [{"tag": "t", "username": "a", "type": "trojan"}, {"tag": "t", "type": "trojan"}]})").error().reason,
              "invalid request body: /data/1/username is required");
    EXPECT_EQ(parse_add_user_request(R"({"data": [{"tag": "t", "username": "a", "type": 3}]})").error().reason,
              "invalid request body: /data/0/type type mismatch");
    EXPECT_TRUE(parse_add_user_request(R"({"data": []})").has_value());
}

TEST(NodeMessagesTest, ParseAddUsersRequest)
{
    const auto request = parse_add_users_request(R"({
      "affectedInboundTags": ["vless-in", "trojan-in"],
      "users": [{
        "userData": {"userId": "u1", "hashUuid": "h1", "vlessUuid": "v1", "trojanPassword": "t1", "ssPassword": "s1"},
        "inboundData": [{"tag": "trojan-in", "type": "trojan"}, {"tag": "ss-in", "type": "shadowsocks", "cipherType": "none"}]
      }]
    })");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->affected_inbound_tags.size(), 2U);
    ASSERT_EQ(request->users.size(), 1U);
    const auto& user = request->users[0];
    EXPECT_EQ(user.user.user_id, "u1");
    EXPECT_EQ(user.user.hash_uuid, "h1");
    EXPECT_EQ(user.user.vless_uuid, "v1");
    EXPECT_EQ(user.user.trojan_password, "t1");
    EXPECT_EQ(user.user.ss_password, "s1");
    ASSERT_EQ(user.inbounds.size(), 2U);
    EXPECT_EQ(user.inbounds[1].cipher_type, "none");
}

TEST(NodeMessagesTest, AddUsersRequiredFields)
{
    EXPECT_EQ(parse_add_users_request("{}").error().reason, "invalid request body: /users is required");
    EXPECT_EQ(parse_add_users_request(R"({"users": [{"userData": {}, "inboundData": []}]})").error().reason,
              "invalid request body: /users/0/userData/userId is required");
    EXPECT_EQ(parse_add_users_request(R"({"users": [{"userData": {"userId": "u"}, "inboundData": [{"tag": "t"}]}]})").error().reason,
              "invalid request body: /users/0/inboundData/0/type is required");
}

TEST(NodeMessagesTest, ParseRemoveRequests)
{
    const auto single = parse_remove_user_request(R"({"username": "alice", "hashData": {"vlessUuid": "v"}})");
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->username, "alice");
    EXPECT_EQ(single->hash_data.vless_uuid, "v");
    EXPECT_EQ(parse_remove_user_request(R"({"username": ""})").error().reason, "invalid request body: /username is required");
    EXPECT_EQ(parse_remove_user_request("{}").error().reason, "invalid request body: /username is required");

    const auto bulk = parse_remove_users_request(R"({"users": [{"userId": "a", "hashUuid": "ha"}, {"userId": "b"}]})");
    ASSERT_TRUE(bulk.has_value());
    ASSERT_EQ(bulk->users.size(), 2U);
    EXPECT_EQ(bulk->users[0].hash_uuid, "ha");
    EXPECT_TRUE(bulk->users[1].hash_uuid.empty());
    EXPECT_EQ(parse_remove_users_request(R"({"users": [{"hashUuid": "x"}]})").error().reason, "invalid request body: /users/0/userId is required");
}

TEST(NodeMessagesTest, StartResponseJson)
{
    start_response response;
    response.is_started = true;
    response.version = "registry-1.0.0";
    response.node.version = "1.4.0";
    EXPECT_EQ(to_json(response), R"({"response":{"isStarted":true,"version":"registry-1.0.0","nodeInfo":{"version":"1.4.0"}}})");

    start_response failed;
    failed.error_message = "failed to start engine: boom";
    failed.node.version = "1.4.0";
    EXPECT_EQ(to_json(failed), R"({"response":{"isStarted":false,"error":"failed to start engine: boom","nodeInfo":{"version":"1.4.0"}}})");
}

TEST(NodeMessagesTest, LifecycleResponsesJson)
{
    EXPECT_EQ(to_json(stop_response{.is_stopped = true}), R"({"response":{"isStopped":true}})");
    EXPECT_EQ(to_json(status_response{}), R"({"response":{"isRunning":false}})");
    EXPECT_EQ(to_json(status_response{.is_running = true, .version = "registry-1.0.0"}), R"({"response":{"isRunning":true,"version":"registry-1.0.0"}})");

    healthcheck_response health;
    health.is_engine_running = true;
    health.engine_version = "registry-1.0.0";
    health.node_version = "1.4.0";
    EXPECT_EQ(to_json(health), R"({"response":{"isHealthy":true,"isXrayRunning":true,"xrayVersion":"registry-1.0.0","nodeVersion":"1.4.0"}})");
}

TEST(NodeMessagesTest, UserResponsesJson)
{
    EXPECT_EQ(to_json(user_op_response{.success = true}), R"({"response":{"success":true}})");
    EXPECT_EQ(to_json(user_op_response{.success = false, .error_message = "engine not running"}), R"({"response":{"success":false,"error":"engine not running"}})");

    users_stats_response stats;
    stats.users.push_back(user_traffic{.username = "alice", .uplink = 10, .downlink = 20});
    EXPECT_EQ(to_json(stats), R"({"response":{"users":[{"username":"alice","uplink":10,"downlink":20}]}})");
}

TEST(NodeMessagesTest, ParseStatsRequests)
{
    const auto online = parse_username_request(R"({"username": "alice"})");
    ASSERT_TRUE(online.has_value());
    EXPECT_EQ(online->username, "alice");
    EXPECT_EQ(parse_username_request("{}").error().reason, "invalid request body: /username is required");
    EXPECT_EQ(parse_username_request(R"({"username": 5})").error().reason, "invalid request body: /username type mismatch");

    const auto tagged = parse_tag_reset_request(R"({"tag": "vless-in", "reset": true})");
    ASSERT_TRUE(tagged.has_value());
    EXPECT_EQ(tagged->tag, "vless-in");
    EXPECT_TRUE(tagged->reset);
    EXPECT_FALSE(parse_tag_reset_request(R"({"tag": "direct"})")->reset);
    EXPECT_EQ(parse_tag_reset_request(R"({"reset": true})").error().kind, error_kind::invalid_argument);
    EXPECT_EQ(parse_tag_reset_request(R"({"tag": ""})").error().reason, "invalid request body: /tag is required");
}

TEST(NodeMessagesTest, ResetRequestIsLenient)
{
    EXPECT_TRUE(parse_reset_request(R"({"reset": true})").reset);
    EXPECT_FALSE(parse_reset_request(R"({"reset": false})").reset);
    EXPECT_FALSE(parse_reset_request("").reset);
    EXPECT_FALSE(parse_reset_request("{").reset);
    EXPECT_FALSE(parse_reset_request(R"({"reset": "yes"})").reset);
    EXPECT_FALSE(parse_reset_request("{}").reset);
}

TEST(NodeMessagesTest, ParseBlockIpRequest)
{
    const auto request = parse_block_ip_request(R"({"ip": "203.0.113.9"})");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->ip, "203.0.113.9");
    EXPECT_EQ(parse_block_ip_request("{}").error().reason, "invalid request body: /ip is required");
    EXPECT_EQ(parse_block_ip_request("[]").error().reason, "invalid request body: root must be an object");
}

TEST(NodeMessagesTest, StatsResponsesJson)
{
    system_stats_response system{.uptime = 12, .num_threads = 4, .rss = 4096, .open_fds = 9, .user_cpu_ms = 30, .system_cpu_ms = 5};
    EXPECT_EQ(to_json(system), R"({"response":{"uptime":12,"numThreads":4,"rss":4096,"openFds":9,"userCpuMs":30,"systemCpuMs":5}})");

    EXPECT_EQ(to_json(user_online_response{.online = true}), R"({"response":{"online":true}})");
    EXPECT_EQ(to_json(inbound_traffic{.inbound = "vless-in", .uplink = 1, .downlink = 2}), R"({"response":{"inbound":"vless-in","uplink":1,"downlink":2}})");
    EXPECT_EQ(to_json(outbound_traffic{.outbound = "direct", .uplink = 3, .downlink = 4}), R"({"response":{"outbound":"direct","uplink":3,"downlink":4}})");

    EXPECT_EQ(to_json(all_inbounds_stats_response{}), R"({"response":{"inbounds":[]}})");
    all_outbounds_stats_response outbounds;
    outbounds.outbounds.push_back(outbound_traffic{.outbound = "block"});
    EXPECT_EQ(to_json(outbounds), R"({"response":{"outbounds":[{"outbound":"block","uplink":0,"downlink":0}]}})");

    combined_stats_response combined;
    combined.inbounds.push_back(inbound_traffic{.inbound = "api", .uplink = 5, .downlink = 6});
    EXPECT_EQ(to_json(combined), R"({"response":{"inbounds":[{"inbound":"api","uplink":5,"downlink":6}],"outbounds":[]}})");
}

}    // namespace xnode
