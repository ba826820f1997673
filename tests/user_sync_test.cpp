#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "error.h"
#include "accounts.h"
#include "user_sync.h"
#include "mock_engine.h"
#include "engine_handle.h"
#include "registry_engine.h"

namespace xnode
{

namespace
{

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ElementsAre;

constexpr const char* kUuidA = "b7a1c3e2-1111-4222-8333-944455556666";
constexpr const char* kUuidB = "c8b2d4f3-2222-4333-9444-a55566667777";

const char* const kConfig = R"({
  "inbounds": [
    {"tag": "vless-in", "protocol": "vless", "settings": {"clients": [{"id": "b7a1c3e2-1111-4222-8333-944455556666", "email": "seed"}]}},
    {"tag": "trojan-in", "protocol": "trojan", "settings": {"clients": []}},
    {"tag": "socks-in", "protocol": "socks"}
  ]
})";

class UserSyncTest : public ::testing::Test
{
   protected:
    void SetUp() override { ASSERT_TRUE(engine_.start(kConfig).has_value()); }

    engine_handle engine_{std::make_shared<registry_loader>("")};
    user_sync users_{engine_};
};

}    // namespace

TEST(UserSyncIdleTest, EngineNotRunning)
{
    engine_handle engine(std::make_shared<registry_loader>(""));
    user_sync users(engine);

    const auto added = users.add_user("vless-in", build_vless_user("alice", kUuidA, "", 0));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().kind, error_kind::not_running);
    EXPECT_EQ(added.error().reason, "engine not running");

    EXPECT_EQ(users.remove_user("vless-in", "alice").error().kind, error_kind::not_running);
    EXPECT_EQ(users.remove_users("vless-in", {"alice"}).error().kind, error_kind::not_running);
    EXPECT_EQ(users.list_users("vless-in").error().kind, error_kind::not_running);
}

TEST(UserSyncIdleTest, InboundManagerUnavailable)
{
    auto loader = std::make_shared<NiceMock<mock_engine_loader>>();
    auto instance = std::make_shared<NiceMock<mock_engine_instance>>();
    EXPECT_CALL(*loader, create(_)).WillOnce(Return(result<std::shared_ptr<engine_instance>>(instance)));
    ON_CALL(*instance, inbounds())
        .WillByDefault(Return(result<std::shared_ptr<inbound_manager>>(std::unexpected(make_error(error_kind::unsupported, "no handler manager")))));

    engine_handle engine(loader);
    ASSERT_TRUE(engine.start("{}").has_value());
    user_sync users(engine);

    const auto added = users.add_user("vless-in", build_vless_user("alice", kUuidA, "", 0));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().kind, error_kind::unsupported);
    EXPECT_EQ(added.error().reason, "inbound manager not available: no handler manager");
}

TEST_F(UserSyncTest, UnknownInboundTag)
{
    const auto added = users_.add_user("missing", build_vless_user("alice", kUuidA, "", 0));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().kind, error_kind::not_found);
    EXPECT_EQ(added.error().reason, "no such inbound tag 'missing'");
}

TEST_F(UserSyncTest, HandlerWithoutUserManagement)
{
    const auto added = users_.add_user("socks-in", build_vless_user("alice", kUuidA, "", 0));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().kind, error_kind::unsupported);
    EXPECT_EQ(added.error().reason, "handler 'socks-in' does not manage users: proxy is not a UserManager");
}

TEST_F(UserSyncTest, PreloadedClientsAreListed)
{
    const auto listed = users_.list_users("vless-in");
    ASSERT_TRUE(listed.has_value());
    EXPECT_THAT(*listed, ElementsAre("seed"));

    const auto empty = users_.list_users("trojan-in");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST_F(UserSyncTest, AddUser)
{
    ASSERT_TRUE(users_.add_user("vless-in", build_vless_user("alice", kUuidB, "xtls-rprx-vision", 0)).has_value());
    ASSERT_TRUE(users_.add_user("trojan-in", build_trojan_user("alice", "secret", 0)).has_value());

    EXPECT_THAT(*users_.list_users("vless-in"), ElementsAre("alice", "seed"));
    EXPECT_THAT(*users_.list_users("trojan-in"), ElementsAre("alice"));
}

TEST_F(UserSyncTest, DuplicateEmailIsRejected)
{
    const auto added = users_.add_user("vless-in", build_vless_user("seed", kUuidB, "", 0));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().kind, error_kind::conflict);
    EXPECT_EQ(added.error().reason, "failed to add user 'seed' to inbound 'vless-in': User seed already exists.");
}

TEST_F(UserSyncTest, ConversionFailureNamesUser)
{
    const auto added = users_.add_user("vless-in", build_vless_user("bob", "123", "", 0));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().kind, error_kind::invalid_argument);
    EXPECT_EQ(added.error().reason, "failed to convert user 'bob' to memory user: invalid uuid '123'");
}

TEST_F(UserSyncTest, ProtocolMismatchIsRejected)
{
    const auto added = users_.add_user("trojan-in", build_vless_user("bob", kUuidB, "", 0));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().kind, error_kind::invalid_argument);
}

TEST_F(UserSyncTest, AddUsersStopsAtFirstFailure)
{
    const std::vector<user_account> batch = {
        build_trojan_user("a", "pa", 0),
        build_trojan_user("b", "", 0),
        build_trojan_user("c", "pc", 0),
    };
    const auto added = users_.add_users("trojan-in", batch);
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().reason, "failed to convert user 'b' to memory user: trojan password is empty");
    EXPECT_THAT(*users_.list_users("trojan-in"), ElementsAre("a"));
}

TEST_F(UserSyncTest, AddUsersEmptyBatch) { EXPECT_TRUE(users_.add_users("trojan-in", {}).has_value()); }

TEST_F(UserSyncTest, RemoveUser)
{
    ASSERT_TRUE(users_.remove_user("vless-in", "seed").has_value());
    EXPECT_TRUE(users_.list_users("vless-in")->empty());
}

TEST_F(UserSyncTest, RemoveMissingUser)
{
    const auto removed = users_.remove_user("vless-in", "ghost");
    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error().kind, error_kind::not_found);
    EXPECT_EQ(removed.error().reason, "failed to remove user 'ghost' from inbound 'vless-in': User ghost not found.");
}

TEST_F(UserSyncTest, RemoveUsersSkipsPerUserFailures)
{
    ASSERT_TRUE(users_.add_user("vless-in", build_vless_user("alice", kUuidB, "", 0)).has_value());
    EXPECT_TRUE(users_.remove_users("vless-in", {"seed", "ghost", "alice"}).has_value());
    EXPECT_TRUE(users_.list_users("vless-in")->empty());
}

TEST_F(UserSyncTest, RemoveUsersLookupFailureIsReturned)
{
    const auto removed = users_.remove_users("missing", {"seed"});
    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error().kind, error_kind::not_found);
}

TEST_F(UserSyncTest, RemoveFromAllInbounds)
{
    ASSERT_TRUE(users_.add_user("vless-in", build_vless_user("x", kUuidB, "", 0)).has_value());
    ASSERT_TRUE(users_.add_user("trojan-in", build_trojan_user("x", "px", 0)).has_value());

    users_.remove_user_from_all_inbounds({"vless-in", "missing", "socks-in", "trojan-in"}, "x");

    EXPECT_THAT(*users_.list_users("vless-in"), ElementsAre("seed"));
    EXPECT_TRUE(users_.list_users("trojan-in")->empty());
}

}    // namespace xnode
