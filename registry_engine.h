#ifndef REGISTRY_ENGINE_H
#define REGISTRY_ENGINE_H

#include <map>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <string_view>

#include <boost/asio/ip/address.hpp>

#include "error.h"
#include "engine.h"
#include "memory_user.h"

namespace xnode
{

// Named traffic counters laid out as scope>>>tag>>>traffic>>>direction.
// Every inbound and outbound owns an uplink and a downlink counter; every user
// additionally owns an online counter for as long as it is present in an
// inbound.
class traffic_stats : public stats_registry
{
   public:
    void register_traffic(std::string_view scope, const std::string& tag);
    void register_user(const std::string& email);
    void unregister_user(const std::string& email);

    [[nodiscard]] std::vector<stat_counter> query(const std::string& pattern, bool reset) override;
    [[nodiscard]] std::vector<stat_counter> query_prefix(const std::string& prefix, bool reset) override;
    [[nodiscard]] std::optional<std::int64_t> value(const std::string& name, bool reset) override;

    [[nodiscard]] static std::string counter_name(std::string_view scope, const std::string& tag, std::string_view direction);
    [[nodiscard]] static std::string online_name(const std::string& email);

   private:
    // Feed for a forwarding data path, which this backend does not run.
    // Counters that were never registered are ignored.
    void record(std::string_view scope, const std::string& tag, std::int64_t uplink, std::int64_t downlink);
    void set_online(const std::string& email, std::int64_t connections);

    std::mutex mutex_;
    std::map<std::string, std::int64_t> counters_;
};

class inbound_users : public user_registry
{
   public:
    inbound_users(std::string tag, std::string protocol, std::shared_ptr<traffic_stats> stats);

    result<void> add_user(const memory_user& user) override;
    result<void> remove_user(const std::string& email) override;
    [[nodiscard]] std::size_t user_count() const override;
    [[nodiscard]] std::vector<std::string> user_emails() const override;

    [[nodiscard]] const std::string& protocol() const { return protocol_; }

   private:
    [[nodiscard]] std::optional<memory_user> find_user(const std::string& email) const;

    std::string tag_;
    std::string protocol_;
    std::shared_ptr<traffic_stats> stats_;
    mutable std::mutex mutex_;
    std::map<std::string, memory_user> users_;
};

class inbound_table : public inbound_manager
{
   public:
    // users is null for handlers without per-user management.
    void add_inbound(const std::string& tag, std::shared_ptr<inbound_users> users);

    [[nodiscard]] result<std::shared_ptr<user_registry>> find_user_registry(const std::string& tag) override;
    [[nodiscard]] std::vector<std::string> inbound_tags() const override;

   private:
    std::map<std::string, std::shared_ptr<inbound_users>> inbounds_;
};

class rule_table : public rule_router
{
   public:
    result<void> add_rule(const routing_rule& rule, bool append) override;
    result<void> remove_rule(const std::string& rule_tag) override;

   private:
    // Outbound of the first rule whose source prefix covers addr.
    [[nodiscard]] std::optional<std::string> match(const boost::asio::ip::address& addr) const;
    [[nodiscard]] std::vector<routing_rule> rules() const;

    mutable std::mutex mutex_;
    std::vector<routing_rule> rules_;
};

// Engine instance hosting user registries, dynamic routing rules and traffic
// counters for a loaded configuration. It does not forward traffic.
class registry_instance : public engine_instance
{
   public:
    registry_instance(std::shared_ptr<inbound_table> inbounds, std::shared_ptr<rule_table> router, std::shared_ptr<traffic_stats> stats);

    result<void> start() override;
    result<void> close() override;

    [[nodiscard]] result<std::shared_ptr<inbound_manager>> inbounds() override;
    [[nodiscard]] result<std::shared_ptr<rule_router>> router() override;
    [[nodiscard]] result<std::shared_ptr<stats_registry>> stats() override;

   private:
    [[nodiscard]] bool started() const;

    std::shared_ptr<inbound_table> inbounds_;
    std::shared_ptr<rule_table> router_;
    std::shared_ptr<traffic_stats> stats_;
    mutable std::mutex mutex_;
    bool started_ = false;
    bool closed_ = false;
};

class registry_loader : public engine_loader
{
   public:
    // An empty asset_dir disables geoip/geosite references in routing rules.
    explicit registry_loader(std::string asset_dir);

    [[nodiscard]] result<void> validate(const std::string& config_json) const override;
    [[nodiscard]] result<std::shared_ptr<engine_instance>> create(const std::string& config_json) override;
    [[nodiscard]] std::string version() const override;

   private:
    std::string asset_dir_;
};

}    // namespace xnode

#endif
