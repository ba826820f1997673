#ifndef ENGINE_H
#define ENGINE_H

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <optional>

#include <boost/asio/ip/address.hpp>

#include "error.h"
#include "memory_user.h"

namespace xnode
{

// Per-inbound user management capability.
class user_registry
{
   public:
    virtual ~user_registry() = default;

    virtual result<void> add_user(const memory_user& user) = 0;
    virtual result<void> remove_user(const std::string& email) = 0;
    [[nodiscard]] virtual std::size_t user_count() const = 0;
    [[nodiscard]] virtual std::vector<std::string> user_emails() const = 0;
};

// Looks up inbound handlers by tag. An unknown tag yields not_found, a handler
// without per-user management yields unsupported.
class inbound_manager
{
   public:
    virtual ~inbound_manager() = default;

    [[nodiscard]] virtual result<std::shared_ptr<user_registry>> find_user_registry(const std::string& tag) = 0;
    [[nodiscard]] virtual std::vector<std::string> inbound_tags() const = 0;
};

struct routing_rule
{
    std::string rule_tag;
    std::string outbound_tag;
    boost::asio::ip::address source;
    std::uint8_t prefix = 32;
};

class rule_router
{
   public:
    virtual ~rule_router() = default;

    virtual result<void> add_rule(const routing_rule& rule, bool append) = 0;
    // not_found when no rule carries the tag.
    virtual result<void> remove_rule(const std::string& rule_tag) = 0;
};

struct stat_counter
{
    std::string name;
    std::int64_t value = 0;
};

class stats_registry
{
   public:
    virtual ~stats_registry() = default;

    // Substring match on the counter name; an empty pattern selects all.
    [[nodiscard]] virtual std::vector<stat_counter> query(const std::string& pattern, bool reset) = 0;
    [[nodiscard]] virtual std::vector<stat_counter> query_prefix(const std::string& prefix, bool reset) = 0;
    // nullopt when no counter carries the name.
    [[nodiscard]] virtual std::optional<std::int64_t> value(const std::string& name, bool reset) = 0;
};

class engine_instance
{
   public:
    virtual ~engine_instance() = default;

    virtual result<void> start() = 0;
    virtual result<void> close() = 0;

    // Capability queries. Each returns the feature or an unsupported error.
    [[nodiscard]] virtual result<std::shared_ptr<inbound_manager>> inbounds() = 0;
    [[nodiscard]] virtual result<std::shared_ptr<rule_router>> router() = 0;
    [[nodiscard]] virtual result<std::shared_ptr<stats_registry>> stats() = 0;
};

// Turns a JSON configuration payload into an engine instance.
class engine_loader
{
   public:
    virtual ~engine_loader() = default;

    // config error for malformed or semantically invalid payloads.
    [[nodiscard]] virtual result<void> validate(const std::string& config_json) const = 0;
    // lifecycle error when a valid payload cannot be instantiated.
    [[nodiscard]] virtual result<std::shared_ptr<engine_instance>> create(const std::string& config_json) = 0;
    [[nodiscard]] virtual std::string version() const = 0;
};

}    // namespace xnode

#endif
