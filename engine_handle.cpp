#include <memory>
#include <string>
#include <utility>
#include <shared_mutex>

#include <boost/system/error_code.hpp>
#include <boost/asio/ip/address.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "log.h"
#include "error.h"
#include "engine.h"
#include "engine_handle.h"

namespace xnode
{

namespace
{

boost::asio::ip::address normalize_address(const boost::asio::ip::address& addr)
{
    if (addr.is_v6())
    {
        const auto v6 = addr.to_v6();
        if (v6.is_v4_mapped())
        {
            const auto bytes = v6.to_bytes();
            const boost::asio::ip::address_v4::bytes_type v4_bytes = {bytes[12], bytes[13], bytes[14], bytes[15]};
            return boost::asio::ip::address_v4(v4_bytes);
        }
    }
    return addr;
}

}    // namespace

engine_handle::engine_handle(std::shared_ptr<engine_loader> loader) : loader_(std::move(loader)) {}

engine_handle::~engine_handle()
{
    const std::unique_lock lock(mutex_);
    if (auto stopped = stop_locked(); !stopped)
    {
        LOG_ERROR("engine close on shutdown failed {}", stopped.error().reason);
    }
}

result<void> engine_handle::start(const std::string& config_json)
{
    const std::unique_lock lock(mutex_);

    if (running_)
    {
        if (auto stopped = stop_locked(); !stopped)
        {
            return std::unexpected(wrap_error("failed to stop existing instance", stopped.error()));
        }
    }

    if (auto valid = loader_->validate(config_json); !valid)
    {
        return std::unexpected(wrap_error("failed to load config", valid.error()));
    }

    auto created = loader_->create(config_json);
    if (!created)
    {
        return std::unexpected(wrap_error("failed to create engine instance", created.error()));
    }

    auto instance = std::move(*created);
    if (auto started = instance->start(); !started)
    {
        if (auto closed = instance->close(); !closed)
        {
            LOG_WARN("close partially started engine failed {}", closed.error().reason);
        }
        return std::unexpected(make_error(error_kind::lifecycle, "failed to start engine: " + started.error().reason));
    }

    instance_ = std::move(instance);
    running_ = true;
    LOG_INFO("engine {} started", loader_->version());
    return {};
}

result<void> engine_handle::stop()
{
    const std::unique_lock lock(mutex_);
    return stop_locked();
}

result<void> engine_handle::stop_locked()
{
    if (instance_ == nullptr)
    {
        running_ = false;
        return {};
    }

    auto closed = instance_->close();
    // A failed close still releases the instance so that a later start can retry.
    instance_.reset();
    running_ = false;
    if (!closed)
    {
        return std::unexpected(make_error(error_kind::lifecycle, "failed to close engine instance: " + closed.error().reason));
    }

    LOG_INFO("engine stopped");
    return {};
}

bool engine_handle::is_running() const
{
    const std::shared_lock lock(mutex_);
    return running_;
}

std::string engine_handle::version() const { return loader_->version(); }

std::shared_ptr<engine_instance> engine_handle::instance() const
{
    const std::shared_lock lock(mutex_);
    return instance_;
}

result<std::shared_ptr<rule_router>> engine_handle::get_router() const
{
    std::shared_ptr<engine_instance> instance;
    {
        const std::shared_lock lock(mutex_);
        instance = instance_;
    }

    if (instance == nullptr)
    {
        return std::unexpected(make_error(error_kind::not_running, "engine instance not running"));
    }

    auto router = instance->router();
    if (!router)
    {
        return std::unexpected(make_error(error_kind::unsupported, "router does not support dynamic rule management: " + router.error().reason));
    }
    return router;
}

result<void> engine_handle::add_routing_rule(const std::string& rule_tag, const std::string& source_ip, const std::string& outbound_tag)
{
    auto router = get_router();
    if (!router)
    {
        return std::unexpected(router.error());
    }

    boost::system::error_code ec;
    const auto parsed = boost::asio::ip::make_address(source_ip, ec);
    if (ec)
    {
        return std::unexpected(make_error(error_kind::invalid_argument, "invalid IP address: " + source_ip));
    }

    routing_rule rule;
    rule.rule_tag = rule_tag;
    rule.outbound_tag = outbound_tag;
    rule.source = normalize_address(parsed);
    rule.prefix = rule.source.is_v4() ? 32 : 128;

    if (auto added = (*router)->add_rule(rule, true); !added)
    {
        return std::unexpected(wrap_error("failed to add routing rule", added.error()));
    }

    LOG_INFO("added routing rule {} source {} outbound {}", rule_tag, source_ip, outbound_tag);
    return {};
}

result<void> engine_handle::remove_routing_rule(const std::string& rule_tag)
{
    auto router = get_router();
    if (!router)
    {
        return std::unexpected(router.error());
    }

    if (auto removed = (*router)->remove_rule(rule_tag); !removed)
    {
        if (removed.error().kind == error_kind::not_found)
        {
            LOG_WARN("routing rule {} not found may already be removed", rule_tag);
            return {};
        }
        return std::unexpected(wrap_error("failed to remove routing rule", removed.error()));
    }

    LOG_INFO("removed routing rule {}", rule_tag);
    return {};
}

result<void> engine_handle::validate_config(const std::string& config_json) const
{
    rapidjson::Document doc;
    doc.Parse(config_json.data(), config_json.size());
    if (doc.HasParseError())
    {
        return std::unexpected(make_error(error_kind::config, std::string("invalid JSON: ") + rapidjson::GetParseError_En(doc.GetParseError())));
    }

    if (auto valid = loader_->validate(config_json); !valid)
    {
        return std::unexpected(wrap_error("invalid engine config", valid.error()));
    }
    return {};
}

}    // namespace xnode
