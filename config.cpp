#include <cerrno>
#include <cstdio>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>
#include <utility>
#include <expected>
#include <optional>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/error/error.h>

#include "config.h"
#include "reflect.h"

namespace reflect
{

REFLECT_STRUCT_BEGIN(xnode::config::log_t)
REFLECT_MEMBER(level);
REFLECT_MEMBER(file);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::config::engine_t)
REFLECT_MEMBER(api_port);
REFLECT_MEMBER(asset_dir);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::config::startup_t)
REFLECT_MEMBER(file);
REFLECT_STRUCT_END()

REFLECT_STRUCT_BEGIN(xnode::config)
REFLECT_MEMBER(log);
REFLECT_MEMBER(engine);
REFLECT_MEMBER(startup);
REFLECT_STRUCT_END()

}    // namespace reflect

namespace xnode
{

namespace
{

[[nodiscard]] config_error make_config_error(std::string path, std::string reason)
{
    config_error error;
    error.path = std::move(path);
    error.reason = std::move(reason);
    return error;
}

[[nodiscard]] bool is_known_level(const std::string& level)
{
    for (const char* name : {"trace", "debug", "info", "warn", "warning", "err", "error"})
    {
        if (level == name)
        {
            return true;
        }
    }
    return false;
}

[[nodiscard]] std::expected<void, config_error> validate_config(const config& cfg)
{
    if (!is_known_level(cfg.log.level))
    {
        return std::unexpected(make_config_error("/log/level", "must be one of trace debug info warn error"));
    }
    if (cfg.log.file.empty())
    {
        return std::unexpected(make_config_error("/log/file", "must be non-empty"));
    }
    if (cfg.engine.api_port == 0)
    {
        return std::unexpected(make_config_error("/engine/api_port", "must be non-zero"));
    }
    return {};
}

}    // namespace

std::expected<std::string, config_error> read_text_file(const std::string& filename)
{
    FILE* file = std::fopen(filename.c_str(), "rb");
    if (file == nullptr)
    {
        return std::unexpected(make_config_error("/", std::string("open file failed ") + std::strerror(errno)));
    }

    std::string content;
    std::vector<char> buffer(4096);
    for (;;)
    {
        const std::size_t n = std::fread(buffer.data(), 1, buffer.size(), file);
        content.append(buffer.data(), n);
        if (n < buffer.size())
        {
            break;
        }
    }
    const bool failed = std::ferror(file) != 0;
    std::fclose(file);
    if (failed)
    {
        return std::unexpected(make_config_error("/", "read file failed"));
    }
    return content;
}

std::expected<config, config_error> parse_config_text(const std::string& text)
{
    rapidjson::Document doc;
    doc.Parse(text.data(), text.size());
    if (doc.HasParseError())
    {
        return std::unexpected(make_config_error(
            "/", std::string("invalid json at offset ") + std::to_string(doc.GetErrorOffset()) + " " + rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject())
    {
        return std::unexpected(make_config_error("/", "root must be an object"));
    }

    config cfg;
    if (const auto invalid_path = reflect::deserialize_value(cfg, doc); invalid_path.has_value())
    {
        return std::unexpected(make_config_error(*invalid_path, "type mismatch"));
    }

    if (auto valid = validate_config(cfg); !valid)
    {
        return std::unexpected(valid.error());
    }
    return cfg;
}

std::expected<config, config_error> parse_config_with_error(const std::string& filename)
{
    auto content = read_text_file(filename);
    if (!content)
    {
        return std::unexpected(content.error());
    }
    return parse_config_text(*content);
}

std::optional<config> parse_config(const std::string& filename)
{
    auto cfg = parse_config_with_error(filename);
    if (!cfg)
    {
        return std::nullopt;
    }
    return std::move(*cfg);
}

void apply_env_overrides(config& cfg)
{
    if (const char* level = std::getenv("LOG_LEVEL"); level != nullptr && is_known_level(level))
    {
        cfg.log.level = level;
    }
    if (const char* asset = std::getenv("XRAY_LOCATION_ASSET"); asset != nullptr && asset[0] != '\0')
    {
        cfg.engine.asset_dir = asset;
    }
}

std::string dump_config(const config& cfg) { return reflect::serialize_struct(cfg); }

std::string dump_default_config()
{
    const config cfg;
    return dump_config(cfg);
}

}    // namespace xnode
