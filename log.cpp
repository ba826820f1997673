#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

#include "log.h"

#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace xnode
{

namespace
{

spdlog::level::level_enum parse_level_name(const std::string& level)
{
    struct level_alias
    {
        const char* name;
        spdlog::level::level_enum value;
    };

    static constexpr level_alias kLevels[] = {
        {.name = "trace", .value = spdlog::level::trace},
        {.name = "debug", .value = spdlog::level::debug},
        {.name = "info", .value = spdlog::level::info},
        {.name = "warn", .value = spdlog::level::warn},
        {.name = "warning", .value = spdlog::level::warn},
        {.name = "err", .value = spdlog::level::err},
        {.name = "error", .value = spdlog::level::err},
    };

    for (const auto& entry : kLevels)
    {
        if (level == entry.name)
        {
            return entry.value;
        }
    }
    return spdlog::level::info;
}

std::uint32_t env_or(const char* name, const std::uint32_t fallback)
{
    const char* value = std::getenv(name);
    if (value == nullptr)
    {
        return fallback;
    }
    const long parsed = std::strtol(value, nullptr, 10);
    if (parsed <= 0)
    {
        return fallback;
    }
    return static_cast<std::uint32_t>(parsed);
}

std::uint32_t get_log_file_size()
{
    constexpr std::uint32_t kFileSize = 50 * 1024 * 1024;
    return env_or("kLogFileSize", kFileSize);
}

std::uint32_t get_log_file_count()
{
    constexpr std::uint32_t kFileCount = 5;
    return env_or("kLogFileCount", kFileCount);
}

void apply_env_level_override()
{
    if (std::getenv("TRACE") != nullptr)
    {
        spdlog::set_level(spdlog::level::trace);
    }
    else if (std::getenv("DEBUG") != nullptr)
    {
        spdlog::set_level(spdlog::level::debug);
    }
}

}    // namespace

void init_log(const std::string& filename, const std::string& level)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!filename.empty())
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, get_log_file_size(), get_log_file_count()));
    }
    auto logger = std::make_shared<spdlog::logger>("", begin(sinks), end(sinks));
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));
    spdlog::set_pattern("%Y%m%d %T.%f %t %L %v %s:%#");

    set_level(level);
    apply_env_level_override();
}

void set_level(const std::string& level) { spdlog::set_level(parse_level_name(level)); }

std::string current_level()
{
    const auto name = spdlog::level::to_string_view(spdlog::get_level());
    return {name.data(), name.size()};
}

void shutdown_log()
{
    spdlog::default_logger()->flush();
    spdlog::shutdown();
}

}    // namespace xnode
