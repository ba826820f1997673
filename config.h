#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <cstdint>
#include <optional>
#include <expected>

#include "constants.h"

namespace xnode
{

struct config
{
    struct log_t
    {
        std::string level = "info";
        std::string file = "xnode.log";
    } log;

    struct engine_t
    {
        std::uint16_t api_port = constants::engine::kDefaultApiPort;
        std::string asset_dir;
    } engine;

    struct startup_t
    {
        std::string file;
    } startup;
};

struct config_error
{
    std::string path = "/";
    std::string reason;
};

[[nodiscard]] std::expected<std::string, config_error> read_text_file(const std::string& filename);
[[nodiscard]] std::expected<config, config_error> parse_config_with_error(const std::string& filename);
[[nodiscard]] std::optional<config> parse_config(const std::string& filename);
[[nodiscard]] std::expected<config, config_error> parse_config_text(const std::string& text);
// LOG_LEVEL and XRAY_LOCATION_ASSET take precedence over the file.
void apply_env_overrides(config& cfg);
[[nodiscard]] std::string dump_config(const config& cfg);
[[nodiscard]] std::string dump_default_config();

}    // namespace xnode

#endif
