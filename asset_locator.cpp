#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <system_error>

#include "log.h"
#include "constants.h"
#include "asset_locator.h"

namespace xnode
{

const std::vector<std::string>& default_asset_dirs()
{
    static const std::vector<std::string> dirs = {"/usr/local/share/xray", "/usr/share/xray", "/opt/xray", "."};
    return dirs;
}

std::optional<std::string> locate_assets(const std::string& configured, const std::vector<std::string>& candidates)
{
    if (!configured.empty())
    {
        LOG_INFO("asset dir {} from configuration", configured);
        return configured;
    }

    for (const auto& dir : candidates)
    {
        std::error_code ec;
        const auto path = std::filesystem::path(dir) / constants::engine::kGeoIpFile;
        if (std::filesystem::is_regular_file(path, ec))
        {
            LOG_INFO("asset dir {} found", dir);
            return dir;
        }
        LOG_DEBUG("asset dir {} has no {}", dir, constants::engine::kGeoIpFile);
    }

    LOG_WARN("no asset dir found, geo rules unavailable");
    return std::nullopt;
}

std::optional<std::string> locate_assets(const std::string& configured) { return locate_assets(configured, default_asset_dirs()); }

}    // namespace xnode
