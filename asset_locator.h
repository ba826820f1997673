#ifndef ASSET_LOCATOR_H
#define ASSET_LOCATOR_H

#include <string>
#include <vector>
#include <optional>

namespace xnode
{

[[nodiscard]] const std::vector<std::string>& default_asset_dirs();

// Resolves the directory holding geoip.dat. A non-empty configured directory
// is used as is; otherwise candidates are probed in order. nullopt when no
// candidate holds the file.
[[nodiscard]] std::optional<std::string> locate_assets(const std::string& configured, const std::vector<std::string>& candidates);
[[nodiscard]] std::optional<std::string> locate_assets(const std::string& configured);

}    // namespace xnode

#endif
