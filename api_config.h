#ifndef API_CONFIG_H
#define API_CONFIG_H

#include <cstdint>
#include <string_view>

#include <rapidjson/document.h>

namespace xnode
{

constexpr std::string_view kApiTag = "api";

// Copy of config with the local management inbound, its routing rule and the
// api/stats sections added where the panel did not provide them.
[[nodiscard]] rapidjson::Document generate_api_config(const rapidjson::Value& config, std::uint16_t api_port);

}    // namespace xnode

#endif
