#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <cstdint>
#include <string_view>

namespace xnode::constants
{

namespace version
{
constexpr std::string_view kNode = "1.4.0";
constexpr std::string_view kEngine = "registry-1.0.0";
}    // namespace version

namespace engine
{
constexpr std::uint16_t kDefaultApiPort = 61012;
constexpr std::string_view kBlockOutboundTag = "block";
constexpr std::string_view kGeoIpFile = "geoip.dat";
}    // namespace engine

namespace stats
{
constexpr std::string_view kSeparator = ">>>";
constexpr std::string_view kUser = "user";
constexpr std::string_view kInbound = "inbound";
constexpr std::string_view kOutbound = "outbound";
constexpr std::string_view kTraffic = "traffic";
constexpr std::string_view kOnline = "online";
constexpr std::string_view kUplink = "uplink";
constexpr std::string_view kDownlink = "downlink";
}    // namespace stats

}    // namespace xnode::constants

#endif
