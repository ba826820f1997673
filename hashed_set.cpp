#include <array>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "hashed_set.h"

namespace xnode
{

namespace
{

constexpr std::uint32_t kHighSeed = 5381;
constexpr std::uint32_t kLowSeed = 5387;
constexpr std::uint32_t kLowCharFactor = 37;

void append_hex32(std::string& out, const std::uint32_t value)
{
    static constexpr std::array<char, 16> kDigits = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    for (int shift = 28; shift >= 0; shift -= 4)
    {
        out.push_back(kDigits[(value >> shift) & 0x0fU]);
    }
}

}    // namespace

dual_hash djb2_dual(const std::string_view value)
{
    std::uint32_t h = kHighSeed;
    std::uint32_t l = kLowSeed;
    for (const char ch : value)
    {
        const auto c = static_cast<std::uint32_t>(static_cast<unsigned char>(ch));
        h = (h << 5) + h + c;
        l = (l << 6) + l + (c * kLowCharFactor);
    }
    return dual_hash{.high = h, .low = l};
}

void hashed_set::add(const std::string& value)
{
    if (!items_.insert(value).second)
    {
        return;
    }
    const auto hash = djb2_dual(value);
    hash_high_ ^= hash.high;
    hash_low_ ^= hash.low;
}

void hashed_set::remove(const std::string& value)
{
    if (items_.erase(value) == 0)
    {
        return;
    }
    const auto hash = djb2_dual(value);
    hash_high_ ^= hash.high;
    hash_low_ ^= hash.low;
}

void hashed_set::clear()
{
    items_.clear();
    hash_high_ = 0;
    hash_low_ = 0;
}

std::string hashed_set::fingerprint() const
{
    std::string out;
    out.reserve(16);
    append_hex32(out, hash_high_);
    append_hex32(out, hash_low_);
    return out;
}

std::vector<std::string> hashed_set::items() const { return {items_.begin(), items_.end()}; }

}    // namespace xnode
