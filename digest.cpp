#include <array>
#include <string>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include <openssl/evp.h>

#include "error.h"
#include "digest.h"

namespace xnode
{

namespace
{

result<std::string> evp_hex(std::string_view data, const EVP_MD* md, const char* name)
{
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, md, nullptr) != 1)
    {
        return std::unexpected(make_error(error_kind::internal, std::string(name) + " digest failed"));
    }
    return bytes_to_hex(digest.data(), digest_len);
}

}    // namespace

std::string bytes_to_hex(const std::uint8_t* data, const std::size_t len)
{
    static constexpr std::array<char, 16> kHexTable = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string hex;
    hex.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i)
    {
        hex[2 * i] = kHexTable[(data[i] >> 4) & 0x0F];
        hex[2 * i + 1] = kHexTable[data[i] & 0x0F];
    }
    return hex;
}

result<std::string> sha224_hex(std::string_view data) { return evp_hex(data, EVP_sha224(), "sha224"); }

result<std::string> md5_hex(std::string_view data) { return evp_hex(data, EVP_md5(), "md5"); }

}    // namespace xnode
