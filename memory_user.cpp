#include <array>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <string_view>

#include <openssl/evp.h>
#include <openssl/crypto.h>

#include "error.h"
#include "digest.h"
#include "accounts.h"
#include "memory_user.h"

namespace xnode
{

namespace
{

constexpr std::string_view kVisionFlow = "xtls-rprx-vision";

int hex_value(const char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

result<std::string> trojan_key(const std::string& password) { return sha224_hex(password); }

result<std::vector<std::uint8_t>> shadowsocks_key(const std::string& password, const cipher_type cipher)
{
    const std::size_t key_len = cipher_key_length(cipher);
    std::vector<std::uint8_t> key(key_len);
    if (key_len == 0)
    {
        return key;
    }

    // EVP_BytesToKey with MD5 and a single round is the shadowsocks password to key rule.
    std::array<std::uint8_t, EVP_MAX_KEY_LENGTH> derived{};
    std::array<std::uint8_t, EVP_MAX_IV_LENGTH> iv{};
    const EVP_CIPHER* evp_cipher = key_len == 16 ? EVP_aes_128_gcm() : EVP_aes_256_gcm();
    const int n = EVP_BytesToKey(evp_cipher,
                                 EVP_md5(),
                                 nullptr,
                                 reinterpret_cast<const unsigned char*>(password.data()),
                                 static_cast<int>(password.size()),
                                 1,
                                 derived.data(),
                                 iv.data());
    if (n != static_cast<int>(key_len))
    {
        OPENSSL_cleanse(derived.data(), derived.size());
        return std::unexpected(make_error(error_kind::internal, "shadowsocks key derivation failed"));
    }
    key.assign(derived.begin(), derived.begin() + static_cast<std::ptrdiff_t>(key_len));
    OPENSSL_cleanse(derived.data(), derived.size());
    return key;
}

struct conversion_visitor
{
    memory_user& out;

    result<void> operator()(const vless_account& acct) const
    {
        auto uuid = parse_uuid(acct.id);
        if (!uuid)
        {
            return std::unexpected(uuid.error());
        }
        if (!acct.flow.empty() && acct.flow != kVisionFlow)
        {
            return std::unexpected(make_error(error_kind::invalid_argument, "unsupported vless flow '" + acct.flow + "'"));
        }
        out.uuid = *uuid;
        out.flow = acct.flow;
        return {};
    }

    result<void> operator()(const trojan_account& acct) const
    {
        if (acct.password.empty())
        {
            return std::unexpected(make_error(error_kind::invalid_argument, "trojan password is empty"));
        }
        auto key = trojan_key(acct.password);
        if (!key)
        {
            return std::unexpected(key.error());
        }
        out.trojan_key = std::move(*key);
        return {};
    }

    result<void> operator()(const shadowsocks_account& acct) const
    {
        if (acct.cipher == cipher_type::unknown)
        {
            return std::unexpected(make_error(error_kind::invalid_argument, "unknown shadowsocks cipher"));
        }
        if (acct.password.empty() && acct.cipher != cipher_type::none)
        {
            return std::unexpected(make_error(error_kind::invalid_argument, "shadowsocks password is empty"));
        }
        auto key = shadowsocks_key(acct.password, acct.cipher);
        if (!key)
        {
            return std::unexpected(key.error());
        }
        out.cipher = acct.cipher;
        out.ss_key = std::move(*key);
        out.iv_check = acct.iv_check;
        return {};
    }
};

}    // namespace

std::size_t cipher_key_length(const cipher_type cipher)
{
    switch (cipher)
    {
        case cipher_type::aes_128_gcm:
            return 16;
        case cipher_type::aes_256_gcm:
        case cipher_type::chacha20_poly1305:
        case cipher_type::xchacha20_poly1305:
            return 32;
        case cipher_type::none:
        case cipher_type::unknown:
            break;
    }
    return 0;
}

result<std::array<std::uint8_t, 16>> parse_uuid(const std::string_view text)
{
    constexpr std::size_t kCanonicalLength = 36;
    if (text.size() != kCanonicalLength)
    {
        return std::unexpected(make_error(error_kind::invalid_argument, "invalid uuid '" + std::string(text) + "'"));
    }

    std::array<std::uint8_t, 16> out{};
    std::size_t byte_index = 0;
    for (std::size_t i = 0; i < text.size();)
    {
        if (i == 8 || i == 13 || i == 18 || i == 23)
        {
            if (text[i] != '-')
            {
                return std::unexpected(make_error(error_kind::invalid_argument, "invalid uuid '" + std::string(text) + "'"));
            }
            ++i;
            continue;
        }
        const int hi = hex_value(text[i]);
        const int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0)
        {
            return std::unexpected(make_error(error_kind::invalid_argument, "invalid uuid '" + std::string(text) + "'"));
        }
        out[byte_index++] = static_cast<std::uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

result<memory_user> to_memory_user(const user_account& user)
{
    memory_user out;
    out.email = user.email;
    out.level = user.level;
    out.protocol = std::string(protocol_name(user.settings));

    if (auto converted = std::visit(conversion_visitor{out}, user.settings); !converted)
    {
        return std::unexpected(converted.error());
    }
    return out;
}

}    // namespace xnode
