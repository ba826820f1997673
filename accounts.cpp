#include <string>
#include <cstdint>
#include <utility>
#include <variant>
#include <optional>
#include <string_view>

#include "accounts.h"

namespace xnode
{

namespace
{

struct cipher_alias
{
    std::string_view name;
    cipher_type value;
};

constexpr cipher_alias kCipherAliases[] = {
    {.name = "aes-128-gcm", .value = cipher_type::aes_128_gcm},
    {.name = "AES_128_GCM", .value = cipher_type::aes_128_gcm},
    {.name = "aes-256-gcm", .value = cipher_type::aes_256_gcm},
    {.name = "AES_256_GCM", .value = cipher_type::aes_256_gcm},
    {.name = "chacha20-poly1305", .value = cipher_type::chacha20_poly1305},
    {.name = "chacha20-ietf-poly1305", .value = cipher_type::chacha20_poly1305},
    {.name = "CHACHA20_POLY1305", .value = cipher_type::chacha20_poly1305},
    {.name = "xchacha20-poly1305", .value = cipher_type::xchacha20_poly1305},
    {.name = "xchacha20-ietf-poly1305", .value = cipher_type::xchacha20_poly1305},
    {.name = "XCHACHA20_POLY1305", .value = cipher_type::xchacha20_poly1305},
    {.name = "none", .value = cipher_type::none},
    {.name = "NONE", .value = cipher_type::none},
};

}    // namespace

cipher_type parse_cipher_type(const std::string_view name)
{
    for (const auto& alias : kCipherAliases)
    {
        if (alias.name == name)
        {
            return alias.value;
        }
    }
    return cipher_type::unknown;
}

std::string_view to_string(const cipher_type cipher)
{
    switch (cipher)
    {
        case cipher_type::aes_128_gcm:
            return "AES_128_GCM";
        case cipher_type::aes_256_gcm:
            return "AES_256_GCM";
        case cipher_type::chacha20_poly1305:
            return "CHACHA20_POLY1305";
        case cipher_type::xchacha20_poly1305:
            return "XCHACHA20_POLY1305";
        case cipher_type::none:
            return "NONE";
        case cipher_type::unknown:
            break;
    }
    return "UNKNOWN";
}

std::string_view protocol_name(const account& settings)
{
    struct visitor
    {
        std::string_view operator()(const vless_account&) const { return protocol::kVless; }
        std::string_view operator()(const trojan_account&) const { return protocol::kTrojan; }
        std::string_view operator()(const shadowsocks_account&) const { return protocol::kShadowsocks; }
    };
    return std::visit(visitor{}, settings);
}

user_account build_vless_user(std::string email, std::string uuid, std::string flow, const std::uint32_t level)
{
    return user_account{.level = level, .email = std::move(email), .settings = vless_account{.id = std::move(uuid), .flow = std::move(flow)}};
}

user_account build_trojan_user(std::string email, std::string password, const std::uint32_t level)
{
    return user_account{.level = level, .email = std::move(email), .settings = trojan_account{.password = std::move(password)}};
}

user_account build_shadowsocks_user(std::string email, std::string password, const cipher_type cipher, const bool iv_check, const std::uint32_t level)
{
    return user_account{.level = level,
                        .email = std::move(email),
                        .settings = shadowsocks_account{.password = std::move(password), .cipher = cipher, .iv_check = iv_check}};
}

std::optional<user_account> build_user_for_inbound(const inbound_user_data& inbound, const user_data& user)
{
    constexpr std::uint32_t kLevel = 0;

    if (inbound.type == protocol::kVless)
    {
        return build_vless_user(user.user_id, user.vless_uuid, inbound.flow, kLevel);
    }
    if (inbound.type == protocol::kTrojan)
    {
        return build_trojan_user(user.user_id, user.trojan_password, kLevel);
    }
    if (inbound.type == protocol::kShadowsocks)
    {
        return build_shadowsocks_user(user.user_id, user.ss_password, inbound.cipher, inbound.iv_check, kLevel);
    }
    return std::nullopt;
}

}    // namespace xnode
