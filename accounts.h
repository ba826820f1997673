#ifndef ACCOUNTS_H
#define ACCOUNTS_H

#include <string>
#include <cstdint>
#include <variant>
#include <optional>
#include <string_view>

namespace xnode
{

// Numeric values follow the engine's shadowsocks cipher enumeration.
enum class cipher_type : std::int32_t
{
    unknown = 0,
    aes_128_gcm = 5,
    aes_256_gcm = 6,
    chacha20_poly1305 = 7,
    xchacha20_poly1305 = 8,
    none = 9
};

[[nodiscard]] cipher_type parse_cipher_type(std::string_view name);
[[nodiscard]] std::string_view to_string(cipher_type cipher);

namespace protocol
{
constexpr std::string_view kVless = "vless";
constexpr std::string_view kTrojan = "trojan";
constexpr std::string_view kShadowsocks = "shadowsocks";
}    // namespace protocol

struct vless_account
{
    std::string id;
    std::string flow;
};

struct trojan_account
{
    std::string password;
};

struct shadowsocks_account
{
    std::string password;
    cipher_type cipher = cipher_type::unknown;
    bool iv_check = false;
};

using account = std::variant<vless_account, trojan_account, shadowsocks_account>;

// A user as handed to an inbound: the email is the engine-visible label.
struct user_account
{
    std::uint32_t level = 0;
    std::string email;
    account settings;
};

[[nodiscard]] std::string_view protocol_name(const account& settings);

[[nodiscard]] user_account build_vless_user(std::string email, std::string uuid, std::string flow, std::uint32_t level);
[[nodiscard]] user_account build_trojan_user(std::string email, std::string password, std::uint32_t level);
[[nodiscard]] user_account build_shadowsocks_user(std::string email, std::string password, cipher_type cipher, bool iv_check, std::uint32_t level);

// Secrets of one panel user across every protocol it may be attached to.
struct user_data
{
    std::string user_id;
    std::string hash_uuid;
    std::string vless_uuid;
    std::string trojan_password;
    std::string ss_password;
};

// Per-inbound protocol parameters.
struct inbound_user_data
{
    std::string type;
    std::string tag;
    std::string flow;
    cipher_type cipher = cipher_type::unknown;
    bool iv_check = false;
};

// Returns nullopt for protocol types the node does not manage.
[[nodiscard]] std::optional<user_account> build_user_for_inbound(const inbound_user_data& inbound, const user_data& user);

}    // namespace xnode

#endif
