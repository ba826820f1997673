#ifndef MEMORY_USER_H
#define MEMORY_USER_H

#include <array>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "error.h"
#include "accounts.h"

namespace xnode
{

// Runtime form of a user inside an inbound: secrets already decoded or
// derived, ready for authentication lookups.
struct memory_user
{
    std::string email;
    std::uint32_t level = 0;
    std::string protocol;
    std::array<std::uint8_t, 16> uuid{};
    std::string flow;
    std::string trojan_key;
    cipher_type cipher = cipher_type::unknown;
    std::vector<std::uint8_t> ss_key;
    bool iv_check = false;
};

[[nodiscard]] result<memory_user> to_memory_user(const user_account& user);

[[nodiscard]] result<std::array<std::uint8_t, 16>> parse_uuid(std::string_view text);
[[nodiscard]] std::size_t cipher_key_length(cipher_type cipher);

}    // namespace xnode

#endif
