#ifndef DIGEST_H
#define DIGEST_H

#include <string>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "error.h"

namespace xnode
{

[[nodiscard]] std::string bytes_to_hex(const std::uint8_t* data, std::size_t len);

// Lowercase hex of the digest; trojan password keys.
[[nodiscard]] result<std::string> sha224_hex(std::string_view data);

// Lowercase hex of the digest; routing rule tags for blocked addresses.
[[nodiscard]] result<std::string> md5_hex(std::string_view data);

}    // namespace xnode

#endif
