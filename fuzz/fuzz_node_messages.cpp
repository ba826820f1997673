#include <string>
#include <cstddef>
#include <cstdint>

#include "node_messages.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    if (size < 2)
    {
        return 0;
    }

    const uint8_t selector = data[0] % 9;
    const std::string body(reinterpret_cast<const char*>(data + 1), size - 1);

    switch (selector)
    {
        case 0:
            (void)xnode::parse_start_request(body);
            break;
        case 1:
            (void)xnode::parse_add_user_request(body);
            break;
        case 2:
            (void)xnode::parse_add_users_request(body);
            break;
        case 3:
            (void)xnode::parse_remove_user_request(body);
            break;
        case 4:
            (void)xnode::parse_remove_users_request(body);
            break;
        case 5:
            (void)xnode::parse_username_request(body);
            break;
        case 6:
            (void)xnode::parse_tag_reset_request(body);
            break;
        case 7:
            (void)xnode::parse_block_ip_request(body);
            break;
        default:
            (void)xnode::parse_reset_request(body);
            break;
    }

    return 0;
}
