#include <string>
#include <cstddef>
#include <cstdint>

#include "config_sync.h"
#include "node_messages.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    if (size == 0)
    {
        return 0;
    }

    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto request = xnode::parse_start_request(input);
    if (!request || request->engine_config == nullptr)
    {
        return 0;
    }

    xnode::config_sync mirror;
    if (!mirror.extract_users(request->hashes, request->engine_config))
    {
        return 0;
    }
    (void)mirror.is_restart_needed(request->hashes);
    for (const auto& tag : mirror.tracked_tags())
    {
        (void)mirror.current_fingerprint(tag);
    }
    mirror.cleanup();

    return 0;
}
