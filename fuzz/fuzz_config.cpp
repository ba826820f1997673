#include <string>
#include <cstddef>
#include <cstdint>

#include "config.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    if (size == 0)
    {
        return 0;
    }

    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto cfg = xnode::parse_config_text(input);
    if (cfg)
    {
        (void)xnode::dump_config(*cfg);
    }

    return 0;
}
