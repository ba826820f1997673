#include <string>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <iterator>
#include <filesystem>
#include <system_error>

#include <sys/time.h>
#include <sys/resource.h>

#include "process_stats.h"

namespace xnode
{

namespace
{

std::uint64_t timeval_ms(const timeval& tv)
{
    return static_cast<std::uint64_t>(tv.tv_sec) * 1000 + static_cast<std::uint64_t>(tv.tv_usec) / 1000;
}

std::uint64_t count_open_fds()
{
    std::error_code ec;
    std::filesystem::directory_iterator it("/proc/self/fd", ec);
    if (ec)
    {
        return 0;
    }
    std::uint64_t count = 0;
    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec))
    {
        if (ec)
        {
            break;
        }
        ++count;
    }
    // the iterator holds one descriptor on the directory itself
    return count > 0 ? count - 1 : 0;
}

}    // namespace

void parse_proc_status(const std::string& body, process_usage& usage)
{
    std::istringstream in(body);
    std::string line;
    while (std::getline(in, line))
    {
        std::istringstream fields(line);
        std::string key;
        std::uint64_t value = 0;
        if (!(fields >> key >> value))
        {
            continue;
        }
        if (key == "Threads:")
        {
            usage.threads = value;
        }
        else if (key == "VmRSS:")
        {
            // VmRSS:   12345 kB
            usage.rss_bytes = value * 1024;
        }
    }
}

process_usage read_process_usage()
{
    process_usage usage;

    std::ifstream status("/proc/self/status");
    if (status.is_open())
    {
        const std::string body((std::istreambuf_iterator<char>(status)), std::istreambuf_iterator<char>());
        parse_proc_status(body, usage);
    }

    usage.open_fds = count_open_fds();

    rusage ru{};
    if (::getrusage(RUSAGE_SELF, &ru) == 0)
    {
        usage.user_cpu_ms = timeval_ms(ru.ru_utime);
        usage.system_cpu_ms = timeval_ms(ru.ru_stime);
    }
    return usage;
}

}    // namespace xnode
