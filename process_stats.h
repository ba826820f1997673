#ifndef PROCESS_STATS_H
#define PROCESS_STATS_H

#include <string>
#include <cstdint>

namespace xnode
{

struct process_usage
{
    std::uint64_t threads = 0;
    std::uint64_t rss_bytes = 0;
    std::uint64_t open_fds = 0;
    std::uint64_t user_cpu_ms = 0;
    std::uint64_t system_cpu_ms = 0;
};

// Snapshot of the calling process. Fields that cannot be read stay zero.
[[nodiscard]] process_usage read_process_usage();

// Parses the Threads and VmRSS lines of a /proc/<pid>/status body.
void parse_proc_status(const std::string& body, process_usage& usage);

}    // namespace xnode

#endif
