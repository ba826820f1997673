#include <chrono>
#include <random>
#include <string>
#include <cstdint>
#include <charconv>
#include <system_error>

#include "log_context.h"

namespace xnode
{

namespace
{

std::string fixed_hex_16(const std::uint64_t value)
{
    char buf[16];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, 16);
    if (ec != std::errc())
    {
        return "0000000000000000";
    }

    const auto len = static_cast<std::size_t>(ptr - buf);
    std::string out;
    out.reserve(16);
    out.append(16 - len, '0');
    out.append(buf, len);
    return out;
}

}    // namespace

std::string generate_trace_id()
{
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;
    return fixed_hex_16(dist(gen));
}

request_context::request_context(const std::string_view operation) : trace_id_(generate_trace_id()), operation_(operation) {}

std::string request_context::prefix() const
{
    std::string out;
    out.reserve(trace_id_.size() + operation_.size() + inbound_.size() + user_.size() + 16);
    if (!trace_id_.empty())
    {
        out.push_back('t');
        out.append(trace_id_);
    }
    if (!operation_.empty())
    {
        if (!out.empty())
        {
            out.push_back(' ');
        }
        out.append(operation_);
    }
    if (!inbound_.empty())
    {
        out.append(" in=");
        out.append(inbound_);
    }
    if (!user_.empty())
    {
        out.append(" user=");
        out.append(user_);
    }
    return out;
}

std::int64_t request_context::elapsed_ms() const
{
    const auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_).count();
}

}    // namespace xnode
