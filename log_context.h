#ifndef LOG_CONTEXT_H
#define LOG_CONTEXT_H

#include <string>
#include <chrono>
#include <cstdint>
#include <utility>
#include <string_view>

#include "log.h"

namespace xnode
{

namespace log_event
{
constexpr std::string_view kStart = "start";
constexpr std::string_view kStop = "stop";
constexpr std::string_view kAddUser = "add_user";
constexpr std::string_view kRemoveUser = "remove_user";
constexpr std::string_view kRoute = "route";
}    // namespace log_event

[[nodiscard]] std::string generate_trace_id();

// Per-request logging context for management operations.
class request_context
{
   public:
    request_context() = default;
    explicit request_context(std::string_view operation);

    void trace_id(std::string value) { trace_id_ = std::move(value); }
    void inbound(std::string value) { inbound_ = std::move(value); }
    void user(std::string value) { user_ = std::move(value); }

    [[nodiscard]] const std::string& trace_id() const { return trace_id_; }
    [[nodiscard]] const std::string& operation() const { return operation_; }
    [[nodiscard]] const std::string& inbound() const { return inbound_; }
    [[nodiscard]] const std::string& user() const { return user_; }

    [[nodiscard]] std::string prefix() const;
    [[nodiscard]] std::int64_t elapsed_ms() const;

    [[nodiscard]] request_context with_inbound(std::string tag) const
    {
        request_context ctx = *this;
        ctx.inbound_ = std::move(tag);
        return ctx;
    }

   private:
    std::string trace_id_;
    std::string operation_;
    std::string inbound_;
    std::string user_;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

}    // namespace xnode

// Prefixes the message with the request context.
#define LOG_CTX_TRACE(ctx, fmt, ...) LOG_TRACE("{} " fmt, (ctx).prefix(), ##__VA_ARGS__)
#define LOG_CTX_DEBUG(ctx, fmt, ...) LOG_DEBUG("{} " fmt, (ctx).prefix(), ##__VA_ARGS__)
#define LOG_CTX_INFO(ctx, fmt, ...) LOG_INFO("{} " fmt, (ctx).prefix(), ##__VA_ARGS__)
#define LOG_CTX_WARN(ctx, fmt, ...) LOG_WARN("{} " fmt, (ctx).prefix(), ##__VA_ARGS__)
#define LOG_CTX_ERROR(ctx, fmt, ...) LOG_ERROR("{} " fmt, (ctx).prefix(), ##__VA_ARGS__)

#endif
