#ifndef NODE_ERROR_H
#define NODE_ERROR_H

#include <string>
#include <cstdint>
#include <utility>
#include <expected>
#include <string_view>

namespace xnode
{

enum class error_kind : std::uint8_t
{
    config,
    lifecycle,
    not_running,
    not_found,
    unsupported,
    invalid_argument,
    conflict,
    internal
};

struct error
{
    error_kind kind = error_kind::internal;
    std::string reason;
};

template <typename T = void>
using result = std::expected<T, error>;

[[nodiscard]] inline error make_error(const error_kind kind, std::string reason)
{
    error err;
    err.kind = kind;
    err.reason = std::move(reason);
    return err;
}

[[nodiscard]] inline error wrap_error(std::string_view context, const error& cause)
{
    std::string reason(context);
    reason.append(": ");
    reason.append(cause.reason);
    return make_error(cause.kind, std::move(reason));
}

[[nodiscard]] constexpr std::string_view to_string(const error_kind kind)
{
    switch (kind)
    {
        case error_kind::config:
            return "config";
        case error_kind::lifecycle:
            return "lifecycle";
        case error_kind::not_running:
            return "not_running";
        case error_kind::not_found:
            return "not_found";
        case error_kind::unsupported:
            return "unsupported";
        case error_kind::invalid_argument:
            return "invalid_argument";
        case error_kind::conflict:
            return "conflict";
        case error_kind::internal:
            return "internal";
    }
    return "internal";
}

}    // namespace xnode

#endif
