#pragma once

// common.hpp - error codes, result aliases and the constants baked into
// the tc / ip mptcp command lines

#include <cstddef>
#include <cstdint>
#include <expected>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>

namespace netctl
{

    // ============================================================================
    // error handling - values, not exceptions
    // ============================================================================

    enum class error_code : std::uint8_t
    {
        success = 0,

        // validation
        missing_mode,
        invalid_mode,
        missing_argument,
        missing_value,
        invalid_bandwidth,
        empty_value,
        invalid_interface_name,
        invalid_address,
        invalid_port,
        unknown_argument,

        // execution
        command_failed,
        command_not_found,
        permission_denied,
        spawn_failed,

        // remote execution
        remote_connection_failed,
        remote_authentication_failed,
        remote_exec_failed,
    };

    struct error_code_formatter
    {
        [[nodiscard]] static constexpr auto to_string(error_code const ec) noexcept
            -> std::string_view
        {
            switch (ec)
            {
            case error_code::success:
                return "success";
            case error_code::missing_mode:
                return "missing_mode";
            case error_code::invalid_mode:
                return "invalid_mode";
            case error_code::missing_argument:
                return "missing_argument";
            case error_code::missing_value:
                return "missing_value";
            case error_code::invalid_bandwidth:
                return "invalid_bandwidth";
            case error_code::empty_value:
                return "empty_value";
            case error_code::invalid_interface_name:
                return "invalid_interface_name";
            case error_code::invalid_address:
                return "invalid_address";
            case error_code::invalid_port:
                return "invalid_port";
            case error_code::unknown_argument:
                return "unknown_argument";
            case error_code::command_failed:
                return "command_failed";
            case error_code::command_not_found:
                return "command_not_found";
            case error_code::permission_denied:
                return "permission_denied";
            case error_code::spawn_failed:
                return "spawn_failed";
            case error_code::remote_connection_failed:
                return "remote_connection_failed";
            case error_code::remote_authentication_failed:
                return "remote_authentication_failed";
            case error_code::remote_exec_failed:
                return "remote_exec_failed";
            }
            return "unknown_error";
        }
    };

    template <typename T>
    using result = std::expected<T, error_code>;

    using void_result = std::expected<void, error_code>;

    // ============================================================================
    // operation mode
    // ============================================================================

    enum class mode : std::uint8_t
    {
        bandwidth,
        mptcp_client,
        mptcp_server,
    };

    // command line spelling of a mode
    [[nodiscard]] constexpr auto to_string(mode const m) noexcept -> std::string_view
    {
        switch (m)
        {
        case mode::bandwidth:
            return "bandwidth";
        case mode::mptcp_client:
            return "mptcp-client";
        case mode::mptcp_server:
            return "mptcp-server";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr auto mode_from_string(std::string_view const str) noexcept -> std::optional<mode>
    {
        if (str == "bandwidth")
        {
            return mode::bandwidth;
        }
        if (str == "mptcp-client")
        {
            return mode::mptcp_client;
        }
        if (str == "mptcp-server")
        {
            return mode::mptcp_server;
        }
        return std::nullopt;
    }

    namespace constants
    {
        // token bucket parameters of the shaping qdisc
        inline constexpr std::string_view tbf_burst = "256mbit";
        inline constexpr std::string_view tbf_latency = "600ms";

        // one extra subflow (e.g. terrestrial + satellite)
        inline constexpr std::uint32_t mptcp_subflow_limit = 2;
        inline constexpr std::uint32_t mptcp_add_addr_accepted = 2;

        // linux IFNAMSIZ, including the terminating nul
        inline constexpr std::size_t max_interface_name = 16;

        inline constexpr std::uint16_t default_ssh_port = 22;

        // per stream; tc and ip print a few lines at most
        inline constexpr std::size_t max_captured_output = 16 * 1024 * 1024;

        // process exit statuses, shell conventions for the last two
        inline constexpr int exit_success = 0;
        inline constexpr int exit_failure = 1;
        inline constexpr int exit_usage = 2;
        inline constexpr int exit_not_executable = 126;
        inline constexpr int exit_not_found = 127;
    } // namespace constants

} // namespace netctl

template <>
struct fmt::formatter<netctl::error_code> : fmt::formatter<std::string_view>
{
    auto format(netctl::error_code const ec, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(
            netctl::error_code_formatter::to_string(ec), ctx);
    }
};

template <>
struct fmt::formatter<netctl::mode> : fmt::formatter<std::string_view>
{
    auto format(netctl::mode const m, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(netctl::to_string(m), ctx);
    }
};
