#pragma once

// request.hpp - command line parsing into a validated request
// pure function: no globals, no output, no side effects

#include "common.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace netctl
{

    // =============================================================================
    // per-mode requests
    // =============================================================================

    // bandwidths are in Mbit/s
    struct bandwidth_request
    {
        std::string iface1;
        std::uint32_t bw1{0};
        std::string iface2;
        std::uint32_t bw2{0};

        [[nodiscard]] auto operator==(bandwidth_request const &) const -> bool = default;
    };

    struct mptcp_client_request
    {
        [[nodiscard]] auto operator==(mptcp_client_request const &) const -> bool = default;
    };

    struct mptcp_server_request
    {
        std::string subflow_ip;
        std::string subflow_iface;

        [[nodiscard]] auto operator==(mptcp_server_request const &) const -> bool = default;
    };

    using request = std::variant<bandwidth_request, mptcp_client_request, mptcp_server_request>;

    [[nodiscard]] auto mode_of(request const &req) noexcept -> mode;

    // =============================================================================
    // remote execution target
    // =============================================================================

    struct remote_target
    {
        std::string host;
        std::uint16_t port{constants::default_ssh_port};
        std::string username;
        std::string password;
        std::string private_key_path;
        std::chrono::seconds connect_timeout{10};

        // prefix commands with "sudo -n" on the remote side
        bool use_sudo{false};
    };

    // =============================================================================
    // parse result
    // =============================================================================

    struct invocation_options
    {
        bool show_help{false};
        bool dry_run{false};
        bool quiet{false};
        bool keep_going{false};
        std::optional<remote_target> remote{};
    };

    struct parsed_invocation
    {
        request req{};
        invocation_options options{};

        // flags that were given but belong to another mode
        std::vector<std::string> ignored_flags{};
    };

    struct validation_error
    {
        error_code code{error_code::success};
        std::string message;
    };

    // environment values the parser falls back to; injected so parsing stays pure
    struct parse_environment
    {
        std::string user{};
        std::string ssh_password{};

        [[nodiscard]] static auto from_process() -> parse_environment;
    };

    // args excludes the program name
    [[nodiscard]] auto parse(std::span<std::string_view const> args, parse_environment const &env = {})
        -> std::expected<parsed_invocation, validation_error>;

    [[nodiscard]] auto parse_bandwidth(std::string_view text) noexcept -> result<std::uint32_t>;

    [[nodiscard]] auto is_ip_address(std::string_view text) noexcept -> bool;

    [[nodiscard]] auto usage_text(std::string_view program_name) -> std::string;

} // namespace netctl

template <>
struct fmt::formatter<netctl::validation_error> : fmt::formatter<std::string_view>
{
    auto format(netctl::validation_error const &value, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(fmt::format("{} ({})", value.message, value.code), ctx);
    }
};
