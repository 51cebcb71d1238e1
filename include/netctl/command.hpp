#pragma once

// command.hpp - external command invocations and the pure request -> commands step

#include "common.hpp"
#include "request.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace netctl
{

    // =============================================================================
    // one external program invocation
    // =============================================================================

    struct command_invocation
    {
        // argv[0] is looked up on PATH
        std::vector<std::string> argv;

        // a non-zero exit is reported but does not stop the sequence
        bool tolerate_failure{false};

        [[nodiscard]] auto program() const noexcept -> std::string_view
        {
            return argv.empty() ? std::string_view{} : std::string_view{argv.front()};
        }

        // space separated, for humans - use shell_quote() for a shell
        [[nodiscard]] auto to_string() const -> std::string;

        [[nodiscard]] auto operator==(command_invocation const &) const -> bool = default;
    };

    // ordered steps that must run one after the other, e.g. reset then apply
    struct command_sequence
    {
        std::string label;
        std::vector<command_invocation> steps;
    };

    using command_plan = std::vector<command_sequence>;

    // =============================================================================
    // command builders - pure, no side effects
    // =============================================================================

    // tc qdisc del dev <iface> root
    [[nodiscard]] auto make_shaping_reset(std::string_view iface) -> command_invocation;

    // tc qdisc add dev <iface> root tbf rate <bw>mbit burst 256mbit latency 600ms
    [[nodiscard]] auto make_shaping_apply(std::string_view iface, std::uint32_t mbit) -> command_invocation;

    [[nodiscard]] auto make_shaping_sequence(std::string_view iface, std::uint32_t mbit) -> command_sequence;

    [[nodiscard]] auto build_commands(bandwidth_request const &req) -> command_plan;
    [[nodiscard]] auto build_commands(mptcp_client_request const &req) -> command_plan;
    [[nodiscard]] auto build_commands(mptcp_server_request const &req) -> command_plan;
    [[nodiscard]] auto build_commands(request const &req) -> command_plan;

    [[nodiscard]] auto step_count(command_plan const &plan) noexcept -> std::size_t;

    // =============================================================================
    // shell quoting for remote execution
    // =============================================================================

    // single-quote a word for a POSIX shell unless it only has safe characters
    [[nodiscard]] auto shell_quote(std::string_view word) -> std::string;

    [[nodiscard]] auto shell_join(std::span<std::string const> argv) -> std::string;

} // namespace netctl

template <>
struct fmt::formatter<netctl::command_invocation> : fmt::formatter<std::string_view>
{
    auto format(netctl::command_invocation const &value, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(value.to_string(), ctx);
    }
};
