// command.cpp - tc and ip mptcp command lines

#include "netctl/command.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <numeric>

namespace netctl
{

    auto command_invocation::to_string() const -> std::string
    {
        return fmt::format("{}", fmt::join(argv, " "));
    }

    // ----------------------------------------------------------------------------
    // bandwidth shaping
    // ----------------------------------------------------------------------------

    auto make_shaping_reset(std::string_view iface) -> command_invocation
    {
        // deleting the root qdisc of an unshaped interface fails, which is fine
        return command_invocation{
            .argv = {"tc", "qdisc", "del", "dev", std::string{iface}, "root"},
            .tolerate_failure = true,
        };
    }

    auto make_shaping_apply(std::string_view iface, std::uint32_t mbit) -> command_invocation
    {
        return command_invocation{
            .argv = {"tc", "qdisc", "add", "dev", std::string{iface}, "root", "tbf",
                     "rate", fmt::format("{}mbit", mbit),
                     "burst", std::string{constants::tbf_burst},
                     "latency", std::string{constants::tbf_latency}},
        };
    }

    auto make_shaping_sequence(std::string_view iface, std::uint32_t mbit) -> command_sequence
    {
        return command_sequence{
            .label = fmt::format("shape {} to {} Mbit/s", iface, mbit),
            .steps = {make_shaping_reset(iface), make_shaping_apply(iface, mbit)},
        };
    }

    auto build_commands(bandwidth_request const &req) -> command_plan
    {
        return {make_shaping_sequence(req.iface1, req.bw1), make_shaping_sequence(req.iface2, req.bw2)};
    }

    // ----------------------------------------------------------------------------
    // mptcp endpoints
    // ----------------------------------------------------------------------------

    auto build_commands(mptcp_client_request const & /*req*/) -> command_plan
    {
        // both limits in one netlink request
        command_invocation limits{
            .argv = {"ip", "mptcp", "limits", "set",
                     "subflow", fmt::format("{}", constants::mptcp_subflow_limit),
                     "add_addr_accepted", fmt::format("{}", constants::mptcp_add_addr_accepted)},
        };

        return {command_sequence{.label = "enable mptcp client", .steps = {std::move(limits)}}};
    }

    auto build_commands(mptcp_server_request const &req) -> command_plan
    {
        command_invocation limits{
            .argv = {"ip", "mptcp", "limits", "set", "subflow", fmt::format("{}", constants::mptcp_subflow_limit)},
        };

        // "signal" makes the kernel announce the address to the peer with ADD_ADDR
        command_invocation endpoint{
            .argv = {"ip", "mptcp", "endpoint", "add", req.subflow_ip, "dev", req.subflow_iface, "signal"},
        };

        return {command_sequence{
            .label = fmt::format("announce mptcp subflow {} on {}", req.subflow_ip, req.subflow_iface),
            .steps = {std::move(limits), std::move(endpoint)},
        }};
    }

    auto build_commands(request const &req) -> command_plan
    {
        return std::visit([](auto const &r) { return build_commands(r); }, req);
    }

    auto step_count(command_plan const &plan) noexcept -> std::size_t
    {
        return std::accumulate(plan.begin(), plan.end(), std::size_t{0},
                               [](std::size_t total, command_sequence const &seq)
                               { return total + seq.steps.size(); });
    }

    // ----------------------------------------------------------------------------
    // shell quoting
    // ----------------------------------------------------------------------------

    auto shell_quote(std::string_view word) -> std::string
    {
        auto const is_safe = [](char const c)
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                   c == '-' || c == '_' || c == '.' || c == ':' || c == '/' || c == '=' || c == '@' || c == '%' ||
                   c == '+' || c == ',';
        };

        if (!word.empty() && std::all_of(word.begin(), word.end(), is_safe))
        {
            return std::string{word};
        }

        // close the quote, emit an escaped quote, reopen
        std::string quoted{"'"};
        for (char const c : word)
        {
            if (c == '\'')
            {
                quoted += R"('\'')";
            }
            else
            {
                quoted += c;
            }
        }
        quoted += '\'';
        return quoted;
    }

    auto shell_join(std::span<std::string const> argv) -> std::string
    {
        std::string joined;
        for (auto const &word : argv)
        {
            if (!joined.empty())
            {
                joined += ' ';
            }
            joined += shell_quote(word);
        }
        return joined;
    }

} // namespace netctl
