// request.cpp - command line parsing and per-mode validation

#include "netctl/request.hpp"
#include "netctl/interface.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <array>
#include <charconv>
#include <cstdlib>
#include <fmt/ranges.h>

namespace netctl
{

    namespace
    {

        // which mode a value flag belongs to
        enum class flag_scope : std::uint8_t
        {
            global,
            bandwidth,
            server,
            remote,
        };

        struct raw_values
        {
            std::optional<std::string> mode;
            std::optional<std::string> iface1;
            std::optional<std::string> bw1;
            std::optional<std::string> iface2;
            std::optional<std::string> bw2;
            std::optional<std::string> subflow_ip;
            std::optional<std::string> subflow_iface;
            std::optional<std::string> remote_host;
            std::optional<std::string> ssh_user;
            std::optional<std::string> ssh_port;
            std::optional<std::string> ssh_key;
            std::optional<std::string> ssh_pass;
        };

        struct value_flag
        {
            std::string_view name;
            std::string_view short_name;
            std::optional<std::string> raw_values::*member;
            flag_scope scope;
        };

        constexpr std::array value_flags{
            value_flag{"--mode", "-m", &raw_values::mode, flag_scope::global},
            value_flag{"--iface1", "", &raw_values::iface1, flag_scope::bandwidth},
            value_flag{"--bw1", "", &raw_values::bw1, flag_scope::bandwidth},
            value_flag{"--iface2", "", &raw_values::iface2, flag_scope::bandwidth},
            value_flag{"--bw2", "", &raw_values::bw2, flag_scope::bandwidth},
            value_flag{"--subflow-ip", "", &raw_values::subflow_ip, flag_scope::server},
            value_flag{"--subflow-iface", "", &raw_values::subflow_iface, flag_scope::server},
            value_flag{"--remote-host", "", &raw_values::remote_host, flag_scope::global},
            value_flag{"--ssh-user", "", &raw_values::ssh_user, flag_scope::remote},
            value_flag{"--ssh-port", "", &raw_values::ssh_port, flag_scope::remote},
            value_flag{"--ssh-key", "", &raw_values::ssh_key, flag_scope::remote},
            value_flag{"--ssh-pass", "", &raw_values::ssh_pass, flag_scope::remote},
        };

        [[nodiscard]] auto find_value_flag(std::string_view const name) noexcept -> value_flag const *
        {
            auto const it = std::find_if(value_flags.begin(), value_flags.end(),
                                         [name](value_flag const &flag)
                                         { return flag.name == name || (!flag.short_name.empty() && flag.short_name == name); });
            return it == value_flags.end() ? nullptr : &*it;
        }

        [[nodiscard]] auto fail(error_code const code, std::string message) -> std::unexpected<validation_error>
        {
            return std::unexpected{validation_error{.code = code, .message = std::move(message)}};
        }

        [[nodiscard]] auto check_interface(std::string_view const flag, std::string const &value)
            -> std::expected<void, validation_error>
        {
            auto const valid = validate_interface_name(value);
            if (valid.has_value())
            {
                return {};
            }
            if (valid.error() == error_code::empty_value)
            {
                return fail(error_code::empty_value, fmt::format("{} must not be empty", flag));
            }
            return fail(valid.error(),
                        fmt::format("{} '{}' is not a valid interface name (at most {} characters, no '/', ':' or spaces)",
                                    flag, value, constants::max_interface_name - 1));
        }

        [[nodiscard]] auto check_bandwidth(std::string_view const flag, std::string const &value)
            -> std::expected<std::uint32_t, validation_error>
        {
            auto const bw = parse_bandwidth(value);
            if (!bw.has_value())
            {
                return fail(error_code::invalid_bandwidth,
                            fmt::format("{} expects a positive integer bandwidth in Mbit/s, got '{}'", flag, value));
            }
            return *bw;
        }

        // names of the flags in the list that were never given
        template <std::size_t N>
        [[nodiscard]] auto absent_flags(raw_values const &raw, std::array<std::string_view, N> const &names)
            -> std::vector<std::string_view>
        {
            std::vector<std::string_view> absent;
            for (auto const name : names)
            {
                auto const *flag = find_value_flag(name);
                if (flag != nullptr && !(raw.*(flag->member)).has_value())
                {
                    absent.push_back(name);
                }
            }
            return absent;
        }

        [[nodiscard]] auto build_bandwidth(raw_values const &raw) -> std::expected<request, validation_error>
        {
            constexpr std::array<std::string_view, 4> required{"--iface1", "--bw1", "--iface2", "--bw2"};
            if (auto const absent = absent_flags(raw, required); !absent.empty())
            {
                return fail(error_code::missing_argument,
                            fmt::format("bandwidth mode requires --iface1, --bw1, --iface2 and --bw2 (missing: {})",
                                        fmt::join(absent, ", ")));
            }

            if (auto ok = check_interface("--iface1", *raw.iface1); !ok.has_value())
            {
                return std::unexpected{std::move(ok.error())};
            }
            auto const bw1 = check_bandwidth("--bw1", *raw.bw1);
            if (!bw1.has_value())
            {
                return std::unexpected{bw1.error()};
            }
            if (auto ok = check_interface("--iface2", *raw.iface2); !ok.has_value())
            {
                return std::unexpected{std::move(ok.error())};
            }
            auto const bw2 = check_bandwidth("--bw2", *raw.bw2);
            if (!bw2.has_value())
            {
                return std::unexpected{bw2.error()};
            }

            return bandwidth_request{.iface1 = *raw.iface1, .bw1 = *bw1, .iface2 = *raw.iface2, .bw2 = *bw2};
        }

        [[nodiscard]] auto build_server(raw_values const &raw) -> std::expected<request, validation_error>
        {
            constexpr std::array<std::string_view, 2> required{"--subflow-ip", "--subflow-iface"};
            if (auto const absent = absent_flags(raw, required); !absent.empty())
            {
                return fail(error_code::missing_argument,
                            fmt::format("mptcp-server mode requires --subflow-ip and --subflow-iface (missing: {})",
                                        fmt::join(absent, ", ")));
            }

            if (raw.subflow_ip->empty())
            {
                return fail(error_code::empty_value, "--subflow-ip must not be empty");
            }
            if (!is_ip_address(*raw.subflow_ip))
            {
                return fail(error_code::invalid_address,
                            fmt::format("--subflow-ip '{}' is not an IPv4 or IPv6 address", *raw.subflow_ip));
            }
            if (auto ok = check_interface("--subflow-iface", *raw.subflow_iface); !ok.has_value())
            {
                return std::unexpected{std::move(ok.error())};
            }

            return mptcp_server_request{.subflow_ip = *raw.subflow_ip, .subflow_iface = *raw.subflow_iface};
        }

        [[nodiscard]] auto build_remote(raw_values const &raw, bool const use_sudo, parse_environment const &env)
            -> std::expected<std::optional<remote_target>, validation_error>
        {
            if (!raw.remote_host.has_value())
            {
                if (raw.ssh_user || raw.ssh_port || raw.ssh_key || raw.ssh_pass || use_sudo)
                {
                    return fail(error_code::missing_argument, "--ssh-* options require --remote-host");
                }
                return std::optional<remote_target>{};
            }

            if (raw.remote_host->empty())
            {
                return fail(error_code::empty_value, "--remote-host must not be empty");
            }

            remote_target target{.host = *raw.remote_host};

            target.username = raw.ssh_user.value_or(env.user);
            if (target.username.empty())
            {
                return fail(error_code::missing_argument, "--ssh-user is required when $USER is not set");
            }

            if (raw.ssh_port.has_value())
            {
                auto const &text = *raw.ssh_port;
                std::uint32_t port = 0;
                auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
                if (ec != std::errc{} || ptr != text.data() + text.size() || port == 0 || port > 65535)
                {
                    return fail(error_code::invalid_port,
                                fmt::format("--ssh-port expects a port number between 1 and 65535, got '{}'", text));
                }
                target.port = static_cast<std::uint16_t>(port);
            }

            target.private_key_path = raw.ssh_key.value_or(std::string{});
            target.password = raw.ssh_pass.value_or(env.ssh_password);
            target.use_sudo = use_sudo;

            return target;
        }

        [[nodiscard]] auto belongs_to(flag_scope const scope, mode const m) noexcept -> bool
        {
            switch (scope)
            {
            case flag_scope::bandwidth:
                return m == mode::bandwidth;
            case flag_scope::server:
                return m == mode::mptcp_server;
            case flag_scope::global:
            case flag_scope::remote:
                return true;
            }
            return true;
        }

    } // anonymous namespace

    auto mode_of(request const &req) noexcept -> mode
    {
        if (std::holds_alternative<mptcp_client_request>(req))
        {
            return mode::mptcp_client;
        }
        if (std::holds_alternative<mptcp_server_request>(req))
        {
            return mode::mptcp_server;
        }
        return mode::bandwidth;
    }

    auto parse_environment::from_process() -> parse_environment
    {
        parse_environment env;
        if (char const *user = std::getenv("USER"); user != nullptr)
        {
            env.user = user;
        }
        if (char const *password = std::getenv("NETCTL_SSH_PASSWORD"); password != nullptr)
        {
            env.ssh_password = password;
        }
        return env;
    }

    auto parse_bandwidth(std::string_view text) noexcept -> result<std::uint32_t>
    {
        // from_chars rejects signs and leading whitespace, so "-5" and " 5" fail here
        std::uint32_t value = 0;
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || value == 0)
        {
            return std::unexpected{error_code::invalid_bandwidth};
        }
        return value;
    }

    auto is_ip_address(std::string_view text) noexcept -> bool
    {
        if (text.empty() || text.size() >= INET6_ADDRSTRLEN)
        {
            return false;
        }

        std::array<char, INET6_ADDRSTRLEN> buffer{};
        std::copy(text.begin(), text.end(), buffer.begin());

        std::array<unsigned char, sizeof(struct in6_addr)> scratch{};
        return ::inet_pton(AF_INET, buffer.data(), scratch.data()) == 1 ||
               ::inet_pton(AF_INET6, buffer.data(), scratch.data()) == 1;
    }

    auto parse(std::span<std::string_view const> args, parse_environment const &env)
        -> std::expected<parsed_invocation, validation_error>
    {
        parsed_invocation out;
        raw_values raw;
        std::vector<value_flag const *> seen;
        bool ssh_sudo = false;

        for (std::size_t i = 0; i < args.size(); ++i)
        {
            std::string_view arg = args[i];

            if (arg == "-h" || arg == "--help")
            {
                out.options.show_help = true;
                return out;
            }
            if (arg == "-n" || arg == "--dry-run")
            {
                out.options.dry_run = true;
                continue;
            }
            if (arg == "-q" || arg == "--quiet")
            {
                out.options.quiet = true;
                continue;
            }
            if (arg == "--keep-going")
            {
                out.options.keep_going = true;
                continue;
            }
            if (arg == "--ssh-sudo")
            {
                ssh_sudo = true;
                continue;
            }

            // --flag=value
            std::optional<std::string_view> inline_value;
            if (arg.starts_with("--"))
            {
                if (auto const eq = arg.find('='); eq != std::string_view::npos)
                {
                    inline_value = arg.substr(eq + 1);
                    arg = arg.substr(0, eq);
                }
            }

            auto const *flag = find_value_flag(arg);
            if (flag == nullptr)
            {
                return fail(error_code::unknown_argument, fmt::format("unrecognized argument '{}'", args[i]));
            }

            if (inline_value.has_value())
            {
                raw.*(flag->member) = std::string{*inline_value};
            }
            else if (i + 1 < args.size())
            {
                raw.*(flag->member) = std::string{args[++i]};
            }
            else
            {
                return fail(error_code::missing_value, fmt::format("{} expects a value", flag->name));
            }

            if (std::find(seen.begin(), seen.end(), flag) == seen.end())
            {
                seen.push_back(flag);
            }
        }

        if (!raw.mode.has_value())
        {
            return fail(error_code::missing_mode,
                        "the following argument is required: -m/--mode (bandwidth, mptcp-client, mptcp-server)");
        }

        auto const selected = mode_from_string(*raw.mode);
        if (!selected.has_value())
        {
            return fail(error_code::invalid_mode,
                        fmt::format("invalid mode '{}' (choose from bandwidth, mptcp-client, mptcp-server)", *raw.mode));
        }

        std::expected<request, validation_error> req;
        switch (*selected)
        {
        case mode::bandwidth:
            req = build_bandwidth(raw);
            break;
        case mode::mptcp_client:
            req = mptcp_client_request{};
            break;
        case mode::mptcp_server:
            req = build_server(raw);
            break;
        }
        if (!req.has_value())
        {
            return std::unexpected{std::move(req.error())};
        }
        out.req = std::move(*req);

        auto remote = build_remote(raw, ssh_sudo, env);
        if (!remote.has_value())
        {
            return std::unexpected{std::move(remote.error())};
        }
        out.options.remote = std::move(*remote);

        for (auto const *flag : seen)
        {
            if (!belongs_to(flag->scope, *selected))
            {
                out.ignored_flags.emplace_back(flag->name);
            }
        }

        return out;
    }

    auto usage_text(std::string_view program_name) -> std::string
    {
        return fmt::format(R"(
Usage: sudo {0} -m <mode> [options]

Configure MPTCP endpoints and shape interface bandwidth with ip(8) and tc(8).

Modes:
  bandwidth       Limit two interfaces with a token bucket qdisc
                  requires --iface1, --bw1, --iface2, --bw2
  mptcp-client    Raise the MPTCP subflow and add_addr_accepted limits
  mptcp-server    Raise the subflow limit and announce a subflow endpoint
                  requires --subflow-ip, --subflow-iface

Bandwidth mode:
  --iface1 <iface>       First network interface
  --bw1 <mbit>           Bandwidth for the first interface in Mbit/s
  --iface2 <iface>       Second network interface
  --bw2 <mbit>           Bandwidth for the second interface in Mbit/s

MPTCP server mode:
  --subflow-ip <addr>    Subflow IPv4/IPv6 address to announce
  --subflow-iface <if>   Interface carrying the subflow address

General:
  -n, --dry-run          Print the commands without running them
  -q, --quiet            Only report warnings and errors
  --keep-going           After a failure, still configure the remaining interfaces
  -h, --help             Show this help

Remote execution:
  --remote-host <host>   Run the commands on <host> over SSH
  --ssh-user <user>      SSH username (default: $USER)
  --ssh-port <port>      SSH port (default: 22)
  --ssh-key <path>       Private key (default keys and agent are tried as well)
  --ssh-pass <pass>      Password (prefer NETCTL_SSH_PASSWORD)
  --ssh-sudo             Run the remote commands through "sudo -n"

Examples:
  sudo {0} -m bandwidth --iface1 eth0 --bw1 100 --iface2 eth1 --bw2 50
  sudo {0} -m mptcp-client
  sudo {0} -m mptcp-server --subflow-ip 192.168.1.100 --subflow-iface eth0

)",
                           program_name);
    }

} // namespace netctl
