// ssh_runner.cpp - run invocations on a remote host

#include "netctl/ssh_runner.hpp"
#include "netctl/command.hpp"

#include <fmt/format.h>

namespace netctl
{

    auto map_ssh_error(ssh::error e) noexcept -> error_code
    {
        switch (e)
        {
        case ssh::error::success:
            return error_code::success;
        case ssh::error::authentication_failed:
            return error_code::remote_authentication_failed;
        case ssh::error::not_connected:
        case ssh::error::connection_failed:
        case ssh::error::host_key_rejected:
            return error_code::remote_connection_failed;
        case ssh::error::exec_failed:
        case ssh::error::no_exit_status:
            return error_code::remote_exec_failed;
        }
        return error_code::remote_exec_failed;
    }

    auto remote_command_line(std::span<std::string const> argv, bool use_sudo) -> std::string
    {
        auto const line = shell_join(argv);
        // -n: fail instead of prompting, there is no tty to answer on
        return use_sudo ? fmt::format("sudo -n {}", line) : line;
    }

    ssh_runner::ssh_runner(ssh::session session, bool use_sudo)
        : session_{std::move(session)}, use_sudo_{use_sudo}
    {
    }

    auto ssh_runner::connect(remote_target const &target) -> result<std::unique_ptr<ssh_runner>>
    {
        auto session = ssh::session::open(target);
        if (!session.has_value())
        {
            return std::unexpected{map_ssh_error(session.error())};
        }

        return std::make_unique<ssh_runner>(std::move(*session), target.use_sudo);
    }

    auto ssh_runner::run(std::span<std::string const> argv) -> result<process_output>
    {
        if (argv.empty())
        {
            return std::unexpected{error_code::spawn_failed};
        }

        auto executed = session_.run(remote_command_line(argv, use_sudo_));
        if (!executed.has_value())
        {
            return std::unexpected{map_ssh_error(executed.error())};
        }

        // the remote shell reports a missing or non-executable tool through its exit status
        if (executed->exit_code == constants::exit_not_found)
        {
            return std::unexpected{error_code::command_not_found};
        }
        if (executed->exit_code == constants::exit_not_executable)
        {
            return std::unexpected{error_code::permission_denied};
        }

        return std::move(*executed);
    }

    auto ssh_runner::target() const -> std::string
    {
        return session_.endpoint();
    }

} // namespace netctl
