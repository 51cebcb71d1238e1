#pragma once

// ssh_runner.hpp - process_runner that executes on another host over SSH

#include "process_runner.hpp"
#include "request.hpp"
#include "ssh_session.hpp"

#include <memory>

namespace netctl
{

    class ssh_runner final : public process_runner
    {
    public:
        explicit ssh_runner(ssh::session session, bool use_sudo = false);

        // connects and authenticates, ssh errors mapped to remote_* codes
        [[nodiscard]] static auto connect(remote_target const &target) -> result<std::unique_ptr<ssh_runner>>;

        [[nodiscard]] auto run(std::span<std::string const> argv) -> result<process_output> override;
        [[nodiscard]] auto target() const -> std::string override;

    private:
        ssh::session session_;
        bool use_sudo_{false};
    };

    [[nodiscard]] auto map_ssh_error(ssh::error e) noexcept -> error_code;

    // the command line sent to the remote shell
    [[nodiscard]] auto remote_command_line(std::span<std::string const> argv, bool use_sudo) -> std::string;

} // namespace netctl
