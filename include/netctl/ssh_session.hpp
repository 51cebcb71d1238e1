#pragma once

// ssh_session.hpp - one authenticated libssh connection to a remote_target,
// used to run single command lines and collect their output

#include "process_runner.hpp"
#include "request.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace netctl::ssh
{

    enum class error
    {
        success = 0,
        not_connected,
        connection_failed,
        host_key_rejected,
        authentication_failed,
        exec_failed,
        no_exit_status,
    };

    [[nodiscard]] auto make_error_code(error e) noexcept -> std::error_code;
    [[nodiscard]] auto to_string(error e) -> std::string;

} // namespace netctl::ssh

template <>
struct std::is_error_code_enum<netctl::ssh::error> : std::true_type
{
};

namespace netctl::ssh
{

    template <typename T>
    using result = std::expected<T, error>;

    class session
    {
    public:
        // not connected; every run() fails with not_connected
        session() noexcept;
        ~session();

        session(session const &) = delete;
        auto operator=(session const &) -> session & = delete;
        session(session &&) noexcept;
        auto operator=(session &&) noexcept -> session &;

        // host key must already be in known_hosts. auth order: --ssh-key, then
        // default keys and agent, then password
        [[nodiscard]] static auto open(remote_target const &target) -> result<session>;

        [[nodiscard]] auto is_connected() const noexcept -> bool;

        // "user@host:port", empty when not connected
        [[nodiscard]] auto endpoint() const -> std::string;

        [[nodiscard]] auto run(std::string const &command_line) -> result<process_output>;

    private:
        struct state;
        std::unique_ptr<state> state_;

        explicit session(std::unique_ptr<state> s) noexcept;
    };

} // namespace netctl::ssh
