// ssh_session.cpp - libssh connection, host key check and command execution

#include "netctl/ssh_session.hpp"

#include <fmt/format.h>

#include <array>
#include <cstdint>

#include <libssh/libssh.h>

namespace netctl::ssh
{

    namespace
    {

        class category final : public std::error_category
        {
        public:
            [[nodiscard]] auto name() const noexcept -> char const * override { return "ssh"; }

            [[nodiscard]] auto message(int ev) const -> std::string override
            {
                switch (static_cast<error>(ev))
                {
                case error::success:
                    return "success";
                case error::not_connected:
                    return "no ssh connection";
                case error::connection_failed:
                    return "ssh connection failed";
                case error::host_key_rejected:
                    return "host key unknown or changed, check known_hosts";
                case error::authentication_failed:
                    return "ssh authentication failed";
                case error::exec_failed:
                    return "remote command could not be started";
                case error::no_exit_status:
                    return "remote command ended without an exit status";
                }
                return fmt::format("unknown ssh error ({})", ev);
            }
        };

        [[nodiscard]] auto ssh_category() noexcept -> std::error_category const &
        {
            static category const instance;
            return instance;
        }

        struct session_closer
        {
            auto operator()(ssh_session_struct *s) const noexcept -> void
            {
                ssh_disconnect(s);
                ssh_free(s);
            }
        };

        struct channel_closer
        {
            auto operator()(ssh_channel_struct *c) const noexcept -> void
            {
                ssh_channel_close(c);
                ssh_channel_free(c);
            }
        };

        struct key_closer
        {
            auto operator()(ssh_key_struct *k) const noexcept -> void { ssh_key_free(k); }
        };

        using session_handle = std::unique_ptr<ssh_session_struct, session_closer>;
        using channel_handle = std::unique_ptr<ssh_channel_struct, channel_closer>;
        using key_handle = std::unique_ptr<ssh_key_struct, key_closer>;

        // wait per stream and round, so stdout and stderr are read in turns
        // and neither fills its window while the other is drained
        constexpr int read_slice_ms = 100;

        [[nodiscard]] auto authenticate(ssh_session_struct *s, remote_target const &target) -> bool
        {
            if (!target.private_key_path.empty())
            {
                ssh_key raw_key = nullptr;
                if (ssh_pki_import_privkey_file(target.private_key_path.c_str(), nullptr, nullptr, nullptr,
                                                &raw_key) == SSH_OK)
                {
                    key_handle const key{raw_key};
                    if (ssh_userauth_publickey(s, nullptr, key.get()) == SSH_AUTH_SUCCESS)
                    {
                        return true;
                    }
                }
            }

            if (ssh_userauth_publickey_auto(s, nullptr, nullptr) == SSH_AUTH_SUCCESS)
            {
                return true;
            }

            return !target.password.empty() &&
                   ssh_userauth_password(s, nullptr, target.password.c_str()) == SSH_AUTH_SUCCESS;
        }

        [[nodiscard]] auto drain(ssh_channel_struct *channel, process_output &output) -> bool
        {
            std::array<char, 4096> buffer{};
            bool more = true;
            while (more)
            {
                more = false;
                for (int const is_stderr : {0, 1})
                {
                    int const nbytes = ssh_channel_read_timeout(channel, buffer.data(),
                                                                static_cast<std::uint32_t>(buffer.size()),
                                                                is_stderr, read_slice_ms);
                    if (nbytes == SSH_ERROR)
                    {
                        return false;
                    }
                    if (nbytes > 0)
                    {
                        auto &sink = is_stderr != 0 ? output.stderr_output : output.stdout_output;
                        sink.append(buffer.data(), static_cast<std::size_t>(nbytes));
                        more = true;
                    }
                }
                more = more || (ssh_channel_is_open(channel) != 0 && ssh_channel_is_eof(channel) == 0);
            }
            return true;
        }

    } // namespace

    auto make_error_code(error e) noexcept -> std::error_code
    {
        return {static_cast<int>(e), ssh_category()};
    }

    auto to_string(error e) -> std::string
    {
        return ssh_category().message(static_cast<int>(e));
    }

    struct session::state
    {
        session_handle handle;
        std::string endpoint;
    };

    session::session() noexcept = default;

    session::~session() = default;

    session::session(session &&) noexcept = default;

    auto session::operator=(session &&) noexcept -> session & = default;

    session::session(std::unique_ptr<state> s) noexcept : state_{std::move(s)} {}

    auto session::open(remote_target const &target) -> result<session>
    {
        session_handle handle{ssh_new()};
        if (!handle)
        {
            return std::unexpected{error::connection_failed};
        }

        int const port = target.port;
        long const timeout = static_cast<long>(target.connect_timeout.count());
        ssh_options_set(handle.get(), SSH_OPTIONS_HOST, target.host.c_str());
        ssh_options_set(handle.get(), SSH_OPTIONS_PORT, &port);
        ssh_options_set(handle.get(), SSH_OPTIONS_USER, target.username.c_str());
        ssh_options_set(handle.get(), SSH_OPTIONS_TIMEOUT, &timeout);

        if (ssh_connect(handle.get()) != SSH_OK)
        {
            return std::unexpected{error::connection_failed};
        }

        // commands run as root on the far side, never trust a new key silently
        if (ssh_session_is_known_server(handle.get()) != SSH_KNOWN_HOSTS_OK)
        {
            return std::unexpected{error::host_key_rejected};
        }

        if (!authenticate(handle.get(), target))
        {
            return std::unexpected{error::authentication_failed};
        }

        return session{std::make_unique<state>(state{
            .handle = std::move(handle),
            .endpoint = fmt::format("{}@{}:{}", target.username, target.host, target.port),
        })};
    }

    auto session::is_connected() const noexcept -> bool
    {
        return state_ && state_->handle && ssh_is_connected(state_->handle.get()) != 0;
    }

    auto session::endpoint() const -> std::string
    {
        return state_ ? state_->endpoint : std::string{};
    }

    auto session::run(std::string const &command_line) -> result<process_output>
    {
        if (!is_connected())
        {
            return std::unexpected{error::not_connected};
        }

        channel_handle const channel{ssh_channel_new(state_->handle.get())};
        if (!channel || ssh_channel_open_session(channel.get()) != SSH_OK)
        {
            return std::unexpected{error::exec_failed};
        }
        if (ssh_channel_request_exec(channel.get(), command_line.c_str()) != SSH_OK)
        {
            return std::unexpected{error::exec_failed};
        }

        process_output output;
        if (!drain(channel.get(), output))
        {
            return std::unexpected{error::exec_failed};
        }

        ssh_channel_send_eof(channel.get());

        // negative when the channel closed before exit-status arrived, e.g. killed by a signal
        output.exit_code = ssh_channel_get_exit_status(channel.get());
        if (output.exit_code < 0)
        {
            return std::unexpected{error::no_exit_status};
        }
        return output;
    }

} // namespace netctl::ssh
