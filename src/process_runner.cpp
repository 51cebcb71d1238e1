// process_runner.cpp - run a program from PATH and capture its output
// posix_spawnp instead of fork/exec, pipes drained with poll so a chatty
// child can't deadlock us on a full stderr pipe

#include "netctl/process_runner.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char **environ;

namespace netctl
{

    namespace
    {

        // RAII wrapper for a file descriptor
        class unique_fd
        {
            int fd_{-1};

        public:
            unique_fd() noexcept = default;
            explicit unique_fd(int const fd) noexcept : fd_{fd} {}
            ~unique_fd() noexcept { reset(); }

            unique_fd(unique_fd const &) = delete;
            auto operator=(unique_fd const &) -> unique_fd & = delete;

            unique_fd(unique_fd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }

            auto operator=(unique_fd &&other) noexcept -> unique_fd &
            {
                if (this != &other)
                {
                    reset();
                    fd_ = other.fd_;
                    other.fd_ = -1;
                }
                return *this;
            }

            auto reset() noexcept -> void
            {
                if (fd_ >= 0)
                {
                    ::close(fd_);
                    fd_ = -1;
                }
            }

            [[nodiscard]] auto get() const noexcept -> int { return fd_; }
            [[nodiscard]] auto is_valid() const noexcept -> bool { return fd_ >= 0; }
        };

        struct pipe_pair
        {
            unique_fd read_end;
            unique_fd write_end;
        };

        [[nodiscard]] auto make_pipe() noexcept -> result<pipe_pair>
        {
            std::array<int, 2> fds{-1, -1};
            // cloexec: only the dup2'd copies survive into the child
            if (::pipe2(fds.data(), O_CLOEXEC) != 0)
            {
                return std::unexpected{error_code::spawn_failed};
            }
            return pipe_pair{unique_fd{fds[0]}, unique_fd{fds[1]}};
        }

        // RAII wrapper for posix_spawn_file_actions_t
        class spawn_actions
        {
            posix_spawn_file_actions_t actions_{};
            bool initialized_{false};

        public:
            spawn_actions() noexcept : initialized_{::posix_spawn_file_actions_init(&actions_) == 0} {}
            ~spawn_actions() noexcept
            {
                if (initialized_)
                {
                    ::posix_spawn_file_actions_destroy(&actions_);
                }
            }

            spawn_actions(spawn_actions const &) = delete;
            auto operator=(spawn_actions const &) -> spawn_actions & = delete;

            [[nodiscard]] auto is_valid() const noexcept -> bool { return initialized_; }
            [[nodiscard]] auto get() noexcept -> posix_spawn_file_actions_t * { return &actions_; }
        };

        [[nodiscard]] auto map_spawn_errno(int const err) noexcept -> error_code
        {
            switch (err)
            {
            case ENOENT:
            case ENOTDIR:
                return error_code::command_not_found;
            case EACCES:
            case EPERM:
                return error_code::permission_denied;
            default:
                return error_code::spawn_failed;
            }
        }

        // read both pipes until both hit EOF, keeping at most limit bytes of each
        [[nodiscard]] auto drain(unique_fd &out, unique_fd &err, std::size_t const limit, process_output &output)
            -> bool
        {
            std::array<char, 4096> buffer{};
            std::array<pollfd, 2> fds{
                pollfd{.fd = out.get(), .events = POLLIN, .revents = 0},
                pollfd{.fd = err.get(), .events = POLLIN, .revents = 0},
            };

            auto open_count = 2;
            while (open_count > 0)
            {
                auto const ready = ::poll(fds.data(), fds.size(), -1);
                if (ready < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    return false;
                }

                for (std::size_t i = 0; i < fds.size(); ++i)
                {
                    if (fds[i].fd < 0 || fds[i].revents == 0)
                    {
                        continue;
                    }

                    auto const nbytes = ::read(fds[i].fd, buffer.data(), buffer.size());
                    if (nbytes > 0)
                    {
                        auto &sink = (i == 0) ? output.stdout_output : output.stderr_output;
                        auto const room = limit - std::min(limit, sink.size());
                        sink.append(buffer.data(), std::min(room, static_cast<std::size_t>(nbytes)));
                        continue;
                    }
                    if (nbytes < 0 && (errno == EINTR || errno == EAGAIN))
                    {
                        continue;
                    }

                    // eof or hard error - stop polling this one
                    fds[i].fd = -1;
                    --open_count;
                }
            }
            return true;
        }

        [[nodiscard]] auto wait_for_exit(pid_t const pid) noexcept -> result<int>
        {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0)
            {
                if (errno != EINTR)
                {
                    return std::unexpected{error_code::spawn_failed};
                }
            }

            if (WIFEXITED(status))
            {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status))
            {
                // same convention as the shell
                return 128 + WTERMSIG(status);
            }
            return std::unexpected{error_code::spawn_failed};
        }

    } // anonymous namespace

    auto local_process_runner::run(std::span<std::string const> argv) -> result<process_output>
    {
        if (argv.empty() || argv.front().empty())
        {
            return std::unexpected{error_code::spawn_failed};
        }

        auto out_pipe = make_pipe();
        if (!out_pipe.has_value())
        {
            return std::unexpected{out_pipe.error()};
        }
        auto err_pipe = make_pipe();
        if (!err_pipe.has_value())
        {
            return std::unexpected{err_pipe.error()};
        }

        spawn_actions actions;
        if (!actions.is_valid() ||
            ::posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0) != 0 ||
            ::posix_spawn_file_actions_adddup2(actions.get(), out_pipe->write_end.get(), STDOUT_FILENO) != 0 ||
            ::posix_spawn_file_actions_adddup2(actions.get(), err_pipe->write_end.get(), STDERR_FILENO) != 0)
        {
            return std::unexpected{error_code::spawn_failed};
        }

        std::vector<char *> c_argv;
        c_argv.reserve(argv.size() + 1);
        for (auto const &arg : argv)
        {
            // posix_spawn takes char *const[] but never writes through it
            c_argv.push_back(const_cast<char *>(arg.c_str()));
        }
        c_argv.push_back(nullptr);

        pid_t pid = -1;
        auto const rc = ::posix_spawnp(&pid, c_argv.front(), actions.get(), nullptr, c_argv.data(), environ);
        if (rc != 0)
        {
            return std::unexpected{map_spawn_errno(rc)};
        }

        // parent keeps only the read ends, otherwise EOF never arrives
        out_pipe->write_end.reset();
        err_pipe->write_end.reset();

        process_output output;
        auto const drained = drain(out_pipe->read_end, err_pipe->read_end, capture_limit_, output);

        // always reap, even when reading failed
        auto const exit_code = wait_for_exit(pid);
        if (!exit_code.has_value())
        {
            return std::unexpected{exit_code.error()};
        }
        if (!drained)
        {
            return std::unexpected{error_code::spawn_failed};
        }

        output.exit_code = *exit_code;
        return output;
    }

    auto local_process_runner::target() const -> std::string
    {
        return "localhost";
    }

} // namespace netctl
