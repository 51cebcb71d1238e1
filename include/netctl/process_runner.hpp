#pragma once

// process_runner.hpp - the seam between the dispatcher and the OS
// tests swap in a recording fake, --remote-host swaps in ssh_runner

#include "common.hpp"

#include <cstddef>
#include <span>
#include <string>

namespace netctl
{

    // =============================================================================
    // result of one finished process
    // =============================================================================

    struct process_output
    {
        int exit_code{0};
        std::string stdout_output;
        std::string stderr_output;

        [[nodiscard]] auto success() const noexcept -> bool { return exit_code == 0; }
    };

    // =============================================================================
    // process runner interface
    // =============================================================================

    class process_runner
    {
    public:
        process_runner() = default;
        virtual ~process_runner() = default;

        process_runner(process_runner const &) = delete;
        auto operator=(process_runner const &) -> process_runner & = delete;
        process_runner(process_runner &&) = delete;
        auto operator=(process_runner &&) -> process_runner & = delete;

        // blocks until the process exits. a non-zero exit is still a value;
        // the error channel is for processes that could not be run at all
        [[nodiscard]] virtual auto run(std::span<std::string const> argv) -> result<process_output> = 0;

        // where the commands run, for status messages
        [[nodiscard]] virtual auto target() const -> std::string = 0;
    };

    // =============================================================================
    // local runner - posix_spawnp + pipes + waitpid
    // =============================================================================

    class local_process_runner final : public process_runner
    {
    public:
        // bytes kept per stream; the rest is read and dropped so the child never blocks
        explicit local_process_runner(std::size_t capture_limit = constants::max_captured_output) noexcept
            : capture_limit_{capture_limit}
        {
        }

        [[nodiscard]] auto run(std::span<std::string const> argv) -> result<process_output> override;
        [[nodiscard]] auto target() const -> std::string override;

    private:
        std::size_t capture_limit_;
    };

} // namespace netctl
