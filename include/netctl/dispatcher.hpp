#pragma once

// dispatcher.hpp - runs a command plan step by step, stops at the first failure
// no retries, no rollback: whatever already ran stays applied

#include "command.hpp"
#include "common.hpp"
#include "process_runner.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <string>

namespace netctl
{

    // =============================================================================
    // failure of one step
    // =============================================================================

    struct command_error
    {
        // command_failed, command_not_found, permission_denied, spawn_failed or remote_*
        error_code code{error_code::command_failed};
        command_invocation command{};
        std::string sequence_label{};

        // only meaningful for command_failed
        int exit_code{0};
        std::string stderr_output{};

        [[nodiscard]] auto describe() const -> std::string;
    };

    // =============================================================================
    // execution
    // =============================================================================

    struct execution_options
    {
        // after a failed sequence, still run the remaining sequences
        bool keep_going{false};
    };

    enum class step_phase : std::uint8_t
    {
        starting,
        succeeded,
        tolerated_failure,
        failed,
    };

    struct step_event
    {
        step_phase phase{step_phase::starting};
        command_sequence const *sequence{nullptr};
        command_invocation const *command{nullptr};
        std::size_t index{0}; // 1-based over the whole plan
        std::size_t total{0};

        // set once the step has finished
        process_output const *output{nullptr};
        error_code error{error_code::success};
    };

    using step_observer = std::function<void(step_event const &)>;

    struct execution_summary
    {
        std::size_t steps_run{0};
        std::size_t steps_tolerated{0};
        std::size_t sequences_completed{0};
    };

    class dispatcher
    {
    public:
        explicit dispatcher(process_runner &runner, execution_options options = {}) noexcept
            : runner_{runner}, options_{options}
        {
        }

        auto set_observer(step_observer observer) -> void { observer_ = std::move(observer); }

        // runs every step in order; returns the first error
        [[nodiscard]] auto execute(std::span<command_sequence const> plan) -> std::expected<execution_summary, command_error>;

    private:
        [[nodiscard]] auto run_sequence(command_sequence const &seq, std::size_t first_index, std::size_t total,
                                        execution_summary &summary) -> std::expected<void, command_error>;

        auto notify(step_event const &event) const -> void;

        process_runner &runner_;
        execution_options options_;
        step_observer observer_{};
    };

    // =============================================================================
    // process exit status
    // =============================================================================

    [[nodiscard]] auto exit_status_for(command_error const &err) noexcept -> int;

} // namespace netctl

template <>
struct fmt::formatter<netctl::command_error> : fmt::formatter<std::string_view>
{
    auto format(netctl::command_error const &value, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(value.describe(), ctx);
    }
};
