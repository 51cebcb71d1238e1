// dispatcher.cpp - sequential, fail-fast execution of a command plan

#include "netctl/dispatcher.hpp"

#include <fmt/format.h>

#include <optional>

namespace netctl
{

    namespace
    {

        [[nodiscard]] auto trim_trailing_newlines(std::string_view text) noexcept -> std::string_view
        {
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
            {
                text.remove_suffix(1);
            }
            return text;
        }

    } // anonymous namespace

    auto command_error::describe() const -> std::string
    {
        switch (code)
        {
        case error_code::command_failed:
        {
            auto const detail = trim_trailing_newlines(stderr_output);
            if (detail.empty())
            {
                return fmt::format("'{}' exited with status {}", command, exit_code);
            }
            return fmt::format("'{}' exited with status {}: {}", command, exit_code, detail);
        }
        case error_code::command_not_found:
            return fmt::format("'{}' not found on PATH", command.program());
        case error_code::permission_denied:
            return fmt::format("permission denied executing '{}'", command.program());
        default:
            return fmt::format("could not run '{}' ({})", command, code);
        }
    }

    auto dispatcher::notify(step_event const &event) const -> void
    {
        if (observer_)
        {
            observer_(event);
        }
    }

    auto dispatcher::run_sequence(command_sequence const &seq, std::size_t const first_index, std::size_t const total,
                                  execution_summary &summary) -> std::expected<void, command_error>
    {
        auto index = first_index;
        for (auto const &step : seq.steps)
        {
            ++index;
            step_event event{.phase = step_phase::starting, .sequence = &seq, .command = &step, .index = index, .total = total};
            notify(event);

            auto output = runner_.run(step.argv);
            ++summary.steps_run;

            // could not run at all - never tolerated, a missing tool fails every later step too
            if (!output.has_value())
            {
                event.phase = step_phase::failed;
                event.error = output.error();
                notify(event);
                return std::unexpected{command_error{
                    .code = output.error(),
                    .command = step,
                    .sequence_label = seq.label,
                }};
            }

            event.output = &*output;

            if (output->success())
            {
                event.phase = step_phase::succeeded;
                notify(event);
                continue;
            }

            if (step.tolerate_failure)
            {
                ++summary.steps_tolerated;
                event.phase = step_phase::tolerated_failure;
                event.error = error_code::command_failed;
                notify(event);
                continue;
            }

            event.phase = step_phase::failed;
            event.error = error_code::command_failed;
            notify(event);
            return std::unexpected{command_error{
                .code = error_code::command_failed,
                .command = step,
                .sequence_label = seq.label,
                .exit_code = output->exit_code,
                .stderr_output = std::move(output->stderr_output),
            }};
        }

        ++summary.sequences_completed;
        return {};
    }

    auto dispatcher::execute(std::span<command_sequence const> plan) -> std::expected<execution_summary, command_error>
    {
        std::size_t total = 0;
        for (auto const &seq : plan)
        {
            total += seq.steps.size();
        }

        execution_summary summary;
        std::optional<command_error> first_error;
        std::size_t offset = 0;

        for (auto const &seq : plan)
        {
            // step numbers follow the plan even when a sequence stopped early
            auto const ran = run_sequence(seq, offset, total, summary);
            offset += seq.steps.size();
            if (ran.has_value())
            {
                continue;
            }

            if (!first_error.has_value())
            {
                first_error = ran.error();
            }

            if (!options_.keep_going)
            {
                break;
            }
        }

        if (first_error.has_value())
        {
            return std::unexpected{std::move(*first_error)};
        }
        return summary;
    }

    auto exit_status_for(command_error const &err) noexcept -> int
    {
        switch (err.code)
        {
        case error_code::command_failed:
            return (err.exit_code > 0 && err.exit_code <= 255) ? err.exit_code : constants::exit_failure;
        case error_code::command_not_found:
            return constants::exit_not_found;
        case error_code::permission_denied:
            return constants::exit_not_executable;
        default:
            return constants::exit_failure;
        }
    }

} // namespace netctl
