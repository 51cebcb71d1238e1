#pragma once

// cli.hpp - the command line flow: parse, help, dry-run, run, exit status

#include "command.hpp"
#include "console.hpp"
#include "process_runner.hpp"
#include "request.hpp"

#include <functional>
#include <memory>
#include <span>
#include <string_view>

namespace netctl
{

    using runner_factory =
        std::function<result<std::unique_ptr<process_runner>>(invocation_options const &, console const &)>;

    // one "# label" line per sequence, then one shell line per step;
    // tolerated steps end in "|| true"
    auto print_plan(command_plan const &plan, console const &out) -> void;

    // local runner, or an ssh_runner when a remote target was given
    [[nodiscard]] auto make_runner(invocation_options const &options, console const &out)
        -> result<std::unique_ptr<process_runner>>;

    // everything after a successful parse; returns the process exit status.
    // a dry run prints the plan and never calls the runner
    [[nodiscard]] auto run(parsed_invocation const &invocation, process_runner &runner, console const &out) -> int;

    // args exclude the program name. validation errors exit with
    // constants::exit_usage, help and dry-run with exit_success
    [[nodiscard]] auto run_cli(std::string_view program_name, std::span<std::string_view const> args,
                               parse_environment const &env, console &out,
                               runner_factory const &factory = make_runner) -> int;

} // namespace netctl
