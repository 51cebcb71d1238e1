// cli.cpp - parse, build the tc / ip mptcp commands, run them, map the outcome

#include "netctl/cli.hpp"
#include "netctl/dispatcher.hpp"
#include "netctl/interface.hpp"
#include "netctl/ssh_runner.hpp"

#include <fmt/format.h>

#include <string>
#include <variant>
#include <vector>

namespace netctl
{

    namespace
    {

        // interfaces named on the command line, for the local existence check
        [[nodiscard]] auto interfaces_of(request const &req) -> std::vector<std::string>
        {
            if (auto const *bw = std::get_if<bandwidth_request>(&req); bw != nullptr)
            {
                return {bw->iface1, bw->iface2};
            }
            if (auto const *server = std::get_if<mptcp_server_request>(&req); server != nullptr)
            {
                return {server->subflow_iface};
            }
            return {};
        }

    } // anonymous namespace

    auto print_plan(command_plan const &plan, console const &out) -> void
    {
        for (auto const &seq : plan)
        {
            out.plain(fmt::format("# {}", seq.label));
            for (auto const &step : seq.steps)
            {
                auto const line = shell_join(step.argv);
                out.plain(step.tolerate_failure ? fmt::format("{} || true", line) : line);
            }
        }
    }

    auto make_runner(invocation_options const &options, console const &out)
        -> result<std::unique_ptr<process_runner>>
    {
        if (!options.remote.has_value())
        {
            return std::make_unique<local_process_runner>();
        }

        auto const &remote = *options.remote;
        out.status(fmt::format("connecting to {}@{}:{}...", remote.username, remote.host, remote.port));

        auto runner = ssh_runner::connect(remote);
        if (!runner.has_value())
        {
            return std::unexpected{runner.error()};
        }
        return std::unique_ptr<process_runner>{std::move(*runner)};
    }

    auto run(parsed_invocation const &invocation, process_runner &runner, console const &out) -> int
    {
        auto const &options = invocation.options;
        auto const selected = mode_of(invocation.req);

        for (auto const &flag : invocation.ignored_flags)
        {
            out.warning(fmt::format("{} does not apply to {} mode and is ignored", flag, selected));
        }

        auto const plan = build_commands(invocation.req);

        if (options.dry_run)
        {
            print_plan(plan, out);
            return constants::exit_success;
        }

        if (!options.remote.has_value())
        {
            for (auto const &iface : interfaces_of(invocation.req))
            {
                if (!interface_exists(iface))
                {
                    out.warning(fmt::format("interface '{}' not found on this host", iface));
                }
            }
        }

        out.status(fmt::format("configuring {} mode on {} ({} commands)", selected, runner.target(),
                               step_count(plan)));

        dispatcher dispatch{runner, execution_options{.keep_going = options.keep_going}};

        std::size_t applied = 0;
        dispatch.set_observer(
            [&out, &applied](step_event const &event)
            {
                if (event.phase == step_phase::succeeded)
                {
                    ++applied;
                }
                out.report_step(event);
            });

        auto const executed = dispatch.execute(plan);
        if (!executed.has_value())
        {
            auto const &err = executed.error();
            out.error(fmt::format("{} failed: {}", err.sequence_label, err));
            if (applied > 0)
            {
                out.warning(fmt::format("{} earlier command(s) stay applied, nothing was rolled back", applied));
            }
            return exit_status_for(err);
        }

        out.status(fmt::format("done: {} commands run, {} tolerated failure(s)", executed->steps_run,
                               executed->steps_tolerated));
        return constants::exit_success;
    }

    auto run_cli(std::string_view program_name, std::span<std::string_view const> args,
                 parse_environment const &env, console &out, runner_factory const &factory) -> int
    {
        auto const parsed = parse(args, env);
        if (!parsed.has_value())
        {
            out.error(parsed.error().message);
            out.detail(fmt::format("Run '{} --help' for usage.", program_name));
            return constants::exit_usage;
        }

        if (parsed->options.show_help)
        {
            out.plain(usage_text(program_name));
            return constants::exit_success;
        }

        out.set_quiet(out.quiet() || parsed->options.quiet);

        // nothing is spawned or connected for a dry run
        if (parsed->options.dry_run)
        {
            local_process_runner idle;
            return run(*parsed, idle, out);
        }

        auto runner = factory(parsed->options, out);
        if (!runner.has_value())
        {
            auto const where = parsed->options.remote.has_value() ? parsed->options.remote->host : "localhost";
            out.error(fmt::format("cannot reach {}: {}", where, runner.error()));
            return constants::exit_failure;
        }

        return run(*parsed, **runner, out);
    }

} // namespace netctl
