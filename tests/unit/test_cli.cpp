// tests/unit/test_cli.cpp - the command line flow end to end, against a recording runner

#include "netctl/cli.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <doctest/doctest.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using netctl::testing::captured_output;
using netctl::testing::parse_words;
using netctl::testing::recording_runner;

namespace
{

    [[nodiscard]] auto contains(std::string const &text, std::string_view const needle) -> bool
    {
        return text.find(needle) != std::string::npos;
    }

    [[nodiscard]] auto line_count(std::string const &text) -> std::size_t
    {
        return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
    }

    [[nodiscard]] auto shape_both() -> std::vector<std::string_view>
    {
        return {"-m", "bandwidth", "--iface1", "eth0", "--bw1", "100", "--iface2", "eth1", "--bw2", "50"};
    }

    netctl::parse_environment const test_env{.user = "tester", .ssh_password = {}};

} // anonymous namespace

TEST_SUITE("run")
{
    TEST_CASE("dry run prints the plan and never touches the runner")
    {
        auto const parsed = parse_words(
            {"-m", "bandwidth", "--iface1", "eth0", "--bw1", "100", "--iface2", "eth1", "--bw2", "50", "--dry-run"});
        REQUIRE(parsed.has_value());

        recording_runner runner;
        captured_output const capture;

        CHECK(netctl::run(*parsed, runner, capture.make_console()) == 0);
        CHECK(runner.calls.empty());

        auto const out = capture.out_text();
        CHECK(line_count(out) == 6);
        CHECK(out == "# shape eth0 to 100 Mbit/s\n"
                     "tc qdisc del dev eth0 root || true\n"
                     "tc qdisc add dev eth0 root tbf rate 100mbit burst 256mbit latency 600ms\n"
                     "# shape eth1 to 50 Mbit/s\n"
                     "tc qdisc del dev eth1 root || true\n"
                     "tc qdisc add dev eth1 root tbf rate 50mbit burst 256mbit latency 600ms\n");
        CHECK(capture.err_text().empty());
    }

    TEST_CASE("failing apply step exits with its status and says nothing was rolled back")
    {
        auto const parsed = parse_words({"-m", "bandwidth", "--iface1", "eth0", "--bw1", "100", "--iface2", "eth1",
                                         "--bw2", "50"});
        REQUIRE(parsed.has_value());

        recording_runner runner;
        runner.fail_call(1, 2, "Error: Specified qdisc kind is unknown.\n");
        captured_output const capture;

        CHECK(netctl::run(*parsed, runner, capture.make_console()) == 2);
        CHECK(runner.calls.size() == 2);

        auto const err = capture.err_text();
        CHECK(contains(err, "[!] shape eth0 to 100 Mbit/s failed"));
        CHECK(contains(err, "Specified qdisc kind is unknown."));
        CHECK(contains(err, "[?] 1 earlier command(s) stay applied, nothing was rolled back"));
        CHECK(contains(capture.out_text(), "[*] [1/4] tc qdisc del dev eth0 root\n"));
    }

    TEST_CASE("failure on the very first step has nothing to roll back")
    {
        auto const parsed = parse_words({"-m", "mptcp-client"});
        REQUIRE(parsed.has_value());

        recording_runner runner;
        runner.error_on_call(0, netctl::error_code::command_not_found);
        captured_output const capture;

        CHECK(netctl::run(*parsed, runner, capture.make_console()) == 127);
        CHECK_FALSE(contains(capture.err_text(), "rolled back"));
    }

    TEST_CASE("keep going still shapes the second interface")
    {
        auto const parsed = parse_words({"-m", "bandwidth", "--iface1", "eth0", "--bw1", "100", "--iface2", "eth1",
                                         "--bw2", "50", "--keep-going"});
        REQUIRE(parsed.has_value());

        recording_runner runner;
        runner.fail_call(1, 2);
        captured_output const capture;

        CHECK(netctl::run(*parsed, runner, capture.make_console()) == 2);
        REQUIRE(runner.calls.size() == 4);
        CHECK(runner.calls[3][4] == "eth1");
    }

    TEST_CASE("successful run reports a summary")
    {
        auto const parsed = parse_words({"-m", "mptcp-server", "--subflow-ip", "192.168.1.100", "--subflow-iface", "lo"});
        REQUIRE(parsed.has_value());

        recording_runner runner;
        captured_output const capture;

        CHECK(netctl::run(*parsed, runner, capture.make_console()) == 0);
        CHECK(runner.calls.size() == 2);

        auto const out = capture.out_text();
        CHECK(contains(out, "[*] configuring mptcp-server mode on test (2 commands)\n"));
        CHECK(contains(out, "[*] done: 2 commands run, 0 tolerated failure(s)\n"));
    }

    TEST_CASE("flags of another mode are warned about")
    {
        auto const parsed = parse_words({"-m", "mptcp-client", "--iface1", "eth0", "--dry-run"});
        REQUIRE(parsed.has_value());

        recording_runner runner;
        captured_output const capture;

        CHECK(netctl::run(*parsed, runner, capture.make_console()) == 0);
        CHECK(capture.err_text() == "[?] --iface1 does not apply to mptcp-client mode and is ignored\n");
        CHECK(capture.out_text() == "# enable mptcp client\nip mptcp limits set subflow 2 add_addr_accepted 2\n");
    }
}

TEST_SUITE("run_cli")
{
    TEST_CASE("validation failure exits 2 without creating a runner")
    {
        std::vector<std::string_view> const args{"-m", "bandwidth", "--iface1", "eth0"};
        int factory_calls = 0;
        netctl::runner_factory const factory =
            [&factory_calls](netctl::invocation_options const &, netctl::console const &)
            -> netctl::result<std::unique_ptr<netctl::process_runner>>
        {
            ++factory_calls;
            return std::make_unique<recording_runner>();
        };

        captured_output const capture;
        auto con = capture.make_console();

        CHECK(netctl::run_cli("netctl", args, test_env, con, factory) == netctl::constants::exit_usage);
        CHECK(factory_calls == 0);

        auto const err = capture.err_text();
        CHECK(contains(err, "[!] "));
        CHECK(contains(err, "--bw1"));
        CHECK(contains(err, "Run 'netctl --help' for usage.\n"));
        CHECK(capture.out_text().empty());
    }

    TEST_CASE("missing mode exits 2")
    {
        std::vector<std::string_view> const args;
        captured_output const capture;
        auto con = capture.make_console();

        CHECK(netctl::run_cli("netctl", args, test_env, con) == 2);
        CHECK(contains(capture.err_text(), "[!] "));
    }

    TEST_CASE("help prints usage and exits 0")
    {
        std::vector<std::string_view> const args{"--help"};
        captured_output const capture;
        auto con = capture.make_console();

        CHECK(netctl::run_cli("netctl", args, test_env, con) == 0);
        CHECK(contains(capture.out_text(), "Usage: sudo netctl -m <mode>"));
    }

    TEST_CASE("dry run with a remote target does not connect")
    {
        std::vector<std::string_view> const args{"-m", "mptcp-client", "--remote-host", "10.0.0.5", "-n"};
        int factory_calls = 0;
        netctl::runner_factory const factory =
            [&factory_calls](netctl::invocation_options const &, netctl::console const &)
            -> netctl::result<std::unique_ptr<netctl::process_runner>>
        {
            ++factory_calls;
            return std::unexpected{netctl::error_code::remote_connection_failed};
        };

        captured_output const capture;
        auto con = capture.make_console();

        CHECK(netctl::run_cli("netctl", args, test_env, con, factory) == 0);
        CHECK(factory_calls == 0);
        CHECK(capture.out_text() == "# enable mptcp client\nip mptcp limits set subflow 2 add_addr_accepted 2\n");
    }

    TEST_CASE("unreachable remote host exits 1")
    {
        std::vector<std::string_view> const args{"-m", "mptcp-client", "--remote-host", "10.0.0.5"};
        netctl::runner_factory const factory =
            [](netctl::invocation_options const &options, netctl::console const &)
            -> netctl::result<std::unique_ptr<netctl::process_runner>>
        {
            CHECK(options.remote.has_value());
            return std::unexpected{netctl::error_code::remote_connection_failed};
        };

        captured_output const capture;
        auto con = capture.make_console();

        CHECK(netctl::run_cli("netctl", args, test_env, con, factory) == 1);
        CHECK(contains(capture.err_text(), "[!] cannot reach 10.0.0.5: remote_connection_failed"));
    }

    TEST_CASE("quiet run prints nothing on success")
    {
        std::vector<std::string_view> const args{"-m", "mptcp-client", "-q"};
        std::size_t runs = 0;
        netctl::runner_factory const factory =
            [&runs](netctl::invocation_options const &, netctl::console const &)
            -> netctl::result<std::unique_ptr<netctl::process_runner>>
        {
            ++runs;
            return std::make_unique<recording_runner>();
        };

        captured_output const capture;
        auto con = capture.make_console();

        CHECK(netctl::run_cli("netctl", args, test_env, con, factory) == 0);
        CHECK(runs == 1);
        CHECK(capture.out_text().empty());
        CHECK(capture.err_text().empty());
    }

    TEST_CASE("command failure status reaches the caller")
    {
        auto const args = shape_both();
        netctl::runner_factory const factory =
            [](netctl::invocation_options const &, netctl::console const &)
            -> netctl::result<std::unique_ptr<netctl::process_runner>>
        {
            auto runner = std::make_unique<recording_runner>();
            runner->fail_call(3, 4);
            return runner;
        };

        captured_output const capture;
        auto con = capture.make_console();

        CHECK(netctl::run_cli("netctl", args, test_env, con, factory) == 4);
        CHECK(contains(capture.err_text(), "3 earlier command(s) stay applied"));
    }
}
