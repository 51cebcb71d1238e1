// netctl_app.cpp - command line entry point

#include "netctl/cli.hpp"

#include <string_view>
#include <vector>

auto main(int argc, char const *argv[]) -> int
{
    auto *const first = argc > 0 ? argv + 1 : argv;
    std::vector<std::string_view> const args(first, argv + argc);
    std::string_view const program_name = argc > 0 ? argv[0] : "netctl";

    netctl::console out;
    return netctl::run_cli(program_name, args, netctl::parse_environment::from_process(), out);
}
