#pragma once

#include "netctl/command.hpp"
#include "netctl/console.hpp"
#include "netctl/process_runner.hpp"
#include "netctl/request.hpp"

#include <array>
#include <cstdio>
#include <doctest/doctest.h>
#include <expected>
#include <initializer_list>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace netctl::testing
{

    // records every argv it is asked to run; outcomes are scripted per call index
    class recording_runner final : public process_runner
    {
    public:
        std::vector<std::vector<std::string>> calls;
        std::map<std::size_t, result<process_output>> scripted;

        // 0-based call index -> exit code
        auto fail_call(std::size_t const call, int const exit_code, std::string stderr_output = "boom\n") -> void
        {
            scripted.insert_or_assign(call, result<process_output>{process_output{
                                                .exit_code = exit_code,
                                                .stdout_output = {},
                                                .stderr_output = std::move(stderr_output),
                                            }});
        }

        auto error_on_call(std::size_t const call, error_code const ec) -> void
        {
            scripted.insert_or_assign(call, result<process_output>{std::unexpected{ec}});
        }

        [[nodiscard]] auto run(std::span<std::string const> argv) -> result<process_output> override
        {
            auto const index = calls.size();
            calls.emplace_back(argv.begin(), argv.end());

            if (auto const it = scripted.find(index); it != scripted.end())
            {
                return it->second;
            }
            return process_output{};
        }

        [[nodiscard]] auto target() const -> std::string override { return "test"; }
    };

    // console writing into two temporary files, read back after the fact
    class captured_output
    {
    public:
        captured_output() : out_{std::tmpfile()}, err_{std::tmpfile()}
        {
            REQUIRE(out_);
            REQUIRE(err_);
        }

        [[nodiscard]] auto make_console(bool const quiet = false) const -> console
        {
            return console{quiet, out_.get(), err_.get(), false};
        }

        [[nodiscard]] auto out_text() const -> std::string { return contents(out_.get()); }
        [[nodiscard]] auto err_text() const -> std::string { return contents(err_.get()); }

    private:
        struct file_closer
        {
            auto operator()(std::FILE *f) const noexcept -> void { std::fclose(f); }
        };

        [[nodiscard]] static auto contents(std::FILE *f) -> std::string
        {
            std::fflush(f);
            std::rewind(f);
            std::string text;
            std::array<char, 512> buffer{};
            std::size_t n = 0;
            while ((n = std::fread(buffer.data(), 1, buffer.size(), f)) > 0)
            {
                text.append(buffer.data(), n);
            }
            return text;
        }

        std::unique_ptr<std::FILE, file_closer> out_;
        std::unique_ptr<std::FILE, file_closer> err_;
    };

    // parse a command line written as separate words
    [[nodiscard]] inline auto parse_words(std::initializer_list<std::string_view> words,
                                          parse_environment const &env = {.user = "tester", .ssh_password = {}})
        -> std::expected<parsed_invocation, validation_error>
    {
        std::vector<std::string_view> const args(words);
        return parse(args, env);
    }

    [[nodiscard]] inline auto argv_of(std::initializer_list<char const *> words) -> std::vector<std::string>
    {
        return std::vector<std::string>(words.begin(), words.end());
    }

    inline auto check_argv(command_invocation const &cmd, std::initializer_list<char const *> expected) -> void
    {
        CHECK(cmd.argv == argv_of(expected));
    }

} // namespace netctl::testing
