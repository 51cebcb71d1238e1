// console.cpp - coloured progress reporting with fmt

#include "netctl/console.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <unistd.h>

namespace netctl
{

    namespace
    {

        [[nodiscard]] auto is_terminal(std::FILE *stream) noexcept -> bool
        {
            return stream != nullptr && ::isatty(::fileno(stream)) == 1;
        }

        auto print_line(std::FILE *stream, bool const color, fmt::color const fg, std::string_view const prefix,
                        std::string_view const msg) -> void
        {
            if (color)
            {
                fmt::print(stream, fmt::fg(fg), "{} {}\n", prefix, msg);
            }
            else
            {
                fmt::print(stream, "{} {}\n", prefix, msg);
            }
        }

        [[nodiscard]] auto first_line(std::string_view text) noexcept -> std::string_view
        {
            auto const end = text.find('\n');
            return end == std::string_view::npos ? text : text.substr(0, end);
        }

    } // anonymous namespace

    console::console(bool quiet) noexcept
        : console{quiet, stdout, stderr, true}
    {
        out_color_ = is_terminal(out_);
        err_color_ = is_terminal(err_);
    }

    console::console(bool quiet, std::FILE *out, std::FILE *err, bool use_color) noexcept
        : quiet_{quiet}, out_{out}, err_{err}, out_color_{use_color}, err_color_{use_color}
    {
    }

    auto console::status(std::string_view msg) const -> void
    {
        if (quiet_)
        {
            return;
        }
        print_line(out_, out_color_, fmt::color::green, "[*]", msg);
    }

    auto console::warning(std::string_view msg) const -> void
    {
        print_line(err_, err_color_, fmt::color::yellow, "[?]", msg);
    }

    auto console::error(std::string_view msg) const -> void
    {
        print_line(err_, err_color_, fmt::color::red, "[!]", msg);
    }

    auto console::plain(std::string_view msg) const -> void
    {
        fmt::print(out_, "{}\n", msg);
    }

    auto console::detail(std::string_view msg) const -> void
    {
        fmt::print(err_, "{}\n", msg);
    }

    auto console::report_step(step_event const &event) const -> void
    {
        if (event.command == nullptr)
        {
            return;
        }

        switch (event.phase)
        {
        case step_phase::starting:
            status(fmt::format("[{}/{}] {}", event.index, event.total, *event.command));
            break;
        case step_phase::succeeded:
            break;
        case step_phase::tolerated_failure:
        {
            // e.g. "Error: Cannot delete qdisc with handle of zero." on an unshaped interface
            auto const reason = event.output != nullptr ? first_line(event.output->stderr_output) : std::string_view{};
            status(fmt::format("[{}/{}] ignored exit status {} ({})", event.index, event.total,
                               event.output != nullptr ? event.output->exit_code : -1,
                               reason.empty() ? std::string_view{"no output"} : reason));
            break;
        }
        case step_phase::failed:
            // the caller reports the error itself, with the full stderr
            break;
        }
    }

} // namespace netctl
