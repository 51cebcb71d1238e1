#pragma once

// console.hpp - status, warning and error lines
// [*] status on stdout, [?] warnings and [!] errors on stderr

#include "dispatcher.hpp"

#include <cstdio>
#include <string_view>

namespace netctl
{

    class console
    {
    public:
        // colour only when the stream is a terminal
        explicit console(bool quiet = false) noexcept;
        console(bool quiet, std::FILE *out, std::FILE *err, bool use_color) noexcept;

        auto status(std::string_view msg) const -> void;
        auto warning(std::string_view msg) const -> void;
        auto error(std::string_view msg) const -> void;

        // plain line on stdout, printed even when quiet (dry-run output, help)
        auto plain(std::string_view msg) const -> void;

        // plain line on stderr, no prefix
        auto detail(std::string_view msg) const -> void;

        // adapter for dispatcher::set_observer
        auto report_step(step_event const &event) const -> void;

        [[nodiscard]] auto quiet() const noexcept -> bool { return quiet_; }
        auto set_quiet(bool const quiet) noexcept -> void { quiet_ = quiet; }

    private:
        bool quiet_{false};
        std::FILE *out_{stdout};
        std::FILE *err_{stderr};
        bool out_color_{false};
        bool err_color_{false};
    };

} // namespace netctl
