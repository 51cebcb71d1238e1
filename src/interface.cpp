// interface.cpp - network interface name checks

#include "netctl/interface.hpp"

#include <algorithm>
#include <net/if.h>
#include <string>

namespace netctl
{

    auto is_valid_interface_name(std::string_view name) noexcept -> bool
    {
        if (name.empty() || name.size() >= constants::max_interface_name)
        {
            return false;
        }

        if (name == "." || name == "..")
        {
            return false;
        }

        // ':' is reserved for legacy ip aliases, '/' would escape /sys/class/net
        return std::none_of(name.begin(), name.end(),
                            [](char const c)
                            { return c == '/' || c == ':' || c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
                                     c == '\v' || c == '\f'; });
    }

    auto validate_interface_name(std::string_view name) noexcept -> void_result
    {
        if (name.empty())
        {
            return std::unexpected{error_code::empty_value};
        }
        if (!is_valid_interface_name(name))
        {
            return std::unexpected{error_code::invalid_interface_name};
        }
        return {};
    }

    auto interface_exists(std::string_view name) noexcept -> bool
    {
        if (!is_valid_interface_name(name))
        {
            return false;
        }

        std::string const terminated{name};
        return ::if_nametoindex(terminated.c_str()) != 0;
    }

} // namespace netctl
