#pragma once

// interface.hpp - network interface name checks
// tc and ip take interface names as opaque strings, so we check them up front

#include "common.hpp"

#include <string_view>

namespace netctl {

// ============================================================================
// interface name rules - mirrors the kernel's dev_valid_name()
// ============================================================================

// non-empty, shorter than IFNAMSIZ, not "." or "..", no '/', ':' or whitespace
[[nodiscard]] auto is_valid_interface_name(std::string_view name) noexcept -> bool;

// check name and map failure to the error the parser reports
[[nodiscard]] auto validate_interface_name(std::string_view name) noexcept -> void_result;

// check if interface exists on this host
[[nodiscard]] auto interface_exists(std::string_view name) noexcept -> bool;

} // namespace netctl
