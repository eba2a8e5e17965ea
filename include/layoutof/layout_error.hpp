#pragma once

#include <stdexcept>
#include <utility>

#include "fmt/format.h"

namespace layoutof
{
    enum class layout_error_code
    {
        none,
        unknown,
        invalid,
        io,
        configuring,
        parsing,
        unresolved_type,
        recursion_limit,
    };

    struct layout_error final : std::runtime_error
    {
        layout_error_code error_code;

        template <typename... args_t>
        layout_error(const layout_error_code error_code, const fmt::format_string<args_t...> format, args_t&&... args)
            : std::runtime_error(fmt::format(format, std::forward<args_t>(args)...)),
              error_code(error_code)
        {
        }
    };
}
