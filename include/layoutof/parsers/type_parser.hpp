#pragma once

#include <string>
#include <vector>

#include "layoutof/types/type_database.hpp"

namespace layoutof
{
    struct type_parser
    {
        virtual ~type_parser() = default;
        [[nodiscard]] virtual bool parse_types(const std::vector<std::string>& paths, type_database& database) = 0;
    };
}
