#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace layoutof
{
    struct layout_options
    {
        std::string config;
        std::vector<std::string> types;
        std::vector<std::string> sources;
        std::vector<std::string> args;
        std::optional<std::string> format;
        std::optional<std::size_t> max_depth;
        bool config_required : 1 = false;
        bool no_color : 1 = false;
        bool debug : 1 = false;
    };
}
