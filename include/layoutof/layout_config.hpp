#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "layoutof/layout/layout_recursion.hpp"
#include "layoutof/layout_error.hpp"
#include "layoutof/utils/json.hpp"

namespace layoutof
{
    struct layout_config
    {
        std::vector<std::string> types;
        std::vector<std::string> sources;
        std::vector<std::string> args;
        std::size_t max_depth = layout_recursion::default_max_depth;
        std::string format = "text";
        bool color = true;
        bool debug = false;
    };

    inline void from_json(const nlohmann::json& json, layout_config& value)
    {
        std::int32_t version = 1;
        json::get(json, "version", version);

        switch (version)
        {
            case 1: {
                json::get_strings(json, "types", value.types);
                json::get_strings(json, "sources", value.sources);
                json::get_strings(json, "args", value.args);
                json::get_opt(json, "max_depth", value.max_depth, layout_recursion::default_max_depth);
                json::get_opt(json, "format", value.format, std::string {"text"});
                json::get_opt(json, "color", value.color, true);
                json::get_opt(json, "debug", value.debug, false);
                break;
            }

            default: {
                throw layout_error(layout_error_code::configuring, "unknown configuration version {}", version);
            }
        }

        if (value.max_depth == 0)
        {
            throw layout_error(layout_error_code::configuring, "max_depth must be at least 1");
        }
    }
}
