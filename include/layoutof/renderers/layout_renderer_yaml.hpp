#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"

#include "layoutof/layout/layout_converter_json.hpp"
#include "layoutof/renderers/layout_renderer.hpp"
#include "layoutof/utils/yaml.hpp"

namespace layoutof
{
    struct layout_renderer_yaml final : layout_renderer
    {
        std::size_t indent = 2;

        [[nodiscard]] bool can_render(const std::string_view format) const override
        {
            return format == "yaml" || format == "yml";
        }

        [[nodiscard]] bool render_layout(const layout_result& result, std::string& output) override
        {
            output = yaml::to_yaml(nlohmann::json(result), indent);
            output += '\n';
            return true;
        }

        [[nodiscard]] bool render_offsets(const offsets_result& result, std::string& output) override
        {
            output = yaml::to_yaml(nlohmann::json(result), indent);
            output += '\n';
            return true;
        }
    };
}
