#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "layoutof/layout/layout_tree.hpp"

namespace layoutof
{
    struct layout_result
    {
        std::string display_name;
        layout_tree tree;
        bool recursive = false;
    };

    struct offsets_result
    {
        std::string display_name;
        std::string type_name;
        std::vector<field_offset> offsets;
    };

    struct layout_renderer
    {
        virtual ~layout_renderer() = default;
        [[nodiscard]] virtual bool can_render(std::string_view format) const = 0;
        [[nodiscard]] virtual bool render_layout(const layout_result& result, std::string& output) = 0;
        [[nodiscard]] virtual bool render_offsets(const offsets_result& result, std::string& output) = 0;
    };
}
