#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "layoutof/renderers/layout_renderer.hpp"

namespace layoutof
{
    struct layout_renderer_text final : layout_renderer
    {
        bool color = true;

        explicit layout_renderer_text(const bool color = true)
            : color(color)
        {
        }

        [[nodiscard]] bool can_render(const std::string_view format) const override
        {
            return format == "text";
        }

        [[nodiscard]] bool render_layout(const layout_result& result, std::string& output) override;
        [[nodiscard]] bool render_offsets(const offsets_result& result, std::string& output) override;

      private:
        void render_tree(const layout_tree& tree, std::string_view header, std::size_t depth, std::string& output) const;
    };
}
