#pragma once

#include <algorithm>
#include <concepts>
#include <memory>
#include <vector>

#include "layoutof/renderers/layout_renderer.hpp"

namespace layoutof
{
    struct layout_renderer_composite final
    {
        std::vector<std::unique_ptr<layout_renderer>> renderers;

        template <std::derived_from<layout_renderer>... renderers_t>
        explicit layout_renderer_composite(std::unique_ptr<renderers_t>&&... renderers_)
        {
            (renderers.emplace_back(std::move(renderers_)), ...);
        }

        [[nodiscard]] bool can_render(const std::string_view format) const
        {
            return find_renderer(format) != nullptr;
        }

        [[nodiscard]] layout_renderer* find_renderer(const std::string_view format) const
        {
            const auto predicate = [&](const std::unique_ptr<layout_renderer>& renderer) {
                return renderer->can_render(format);
            };

            const auto it_renderer = std::ranges::find_if(renderers, predicate);
            return it_renderer != renderers.end() ? it_renderer->get() : nullptr;
        }
    };
}
