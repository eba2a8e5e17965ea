#pragma once

#include <cstddef>

#include "layoutof/layout/layout_recursion.hpp"
#include "layoutof/layout/layout_tree.hpp"
#include "layoutof/types/type_descriptor.hpp"

namespace layoutof
{
    struct layout_engine
    {
        std::size_t max_depth = layout_recursion::default_max_depth;

        [[nodiscard]] layout_tree compute_layout(const type_descriptor& type, bool recursive) const;
    };
}
