#pragma once

#include <vector>

#include "layoutof/layout/layout_tree.hpp"
#include "layoutof/types/type_descriptor.hpp"

namespace layoutof
{
    // Top level fields in declared order, static members included without an offset.
    [[nodiscard]] std::vector<field_offset> compute_offsets(const type_descriptor& type);
}
