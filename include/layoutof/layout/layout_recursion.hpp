#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "layoutof/types/type_descriptor.hpp"

namespace layoutof
{
    struct layout_recursion
    {
        static constexpr std::size_t default_max_depth = 64;

        bool recursive = false;
        std::size_t max_depth = default_max_depth;
        std::vector<std::string> chain;

        // Pointers never expand, their pointee is not inline storage.
        bool should_expand(const field_descriptor& field) const
        {
            return recursive && field.type.valid() && field.type->composite();
        }

        struct scope
        {
            layout_recursion& recursion;

            scope(layout_recursion& recursion, const std::string& type_name);

            ~scope()
            {
                recursion.chain.pop_back();
            }

            scope(const scope&) = delete;
            scope(scope&&) = delete;

            scope& operator=(const scope&) = delete;
            scope& operator=(scope&&) = delete;
        };
    };
}
