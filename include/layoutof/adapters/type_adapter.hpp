#pragma once

#include <string_view>

#include "layoutof/layout_error.hpp"
#include "layoutof/types/type_descriptor.hpp"

namespace layoutof
{
    struct type_adapter
    {
        virtual ~type_adapter() = default;
        [[nodiscard]] virtual bool try_resolve(std::string_view name, type_descriptor_ptr& type) const = 0;
    };

    inline type_descriptor_ptr resolve(const type_adapter& adapter, const std::string_view name)
    {
        type_descriptor_ptr type;
        if (!adapter.try_resolve(name, type))
        {
            throw layout_error(layout_error_code::unresolved_type, "could not resolve \"{}\" as a type", name);
        }

        return type;
    }
}
