#pragma once

#include <cstdint>
#include <string_view>

namespace layoutof
{
    enum class type_kind : std::uint8_t
    {
        primitive,
        pointer,
        struct_,
        union_,
        tagged_union,
    };

    constexpr bool is_composite(const type_kind kind)
    {
        return kind == type_kind::struct_ || kind == type_kind::union_ || kind == type_kind::tagged_union;
    }

    constexpr std::string_view to_string(const type_kind kind)
    {
        switch (kind)
        {
            case type_kind::primitive:
                return "primitive";
            case type_kind::pointer:
                return "pointer";
            case type_kind::struct_:
                return "struct";
            case type_kind::union_:
                return "union";
            case type_kind::tagged_union:
                return "tagged_union";
        }

        return "primitive";
    }

    constexpr bool from_string(const std::string_view value, type_kind& kind)
    {
        constexpr type_kind kinds[] {
            type_kind::primitive,
            type_kind::pointer,
            type_kind::struct_,
            type_kind::union_,
            type_kind::tagged_union,
        };

        for (const type_kind candidate : kinds)
        {
            if (to_string(candidate) == value)
            {
                kind = candidate;
                return true;
            }
        }

        // enum is accepted as the usual spelling of a tagged union
        if (value == "enum")
        {
            kind = type_kind::tagged_union;
            return true;
        }

        return false;
    }
}
