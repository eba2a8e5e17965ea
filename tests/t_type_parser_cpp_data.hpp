#pragma once

#include <cstdint>

namespace _layout
{
    struct _empty
    {
    };

    struct _padded
    {
        char c;
        std::int64_t i;
        std::int16_t s;
    };

    struct _derived : _padded
    {
        std::int32_t extra;
        static std::int32_t instances;
    };

    union _either
    {
        std::int32_t small;
        double large;
    };

    struct _flags
    {
        std::uint32_t a : 3;
        std::uint32_t b : 7;
    };

    struct _node
    {
        _node* next;
        _padded value;
    };

    using _padded_t = _padded;

    inline _node _root {};
}
