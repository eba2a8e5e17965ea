#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "layoutof/types/type_kind.hpp"

namespace layoutof
{
    struct layout_tree;

    enum class padding_kind : std::uint8_t
    {
        hole,
        trailing,
    };

    struct field_segment
    {
        std::string name;
        std::string type_name;
        std::size_t start = 0;
        std::size_t end = 0;
        std::unique_ptr<layout_tree> child;

        std::size_t size() const
        {
            return end - start;
        }
    };

    struct padding_segment
    {
        padding_kind kind = padding_kind::hole;
        std::size_t start = 0;
        std::size_t end = 0;

        std::size_t size() const
        {
            return end - start;
        }
    };

    struct variant_group_segment
    {
        std::string tag_name;
        std::size_t start = 0;
        std::size_t end = 0;
        std::unique_ptr<layout_tree> child;

        std::size_t size() const
        {
            return end - start;
        }
    };

    using layout_segment =
        std::variant<
            field_segment,
            padding_segment,
            variant_group_segment>;

    struct layout_tree
    {
        std::string type_name;
        type_kind kind = type_kind::struct_;
        std::vector<layout_segment> segments;
        std::size_t total_size = 0;
        std::size_t total_padding = 0;
        std::size_t total_holes = 0;

        // Padding of each variant in adapter order, empty unless this is a tagged union.
        std::vector<std::size_t> variant_paddings() const
        {
            std::vector<std::size_t> paddings;
            for (const layout_segment& segment : segments)
            {
                if (const variant_group_segment* group = std::get_if<variant_group_segment>(&segment))
                {
                    paddings.emplace_back(group->child != nullptr ? group->child->total_padding : 0);
                }
            }

            return paddings;
        }
    };

    struct field_offset
    {
        std::string name;
        std::optional<std::size_t> offset;
    };

    inline std::size_t segment_start(const layout_segment& segment)
    {
        return std::visit([](const auto& value) { return value.start; }, segment);
    }

    inline std::size_t segment_end(const layout_segment& segment)
    {
        return std::visit([](const auto& value) { return value.end; }, segment);
    }
}
