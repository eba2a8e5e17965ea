#include "layoutof/layout/layout_engine.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <span>
#include <vector>

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include "layoutof/layout_error.hpp"
#include "layoutof/utils/strings.hpp"

namespace layoutof
{
    layout_recursion::scope::scope(layout_recursion& recursion, const std::string& type_name)
        : recursion(recursion)
    {
        if (recursion.chain.size() >= recursion.max_depth)
        {
            throw layout_error(
                layout_error_code::recursion_limit,
                "recursion limit of {} exceeded, chain={} -> {}",
                recursion.max_depth, strings::join(" -> ", recursion.chain), type_name);
        }

        recursion.chain.emplace_back(type_name);
    }

    namespace detail
    {
        std::vector<const field_descriptor*> order_fields(const std::span<const field_descriptor> fields)
        {
            std::vector<const field_descriptor*> ordered;
            ordered.reserve(fields.size());

            for (const field_descriptor& field : fields)
            {
                if (!field.is_static())
                {
                    ordered.emplace_back(&field);
                }
            }

            const auto projection = [](const field_descriptor* field) { return field->offset.value(); };
            std::ranges::stable_sort(ordered, std::less<> {}, projection);

            return ordered;
        }

        struct layout_builder
        {
            layout_recursion& recursion;

            layout_tree build(const type_descriptor& type)
            {
                layout_recursion::scope scope {recursion, type.name};

                layout_tree tree;
                tree.type_name = type.name;
                tree.kind = type.kind;
                tree.total_size = type.size;

                switch (type.kind)
                {
                    case type_kind::struct_:
                    case type_kind::union_: {
                        build_fields(type.fields, type.size, tree);
                        break;
                    }

                    case type_kind::tagged_union: {
                        build_variants(type, tree);
                        break;
                    }

                    default: {
                        break;
                    }
                }

                // An empty struct still occupies one byte, but as a base class or member that
                // byte is shared with real data of the enclosing type.
                if (type.kind == type_kind::struct_ && type.size == 1 && tree.segments.size() == 1 && std::holds_alternative<padding_segment>(tree.segments.front()))
                {
                    tree.total_padding = 0;
                    tree.total_holes = 0;
                }

                return tree;
            }

            void build_fields(const std::span<const field_descriptor> fields, const std::size_t bound, layout_tree& tree)
            {
                std::size_t cursor = 0;

                for (const field_descriptor* field : order_fields(fields))
                {
                    const std::size_t offset = field->offset.value();

                    if (offset > cursor)
                    {
                        tree.segments.emplace_back(padding_segment {
                            .kind = padding_kind::hole,
                            .start = cursor,
                            .end = offset,
                        });

                        tree.total_padding += offset - cursor;
                        tree.total_holes += offset - cursor;
                    }

                    std::unique_ptr<layout_tree> child;

                    if (recursion.should_expand(*field))
                    {
                        child = std::make_unique<layout_tree>(build(*field->type));
                        tree.total_padding += child->total_padding;
                        tree.total_holes += child->total_holes;
                    }

                    tree.segments.emplace_back(field_segment {
                        .name = field->name,
                        .type_name = field->type_name,
                        .start = offset,
                        .end = offset + field->size,
                        .child = std::move(child),
                    });

                    cursor = std::max(cursor, offset + field->size);
                }

                if (cursor < bound)
                {
                    tree.segments.emplace_back(padding_segment {
                        .kind = padding_kind::trailing,
                        .start = cursor,
                        .end = bound,
                    });

                    tree.total_padding += bound - cursor;
                }
            }

            void build_variants(const type_descriptor& type, layout_tree& tree)
            {
                for (const variant_descriptor& variant : type.variants)
                {
                    auto variant_tree = std::make_unique<layout_tree>();
                    variant_tree->type_name = fmt::format("{}::{}", type.name, variant.tag_name);
                    variant_tree->kind = type_kind::struct_;
                    variant_tree->total_size = variant.size;

                    build_fields(variant.fields, variant.size, *variant_tree);

                    // Overcounts the union footprint, only one variant is live at a time.
                    tree.total_padding += variant_tree->total_padding;
                    tree.total_holes += variant_tree->total_holes;

                    tree.segments.emplace_back(variant_group_segment {
                        .tag_name = variant.tag_name,
                        .start = 0,
                        .end = variant.size,
                        .child = std::move(variant_tree),
                    });
                }
            }
        };
    }

    layout_tree layout_engine::compute_layout(const type_descriptor& type, const bool recursive) const
    {
        SPDLOG_DEBUG("computing layout, type={} kind={} recursive={}", type.name, to_string(type.kind), recursive);

        layout_recursion recursion {
            .recursive = recursive,
            .max_depth = max_depth,
        };

        detail::layout_builder builder {recursion};
        return builder.build(type);
    }
}
