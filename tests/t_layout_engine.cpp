#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include "catch2/catch_all.hpp"

#include "layoutof/layout/layout_engine.hpp"
#include "layoutof/layout/layout_offsets.hpp"

namespace layoutof::detail
{
    type_descriptor_ptr make_primitive(const std::string& name, const std::size_t size)
    {
        auto type = std::make_shared<type_descriptor>();
        type->name = name;
        type->kind = type_kind::primitive;
        type->size = size;
        type->alignment = size;
        return type;
    }

    field_descriptor make_field(const std::string& name, const std::size_t offset, const std::size_t size, type_ref type = {})
    {
        return field_descriptor {
            .name = name,
            .offset = offset,
            .size = size,
            .type_name = type.resolved() ? type->name : std::string {"u8"},
            .type = std::move(type),
        };
    }

    void check_padding_completeness(const layout_tree& tree)
    {
        std::size_t cursor = 0;
        std::size_t covered = 0;

        for (const layout_segment& segment : tree.segments)
        {
            if (std::holds_alternative<variant_group_segment>(segment))
            {
                continue;
            }

            CHECK(segment_start(segment) == cursor);
            cursor = segment_end(segment);
            covered += segment_end(segment) - segment_start(segment);
        }

        if (tree.kind == type_kind::struct_)
        {
            CHECK(covered == tree.total_size);
        }
    }
}

TEST_CASE("layoutof::layout_engine", "[layoutof][layoutof::layout_engine]")
{
    using namespace layoutof;

    const layout_engine engine;
    const type_descriptor_ptr u32 = detail::make_primitive("u32", 4);
    const type_descriptor_ptr u64 = detail::make_primitive("u64", 8);

    SECTION("fields without gaps have no padding")
    {
        type_descriptor type {.name = "fat", .kind = type_kind::struct_, .size = 32};
        type.fields.emplace_back(detail::make_field("a", 0, 16));
        type.fields.emplace_back(detail::make_field("b", 16, 16));

        const layout_tree tree = engine.compute_layout(type, false);

        REQUIRE(tree.segments.size() == 2);
        REQUIRE(std::get<field_segment>(tree.segments[0]).start == 0);
        REQUIRE(std::get<field_segment>(tree.segments[0]).end == 16);
        REQUIRE(std::get<field_segment>(tree.segments[1]).start == 16);
        REQUIRE(std::get<field_segment>(tree.segments[1]).end == 32);
        REQUIRE(tree.total_padding == 0);
        REQUIRE(tree.total_size == 32);
        detail::check_padding_completeness(tree);
    }

    SECTION("gap between fields is a hole")
    {
        type_descriptor type {.name = "gap", .kind = type_kind::struct_, .size = 24};
        type.fields.emplace_back(detail::make_field("x", 0, 4, u32));
        type.fields.emplace_back(detail::make_field("y", 16, 8, u64));

        const layout_tree tree = engine.compute_layout(type, false);

        REQUIRE(tree.segments.size() == 3);
        REQUIRE(std::get<field_segment>(tree.segments[0]).name == "x");

        const auto& hole = std::get<padding_segment>(tree.segments[1]);
        REQUIRE(hole.kind == padding_kind::hole);
        REQUIRE(hole.start == 4);
        REQUIRE(hole.end == 16);
        REQUIRE(hole.size() == 12);

        REQUIRE(std::get<field_segment>(tree.segments[2]).name == "y");
        REQUIRE(tree.total_padding == 12);
        REQUIRE(tree.total_holes == 12);
        detail::check_padding_completeness(tree);
    }

    SECTION("space after the last field is trailing padding")
    {
        type_descriptor type {.name = "tail", .kind = type_kind::struct_, .size = 16};
        type.fields.emplace_back(detail::make_field("x", 0, 4, u32));

        const layout_tree tree = engine.compute_layout(type, false);

        REQUIRE(tree.segments.size() == 2);

        const auto& padding = std::get<padding_segment>(tree.segments[1]);
        REQUIRE(padding.kind == padding_kind::trailing);
        REQUIRE(padding.start == 4);
        REQUIRE(padding.end == 16);
        REQUIRE(tree.total_padding == 12);
        REQUIRE(tree.total_holes == 0);
        detail::check_padding_completeness(tree);
    }

    SECTION("fields are laid out by offset, not declaration order")
    {
        type_descriptor type {.name = "reordered", .kind = type_kind::struct_, .size = 16};
        type.fields.emplace_back(detail::make_field("second", 8, 8, u64));
        type.fields.emplace_back(detail::make_field("first", 0, 4, u32));

        const layout_tree tree = engine.compute_layout(type, false);

        REQUIRE(tree.segments.size() == 3);
        REQUIRE(std::get<field_segment>(tree.segments[0]).name == "first");
        REQUIRE(std::holds_alternative<padding_segment>(tree.segments[1]));
        REQUIRE(std::get<field_segment>(tree.segments[2]).name == "second");
        detail::check_padding_completeness(tree);
    }

    SECTION("static members are skipped")
    {
        type_descriptor type {.name = "with_static", .kind = type_kind::struct_, .size = 4};
        type.fields.emplace_back(detail::make_field("x", 0, 4, u32));
        type.fields.emplace_back(field_descriptor {.name = "counter", .size = 4, .type_name = "u32", .type = u32});

        const layout_tree tree = engine.compute_layout(type, true);

        REQUIRE(tree.segments.size() == 1);
        REQUIRE(tree.total_padding == 0);
    }

    SECTION("union members overlap at offset 0")
    {
        type_descriptor type {.name = "either", .kind = type_kind::union_, .size = 8};
        type.fields.emplace_back(detail::make_field("small", 0, 4, u32));
        type.fields.emplace_back(detail::make_field("large", 0, 8, u64));

        const layout_tree tree = engine.compute_layout(type, false);

        REQUIRE(tree.segments.size() == 2);
        REQUIRE(std::get<field_segment>(tree.segments[0]).end == 4);
        REQUIRE(std::get<field_segment>(tree.segments[1]).end == 8);
        REQUIRE(tree.total_padding == 0);
    }

    SECTION("tagged union variants are laid out separately")
    {
        type_descriptor type {.name = "Option", .kind = type_kind::tagged_union, .size = 8};
        type.variants.emplace_back(variant_descriptor {.tag_name = "None", .size = 8});

        variant_descriptor some {.tag_name = "Some", .size = 8};
        some.fields.emplace_back(detail::make_field("__0", 0, 8, u64));
        type.variants.emplace_back(std::move(some));

        const layout_tree tree = engine.compute_layout(type, true);

        REQUIRE(tree.segments.size() == 2);

        const auto& none = std::get<variant_group_segment>(tree.segments[0]);
        REQUIRE(none.tag_name == "None");
        REQUIRE(none.start == 0);
        REQUIRE(none.end == 8);
        REQUIRE(none.child != nullptr);
        REQUIRE(none.child->type_name == "Option::None");
        REQUIRE(none.child->segments.size() == 1);
        REQUIRE(std::get<padding_segment>(none.child->segments[0]).kind == padding_kind::trailing);
        REQUIRE(std::get<padding_segment>(none.child->segments[0]).size() == 8);

        const auto& some_group = std::get<variant_group_segment>(tree.segments[1]);
        REQUIRE(some_group.tag_name == "Some");
        REQUIRE(some_group.end == 8);
        REQUIRE(some_group.child->total_padding == 0);

        REQUIRE(tree.total_padding == 8);
        REQUIRE(tree.variant_paddings() == std::vector<std::size_t> {8, 0});
    }

    SECTION("recursive layout expands nested composites and sums their padding")
    {
        auto inner = std::make_shared<type_descriptor>();
        inner->name = "inner";
        inner->kind = type_kind::struct_;
        inner->size = 16;
        inner->fields.emplace_back(detail::make_field("a", 0, 4, u32));
        inner->fields.emplace_back(detail::make_field("b", 8, 8, u64));

        auto pointer = std::make_shared<type_descriptor>();
        pointer->name = "inner*";
        pointer->kind = type_kind::pointer;
        pointer->size = 8;

        type_descriptor outer {.name = "outer", .kind = type_kind::struct_, .size = 40};
        outer.fields.emplace_back(detail::make_field("flag", 0, 4, u32));
        outer.fields.emplace_back(detail::make_field("nested", 8, 16, type_descriptor_ptr {inner}));
        outer.fields.emplace_back(detail::make_field("next", 24, 8, type_descriptor_ptr {pointer}));

        SECTION("non recursive")
        {
            const layout_tree tree = engine.compute_layout(outer, false);

            for (const layout_segment& segment : tree.segments)
            {
                if (const field_segment* field = std::get_if<field_segment>(&segment))
                {
                    REQUIRE(field->child == nullptr);
                }
            }

            REQUIRE(tree.total_padding == 4 + 8);
        }

        SECTION("recursive")
        {
            const layout_tree tree = engine.compute_layout(outer, true);

            const auto& nested = std::get<field_segment>(tree.segments[2]);
            REQUIRE(nested.name == "nested");
            REQUIRE(nested.child != nullptr);
            REQUIRE(nested.child->type_name == "inner");
            REQUIRE(nested.child->total_padding == 4);

            const auto& next = std::get<field_segment>(tree.segments[3]);
            REQUIRE(next.name == "next");
            REQUIRE(next.child == nullptr);

            REQUIRE(tree.total_padding == 4 + 4 + 8);
            REQUIRE(tree.total_holes == 4 + 4);
            detail::check_padding_completeness(tree);
        }
    }

    SECTION("non recursive layout never resolves field types")
    {
        std::size_t resolutions = 0;
        const type_ref::resolver_t resolver = [&] {
            ++resolutions;
            return u32;
        };

        type_descriptor type {.name = "lazy", .kind = type_kind::struct_, .size = 4};
        type.fields.emplace_back(field_descriptor {.name = "x", .offset = 0, .size = 4, .type_name = "u32", .type = resolver});

        const layout_tree first = engine.compute_layout(type, false);
        const layout_tree second = engine.compute_layout(type, false);

        REQUIRE(resolutions == 0);
        REQUIRE(first.segments.size() == second.segments.size());
        REQUIRE(first.total_padding == second.total_padding);
        REQUIRE(std::get<field_segment>(first.segments[0]).end == std::get<field_segment>(second.segments[0]).end);
    }

    SECTION("empty struct reports no padding")
    {
        const type_descriptor type {.name = "empty", .kind = type_kind::struct_, .size = 1};

        const layout_tree tree = engine.compute_layout(type, false);

        REQUIRE(tree.segments.size() == 1);
        REQUIRE(std::get<padding_segment>(tree.segments[0]).size() == 1);
        REQUIRE(tree.total_padding == 0);
    }

    SECTION("self referencing metadata hits the recursion limit")
    {
        auto cyclic = std::make_shared<type_descriptor>();
        cyclic->name = "cyclic";
        cyclic->kind = type_kind::struct_;
        cyclic->size = 8;

        const std::weak_ptr<type_descriptor> weak_cyclic = cyclic;
        const type_ref::resolver_t resolver = [weak_cyclic]() -> type_descriptor_ptr { return weak_cyclic.lock(); };
        cyclic->fields.emplace_back(field_descriptor {.name = "self", .offset = 0, .size = 8, .type_name = "cyclic", .type = resolver});

        const layout_engine limited_engine {.max_depth = 8};

        REQUIRE_NOTHROW(limited_engine.compute_layout(*cyclic, false));

        try
        {
            std::ignore = limited_engine.compute_layout(*cyclic, true);
            FAIL("expected recursion limit error");
        }
        catch (const layout_error& e)
        {
            REQUIRE(e.error_code == layout_error_code::recursion_limit);
            REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("recursion limit of 8 exceeded"));
            REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("chain=cyclic -> cyclic"));
        }
    }
}

TEST_CASE("layoutof::compute_offsets", "[layoutof][layoutof::compute_offsets]")
{
    using namespace layoutof;

    const type_descriptor_ptr u32 = detail::make_primitive("u32", 4);

    type_descriptor type {.name = "mixed", .kind = type_kind::struct_, .size = 24};
    type.fields.emplace_back(detail::make_field("y", 16, 8));
    type.fields.emplace_back(detail::make_field("x", 0, 4, u32));
    type.fields.emplace_back(field_descriptor {.name = "instances", .size = 4, .type_name = "u32", .type = u32});

    const std::vector<field_offset> offsets = compute_offsets(type);

    SECTION("offsets keep declaration order and statics")
    {
        REQUIRE(offsets.size() == 3);
        REQUIRE(offsets[0].name == "y");
        REQUIRE(offsets[0].offset == 16);
        REQUIRE(offsets[1].name == "x");
        REQUIRE(offsets[1].offset == 0);
        REQUIRE(offsets[2].name == "instances");
        REQUIRE_FALSE(offsets[2].offset.has_value());
    }

    SECTION("offsets agree with the layout")
    {
        const layout_tree tree = layout_engine {}.compute_layout(type, false);

        for (const field_offset& offset : offsets)
        {
            if (!offset.offset.has_value())
            {
                continue;
            }

            const auto predicate = [&](const layout_segment& segment) {
                const field_segment* field = std::get_if<field_segment>(&segment);
                return field != nullptr && field->name == offset.name && field->start == offset.offset.value();
            };

            REQUIRE(std::ranges::any_of(tree.segments, predicate));
        }
    }

    SECTION("tagged union offsets agree with the variant groups")
    {
        type_descriptor option {.name = "Option", .kind = type_kind::tagged_union, .size = 8};
        option.variants.emplace_back(variant_descriptor {.tag_name = "None", .size = 8});

        variant_descriptor some {.tag_name = "Some", .size = 8};
        some.fields.emplace_back(detail::make_field("__0", 0, 8));
        option.variants.emplace_back(std::move(some));

        const std::vector<field_offset> variant_offsets = compute_offsets(option);
        const layout_tree tree = layout_engine {}.compute_layout(option, false);

        REQUIRE(variant_offsets.size() == 2);
        REQUIRE(variant_offsets.size() == tree.segments.size());

        for (std::size_t index = 0; index < variant_offsets.size(); ++index)
        {
            const auto& group = std::get<variant_group_segment>(tree.segments[index]);
            REQUIRE(variant_offsets[index].name == group.tag_name);
            REQUIRE(variant_offsets[index].offset == group.start);
        }

        REQUIRE(variant_offsets[0].name == "None");
        REQUIRE(variant_offsets[1].name == "Some");
    }
}
