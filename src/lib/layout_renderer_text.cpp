#include "layoutof/renderers/layout_renderer_text.hpp"

#include <array>
#include <iterator>
#include <string>
#include <string_view>

#include "fmt/color.h"
#include "fmt/format.h"

namespace layoutof
{
    namespace detail
    {
        constexpr std::string_view indentation = "   ";

        // Colors of nested braces, cycled by depth.
        const std::array<fmt::text_style, 7> nesting_styles {
            fmt::emphasis::bold,
            fmt::emphasis::bold | fmt::fg(fmt::terminal_color::red),
            fmt::emphasis::bold | fmt::fg(fmt::terminal_color::green),
            fmt::emphasis::bold | fmt::fg(fmt::terminal_color::blue),
            fmt::emphasis::bold | fmt::fg(fmt::terminal_color::cyan),
            fmt::emphasis::bold | fmt::fg(fmt::terminal_color::magenta),
            fmt::emphasis::bold | fmt::fg(fmt::terminal_color::yellow),
        };

        std::string paint(const bool color, const fmt::text_style& style, const std::string_view text)
        {
            return color ? fmt::format(style, "{}", text) : std::string(text);
        }

        void append_line(std::string& output, const std::size_t depth, const std::string_view text)
        {
            for (std::size_t index = 0; index < depth; ++index)
            {
                output += indentation;
            }

            output += text;
            output += '\n';
        }

        std::string make_range(const std::string_view name, const std::size_t start, const std::size_t end)
        {
            return fmt::format("{} => {} - {}", name, start, end);
        }
    }

    bool layout_renderer_text::render_layout(const layout_result& result, std::string& output)
    {
        render_tree(result.tree, result.display_name, 0, output);

        const fmt::text_style red = fmt::fg(fmt::terminal_color::red);
        const fmt::text_style green = fmt::fg(fmt::terminal_color::green);

        if (result.recursive && result.tree.total_holes > 0)
        {
            detail::append_line(output, 0, detail::paint(color, red, fmt::format("Total hole size: {}", result.tree.total_holes)));
        }

        if (result.recursive && result.tree.total_padding > 0)
        {
            detail::append_line(output, 0, detail::paint(color, red, fmt::format("Total padding size: {}", result.tree.total_padding)));
        }

        detail::append_line(output, 0, detail::paint(color, green, fmt::format("Total size: {}", result.tree.total_size)));
        return true;
    }

    bool layout_renderer_text::render_offsets(const offsets_result& result, std::string& output)
    {
        output += fmt::format("{} {{\n", result.display_name);

        for (const field_offset& offset : result.offsets)
        {
            if (offset.offset.has_value())
            {
                output += fmt::format("    {} => {}\n", offset.name, offset.offset.value());
            }
            else
            {
                output += fmt::format("    {} => ? (static member?)\n", offset.name);
            }
        }

        output += "}\n";
        return true;
    }

    void layout_renderer_text::render_tree(const layout_tree& tree, const std::string_view header, const std::size_t depth, std::string& output) const
    {
        const fmt::text_style& brace_style = detail::nesting_styles[depth % detail::nesting_styles.size()];
        const fmt::text_style red = fmt::fg(fmt::terminal_color::red);

        detail::append_line(output, depth, fmt::format("{}{}", header, detail::paint(color, brace_style, " {")));

        for (const layout_segment& segment : tree.segments)
        {
            if (const field_segment* field = std::get_if<field_segment>(&segment))
            {
                const std::string range = detail::make_range(field->name, field->start, field->end);

                if (field->child != nullptr)
                {
                    render_tree(*field->child, fmt::format("{} ({})", range, field->child->type_name), depth + 1, output);
                }
                else
                {
                    detail::append_line(output, depth + 1, range);
                }
            }
            else if (const padding_segment* padding = std::get_if<padding_segment>(&segment))
            {
                const std::string_view label = padding->kind == padding_kind::hole ? "Hole" : "Padding";
                const std::string marker = fmt::format("--- {}: {} bytes ---", label, padding->size());

                output += '\n';
                detail::append_line(output, depth + 1, detail::paint(color, red, marker));
                output += '\n';
            }
            else if (const variant_group_segment* group = std::get_if<variant_group_segment>(&segment))
            {
                const std::string range = detail::make_range(group->tag_name, group->start, group->end);

                if (group->child != nullptr)
                {
                    render_tree(*group->child, fmt::format("{} ({})", range, group->child->type_name), depth + 1, output);
                }
                else
                {
                    detail::append_line(output, depth + 1, range);
                }
            }
        }

        detail::append_line(output, depth, detail::paint(color, brace_style, "}"));
    }
}
