#pragma once

#include <map>
#include <string_view>
#include <variant>

#include "nlohmann/json.hpp"

#include "layoutof/layout/layout_tree.hpp"
#include "layoutof/renderers/layout_renderer.hpp"
#include "layoutof/types/type_database.hpp"

namespace layoutof
{
    void to_json(nlohmann::json& json, const layout_tree& value);

    template <typename... args_t>
    void to_json(nlohmann::json& json, const std::variant<args_t...>& variant)
    {
        const auto visitor = [&](const auto& value) { json = value; };
        std::visit(visitor, variant);
    }

    inline void to_json(nlohmann::json& json, const padding_kind value)
    {
        static const std::map<padding_kind, std::string_view> value_map {
            {padding_kind::hole, "hole"},
            {padding_kind::trailing, "trailing"},
        };

        const auto it_value = value_map.find(value);
        if (it_value != value_map.end())
        {
            json = it_value->second;
        }
    }

    inline void to_json(nlohmann::json& json, const field_segment& value)
    {
        json["segment"] = "field";
        json["name"] = value.name;
        json["type"] = value.type_name;
        json["start"] = value.start;
        json["end"] = value.end;

        if (value.child != nullptr)
        {
            json["layout"] = *value.child;
        }
    }

    inline void to_json(nlohmann::json& json, const padding_segment& value)
    {
        json["segment"] = "padding";
        json["kind"] = value.kind;
        json["start"] = value.start;
        json["end"] = value.end;
        json["size"] = value.size();
    }

    inline void to_json(nlohmann::json& json, const variant_group_segment& value)
    {
        json["segment"] = "variant";
        json["tag"] = value.tag_name;
        json["start"] = value.start;
        json["end"] = value.end;

        if (value.child != nullptr)
        {
            json["layout"] = *value.child;
        }
    }

    inline void to_json(nlohmann::json& json, const layout_tree& value)
    {
        json["type"] = value.type_name;
        json["kind"] = value.kind;
        json["total_size"] = value.total_size;
        json["total_padding"] = value.total_padding;
        json["total_holes"] = value.total_holes;
        json["segments"] = nlohmann::json::array();

        for (const layout_segment& segment : value.segments)
        {
            json["segments"].emplace_back(segment);
        }

        if (value.kind == type_kind::tagged_union)
        {
            json["variant_paddings"] = value.variant_paddings();
        }
    }

    inline void to_json(nlohmann::json& json, const field_offset& value)
    {
        json["name"] = value.name;
        json["offset"] = value.offset.has_value() ? nlohmann::json(value.offset.value()) : nlohmann::json(nullptr);
    }

    inline void to_json(nlohmann::json& json, const layout_result& value)
    {
        json["name"] = value.display_name;
        json["recursive"] = value.recursive;
        json["layout"] = value.tree;
    }

    inline void to_json(nlohmann::json& json, const offsets_result& value)
    {
        json["name"] = value.display_name;
        json["type"] = value.type_name;
        json["offsets"] = value.offsets;
    }
}
