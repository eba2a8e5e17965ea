#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

#include "layoutof/layout_error.hpp"
#include "layoutof/types/type_kind.hpp"
#include "layoutof/utils/json.hpp"

namespace layoutof
{
    struct field_record
    {
        std::string name;
        std::optional<std::size_t> offset;
        std::optional<std::size_t> size;
        std::string type;
    };

    struct variant_record
    {
        std::string tag;
        std::size_t size = 0;
        std::vector<field_record> fields;
    };

    struct type_record
    {
        std::string name;
        type_kind kind = type_kind::primitive;
        std::size_t size = 0;
        std::size_t alignment = 1;
        std::vector<field_record> fields;
        std::vector<variant_record> variants;
    };

    struct type_database
    {
        std::map<std::string, type_record, std::less<>> types;
        std::map<std::string, std::string> aliases;
        std::map<std::string, std::string> variables;

        void add_type(type_record record)
        {
            std::string name = record.name;
            types.insert_or_assign(std::move(name), std::move(record));
        }

        void merge(type_database&& other)
        {
            for (auto& [name, record] : other.types)
            {
                types.insert_or_assign(name, std::move(record));
            }

            for (auto& [name, target] : other.aliases)
            {
                aliases.insert_or_assign(name, std::move(target));
            }

            for (auto& [name, type] : other.variables)
            {
                variables.insert_or_assign(name, std::move(type));
            }
        }

        const type_record* find_type(const std::string_view name) const
        {
            const auto it_type = types.find(name);
            return it_type != types.end() ? &it_type->second : nullptr;
        }

        bool empty() const
        {
            return types.empty() && aliases.empty() && variables.empty();
        }
    };

    inline void to_json(nlohmann::json& json, const type_kind value)
    {
        json = std::string(to_string(value));
    }

    inline void from_json(const nlohmann::json& json, type_kind& value)
    {
        const std::string& string = json.get_ref<const std::string&>();
        if (!from_string(string, value))
        {
            throw layout_error(layout_error_code::parsing, "unknown type kind \"{}\"", string);
        }
    }

    namespace detail
    {
        // Sizes and offsets are byte counts, a negative value would wrap around.
        inline std::size_t get_byte_count(const nlohmann::json& json, const std::string_view key, const std::string_view context)
        {
            const nlohmann::json& json_value = json[key];
            if (!json_value.is_number_unsigned())
            {
                throw layout_error(layout_error_code::parsing, "JSON property \"{}\" of {} must be a non-negative integer, value={}", key, context, json_value.dump());
            }

            return json_value.get<std::size_t>();
        }

        inline void get_byte_count_checked(const nlohmann::json& json, const std::string_view key, std::size_t& value, const std::string_view context)
        {
            if (!json.contains(key)) [[unlikely]]
            {
                throw layout_error(layout_error_code::parsing, "JSON property \"{}\" not found in {}", key, context);
            }

            value = get_byte_count(json, key, context);
        }
    }

    inline void from_json(const nlohmann::json& json, field_record& value)
    {
        json::get_checked(json, "name", value.name, "field");
        json::get_checked(json, "type", value.type, value.name);

        if (json.contains("offset") && !json["offset"].is_null())
        {
            value.offset = detail::get_byte_count(json, "offset", value.name);
        }

        if (json.contains("size"))
        {
            value.size = detail::get_byte_count(json, "size", value.name);
        }
    }

    inline void to_json(nlohmann::json& json, const field_record& value)
    {
        json["name"] = value.name;
        json["type"] = value.type;

        if (value.offset.has_value())
        {
            json["offset"] = value.offset.value();
        }

        if (value.size.has_value())
        {
            json["size"] = value.size.value();
        }
    }

    inline void from_json(const nlohmann::json& json, variant_record& value)
    {
        json::get_checked(json, "tag", value.tag, "variant");
        detail::get_byte_count_checked(json, "size", value.size, value.tag);
        json::get_opt(json, "fields", value.fields);
    }

    inline void to_json(nlohmann::json& json, const variant_record& value)
    {
        json["tag"] = value.tag;
        json["size"] = value.size;
        json["fields"] = value.fields;
    }

    inline void from_json(const nlohmann::json& json, type_record& value)
    {
        json::get_checked(json, "name", value.name, "type");
        json::get_checked(json, "kind", value.kind, value.name);
        detail::get_byte_count_checked(json, "size", value.size, value.name);

        if (json.contains("alignment"))
        {
            value.alignment = detail::get_byte_count(json, "alignment", value.name);
        }
        json::get_opt(json, "fields", value.fields);
        json::get_opt(json, "variants", value.variants);

        if (value.kind == type_kind::tagged_union && !value.fields.empty())
        {
            throw layout_error(layout_error_code::parsing, "tagged union cannot declare fields, type={}", value.name);
        }

        if (value.kind != type_kind::tagged_union && !value.variants.empty())
        {
            throw layout_error(layout_error_code::parsing, "only tagged unions can declare variants, type={}", value.name);
        }
    }

    inline void to_json(nlohmann::json& json, const type_record& value)
    {
        json["name"] = value.name;
        json["kind"] = value.kind;
        json["size"] = value.size;
        json["alignment"] = value.alignment;

        if (value.kind == type_kind::tagged_union)
        {
            json["variants"] = value.variants;
        }
        else if (is_composite(value.kind))
        {
            json["fields"] = value.fields;
        }
    }

    inline void from_json(const nlohmann::json& json, type_database& value)
    {
        std::int32_t version = 1;
        json::get(json, "version", version);

        switch (version)
        {
            case 1: {
                std::vector<type_record> types;
                json::get_opt(json, "types", types);

                for (type_record& type : types)
                {
                    value.add_type(std::move(type));
                }

                json::get_opt(json, "aliases", value.aliases);
                json::get_opt(json, "variables", value.variables);
                break;
            }

            default: {
                throw layout_error(layout_error_code::parsing, "unknown type database version {}", version);
            }
        }
    }

    inline void to_json(nlohmann::json& json, const type_database& value)
    {
        json["version"] = 1;
        json["types"] = nlohmann::json::array();

        for (const auto& [name, record] : value.types)
        {
            json["types"].emplace_back(record);
        }

        json["aliases"] = value.aliases;
        json["variables"] = value.variables;
    }
}
