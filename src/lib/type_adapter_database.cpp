#include "layoutof/adapters/type_adapter_database.hpp"

#include <memory>
#include <string>
#include <string_view>

#include "spdlog/spdlog.h"

namespace layoutof
{
    namespace detail
    {
        constexpr std::size_t max_alias_hops = 32;

        bool is_indirection(const std::string_view type_name)
        {
            return type_name.ends_with('*') || type_name.ends_with('&');
        }

        type_descriptor_ptr make_opaque_descriptor(const std::string& type_name, const std::size_t size)
        {
            auto type = std::make_shared<type_descriptor>();
            type->name = type_name;
            type->kind = is_indirection(type_name) ? type_kind::pointer : type_kind::primitive;
            type->size = size;
            type->alignment = 1;
            return type;
        }
    }

    bool type_adapter_database::try_resolve(const std::string_view name, type_descriptor_ptr& type) const
    {
        const type_record* record = find_record(name);

        if (record == nullptr)
        {
            const auto it_variable = database->variables.find(std::string(name));
            if (it_variable != database->variables.end())
            {
                SPDLOG_DEBUG("resolving type of variable, variable={} type={}", name, it_variable->second);
                record = find_record(it_variable->second);
            }
        }

        if (record == nullptr)
        {
            SPDLOG_DEBUG("type not found in database, name={}", name);
            return false;
        }

        type = make_descriptor(*record);
        return true;
    }

    bool type_adapter_database::try_resolve_type(const std::string_view name, type_descriptor_ptr& type) const
    {
        const type_record* record = find_record(name);
        if (record == nullptr)
        {
            return false;
        }

        type = make_descriptor(*record);
        return true;
    }

    const type_record* type_adapter_database::find_record(const std::string_view name) const
    {
        std::string current {name};

        for (std::size_t hop = 0; hop < detail::max_alias_hops; ++hop)
        {
            if (const type_record* record = database->find_type(current))
            {
                return record;
            }

            const auto it_alias = database->aliases.find(current);
            if (it_alias == database->aliases.end())
            {
                return nullptr;
            }

            SPDLOG_DEBUG("following alias, name={} target={}", current, it_alias->second);
            current = it_alias->second;
        }

        SPDLOG_WARN("alias chain is too long, name={}", name);
        return nullptr;
    }

    type_descriptor_ptr type_adapter_database::make_descriptor(const type_record& record) const
    {
        auto type = std::make_shared<type_descriptor>();
        type->name = record.name;
        type->kind = record.kind;
        type->size = record.size;
        type->alignment = record.alignment;

        type->fields.reserve(record.fields.size());
        for (const field_record& field : record.fields)
        {
            type->fields.emplace_back(make_field(field, record.name));
        }

        type->variants.reserve(record.variants.size());
        for (const variant_record& variant : record.variants)
        {
            variant_descriptor& descriptor = type->variants.emplace_back();
            descriptor.tag_name = variant.tag;
            descriptor.size = variant.size;

            for (const field_record& field : variant.fields)
            {
                descriptor.fields.emplace_back(make_field(field, record.name));
            }
        }

        return type;
    }

    field_descriptor type_adapter_database::make_field(const field_record& record, const std::string_view context) const
    {
        field_descriptor field;
        field.name = record.name;
        field.offset = record.offset;
        field.type_name = record.type;

        if (record.size.has_value())
        {
            field.size = record.size.value();
        }
        else if (const type_record* field_type = find_record(record.type))
        {
            field.size = field_type->size;
        }
        else
        {
            SPDLOG_WARN("field has neither a size nor a known type, type={} field={} field_type={}", context, record.name, record.type);
        }

        field.type = type_ref::resolver_t {
            [adapter = *this, type_name = record.type, size = field.size]() -> type_descriptor_ptr {
                type_descriptor_ptr type;
                if (adapter.try_resolve_type(type_name, type))
                {
                    return type;
                }

                SPDLOG_DEBUG("unknown field type treated as opaque, type={} size={}", type_name, size);
                return detail::make_opaque_descriptor(type_name, size);
            },
        };

        return field;
    }
}
