#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "layoutof/layout_error.hpp"
#include "layoutof/types/type_kind.hpp"

namespace layoutof
{
    struct type_descriptor;

    using type_descriptor_ptr = std::shared_ptr<const type_descriptor>;

    // Reference to a field's type, resolved on first access and memoized afterwards.
    struct type_ref
    {
        using resolver_t = std::function<type_descriptor_ptr()>;

        type_ref() = default;

        type_ref(type_descriptor_ptr type)
            : _variant(std::move(type))
        {
        }

        type_ref(resolver_t resolver)
            : _variant(std::move(resolver))
        {
        }

        bool valid() const
        {
            return !std::holds_alternative<std::monostate>(_variant);
        }

        bool resolved() const
        {
            return std::holds_alternative<type_descriptor_ptr>(_variant);
        }

        const type_descriptor& get() const
        {
            if (!valid()) [[unlikely]]
            {
                throw layout_error(layout_error_code::invalid, "invalid type reference");
            }

            if (std::holds_alternative<resolver_t>(_variant))
            {
                const resolver_t resolver = std::get<resolver_t>(_variant);
                type_descriptor_ptr type = resolver();

                if (type == nullptr) [[unlikely]]
                {
                    throw layout_error(layout_error_code::invalid, "type reference resolved to nothing");
                }

                _variant = std::move(type);
            }

            return *std::get<type_descriptor_ptr>(_variant);
        }

        const type_descriptor* operator->() const
        {
            return &get();
        }

        const type_descriptor& operator*() const
        {
            return get();
        }

      private:
        mutable std::variant<std::monostate, resolver_t, type_descriptor_ptr> _variant;
    };

    struct field_descriptor
    {
        std::string name;
        std::optional<std::size_t> offset;
        std::size_t size = 0;
        std::string type_name;
        type_ref type;

        bool is_static() const
        {
            return !offset.has_value();
        }
    };

    struct variant_descriptor
    {
        std::string tag_name;
        std::vector<field_descriptor> fields;
        std::size_t size = 0;
    };

    struct type_descriptor
    {
        std::string name;
        type_kind kind = type_kind::primitive;
        std::size_t size = 0;
        std::size_t alignment = 1;
        std::vector<field_descriptor> fields;
        std::vector<variant_descriptor> variants;

        bool composite() const
        {
            return is_composite(kind);
        }
    };
}
