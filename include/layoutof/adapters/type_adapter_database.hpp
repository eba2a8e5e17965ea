#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "layoutof/adapters/type_adapter.hpp"
#include "layoutof/types/type_database.hpp"

namespace layoutof
{
    // Builds type descriptors from a type database. Field types are resolved lazily against
    // the same database; a field type the database does not know is treated as an opaque
    // leaf of the field's size, a pointer when its name ends with '*' or '&'.
    struct type_adapter_database final : type_adapter
    {
        std::shared_ptr<const type_database> database;

        explicit type_adapter_database(std::shared_ptr<const type_database> database)
            : database(std::move(database))
        {
        }

        [[nodiscard]] bool try_resolve(std::string_view name, type_descriptor_ptr& type) const override;

        // Types and aliases only, variable names are not type names.
        [[nodiscard]] bool try_resolve_type(std::string_view name, type_descriptor_ptr& type) const;

      private:
        const type_record* find_record(std::string_view name) const;
        type_descriptor_ptr make_descriptor(const type_record& record) const;
        field_descriptor make_field(const field_record& record, std::string_view context) const;
    };
}
