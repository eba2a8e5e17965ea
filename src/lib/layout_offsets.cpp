#include "layoutof/layout/layout_offsets.hpp"

#include "spdlog/spdlog.h"

namespace layoutof
{
    std::vector<field_offset> compute_offsets(const type_descriptor& type)
    {
        SPDLOG_DEBUG("computing offsets, type={} fields={} variants={}", type.name, type.fields.size(), type.variants.size());

        std::vector<field_offset> offsets;

        // Every variant of a tagged union starts at the union's first byte.
        if (type.kind == type_kind::tagged_union)
        {
            offsets.reserve(type.variants.size());

            for (const variant_descriptor& variant : type.variants)
            {
                offsets.emplace_back(field_offset {
                    .name = variant.tag_name,
                    .offset = 0,
                });
            }

            return offsets;
        }

        offsets.reserve(type.fields.size());

        for (const field_descriptor& field : type.fields)
        {
            offsets.emplace_back(field_offset {
                .name = field.name,
                .offset = field.offset,
            });
        }

        return offsets;
    }
}
