#pragma once

#include <concepts>
#include <memory>
#include <vector>

#include "layoutof/adapters/type_adapter.hpp"

namespace layoutof
{
    struct type_adapter_composite final : type_adapter
    {
        std::vector<std::unique_ptr<type_adapter>> adapters;

        template <std::derived_from<type_adapter>... adapters_t>
        explicit type_adapter_composite(std::unique_ptr<adapters_t>&&... adapters_)
        {
            (adapters.emplace_back(std::move(adapters_)), ...);
        }

        void add_adapter(std::unique_ptr<type_adapter> adapter)
        {
            adapters.emplace_back(std::move(adapter));
        }

        [[nodiscard]] bool try_resolve(const std::string_view name, type_descriptor_ptr& type) const override
        {
            for (const std::unique_ptr<type_adapter>& adapter : adapters)
            {
                if (adapter->try_resolve(name, type))
                {
                    return true;
                }
            }

            return false;
        }
    };
}
