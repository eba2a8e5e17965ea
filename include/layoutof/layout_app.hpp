#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "layoutof/adapters/type_adapter_composite.hpp"
#include "layoutof/layout/layout_engine.hpp"
#include "layoutof/layout_config.hpp"
#include "layoutof/layout_options.hpp"
#include "layoutof/renderers/layout_renderer_composite.hpp"

namespace layoutof
{
    struct layout_app
    {
        layout_config config;
        type_adapter_composite adapter;
        layout_renderer_composite renderers;
        layout_engine engine;

        explicit layout_app(const layout_options& options);
        layout_app(layout_config in_config, std::unique_ptr<type_adapter> in_adapter);

        void layout_of(std::string_view type_name, bool recursive, std::ostream& out) const;
        void offsets_of(std::string_view type_name, std::ostream& out) const;

      private:
        layout_renderer* renderer = nullptr;

        void init_renderers();
        void load_types();
    };

    // The requested name, followed by the resolved name when they differ.
    std::string make_display_name(std::string_view requested_name, const type_descriptor& type);
}
