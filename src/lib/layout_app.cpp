#include "layoutof/layout_app.hpp"

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "fmt/format.h"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "layoutof/adapters/type_adapter_database.hpp"
#include "layoutof/layout/layout_offsets.hpp"
#include "layoutof/layout_error.hpp"
#include "layoutof/layout_version.hpp"
#include "layoutof/parsers/type_parser_json.hpp"
#include "layoutof/renderers/layout_renderer_json.hpp"
#include "layoutof/renderers/layout_renderer_text.hpp"
#include "layoutof/renderers/layout_renderer_yaml.hpp"
#include "layoutof/utils/files.hpp"

#ifdef LAYOUTOF_WITH_CPP
#    include "layoutof/parsers/cpp/type_parser_cpp.hpp"
#endif

namespace layoutof
{
    namespace detail
    {
        void normalize_path(std::string& value, const std::filesystem::path& base = {})
        {
            std::filesystem::path path(value);

            if (!base.empty() && path.is_relative())
            {
                path = base / path;
            }

            if (!path.is_absolute())
            {
                path = std::filesystem::absolute(path);
            }

            value = path.lexically_normal().make_preferred().string();
        }

        void normalize_paths(std::vector<std::string>& values, const std::filesystem::path& base = {})
        {
            for (std::string& value : values)
            {
                normalize_path(value, base);
            }
        }

        template <typename value_t>
        void append(std::vector<value_t>& values, const std::vector<value_t>& other)
        {
            values.insert(values.end(), other.begin(), other.end());
        }

        layout_config load_config(const layout_options& options)
        {
            std::string config_path = options.config;
            normalize_path(config_path);

            if (!std::filesystem::exists(config_path))
            {
                if (options.config_required)
                {
                    throw layout_error(layout_error_code::io, "config file not found, file={}", config_path);
                }

                SPDLOG_DEBUG("no config file, using defaults, file={}", config_path);
                return {};
            }

            nlohmann::json config_json;
            if (!files::read_file(config_path, config_json))
            {
                throw layout_error(layout_error_code::io, "invalid config, file={}", config_path);
            }

            layout_config config;

            try
            {
                config_json.get_to(config);
            }
            catch (const nlohmann::json::exception& e)
            {
                throw layout_error(layout_error_code::configuring, "malformed config, file={} error={}", config_path, e.what());
            }

            // Paths in a config file are relative to the file itself.
            const std::filesystem::path config_directory = std::filesystem::path(config_path).parent_path();
            normalize_paths(config.types, config_directory);
            normalize_paths(config.sources, config_directory);

            SPDLOG_DEBUG("loaded config, file={} types={} sources={}", config_path, config.types.size(), config.sources.size());
            return config;
        }
    }

    std::string make_display_name(const std::string_view requested_name, const type_descriptor& type)
    {
        if (requested_name == type.name)
        {
            return std::string(requested_name);
        }

        return fmt::format("{} ({})", requested_name, type.name);
    }

    layout_app::layout_app(const layout_options& options)
        : config(detail::load_config(options))
    {
        std::vector<std::string> types = options.types;
        std::vector<std::string> sources = options.sources;
        detail::normalize_paths(types);
        detail::normalize_paths(sources);

        detail::append(config.types, types);
        detail::append(config.sources, sources);
        detail::append(config.args, options.args);

        if (options.format.has_value())
        {
            config.format = options.format.value();
        }

        if (options.max_depth.has_value())
        {
            if (options.max_depth.value() == 0)
            {
                throw layout_error(layout_error_code::configuring, "max depth must be at least 1");
            }

            config.max_depth = options.max_depth.value();
        }

        if (options.no_color)
        {
            config.color = false;
        }

        if (options.debug)
        {
            config.debug = true;
        }

        if (config.debug)
        {
            spdlog::set_level(spdlog::level::debug);
        }

        init_renderers();
        load_types();
    }

    layout_app::layout_app(layout_config in_config, std::unique_ptr<type_adapter> in_adapter)
        : config(std::move(in_config))
    {
        adapter.add_adapter(std::move(in_adapter));
        init_renderers();
    }

    void layout_app::init_renderers()
    {
        renderers = layout_renderer_composite {
            std::make_unique<layout_renderer_text>(config.color),
            std::make_unique<layout_renderer_json>(),
            std::make_unique<layout_renderer_yaml>(),
        };

        renderer = renderers.find_renderer(config.format);
        if (renderer == nullptr)
        {
            throw layout_error(layout_error_code::configuring, "unknown output format, format={}", config.format);
        }

        engine.max_depth = config.max_depth;
    }

    void layout_app::load_types()
    {
        auto database = std::make_shared<type_database>();

        type_parser_json parser_json;
        if (!parser_json.parse_types(config.types, *database))
        {
            throw layout_error(layout_error_code::parsing, "failed to parse type metadata");
        }

        if (!config.sources.empty())
        {
#ifdef LAYOUTOF_WITH_CPP
            type_parser_cpp parser_cpp {config.args};
            if (!parser_cpp.parse_types(config.sources, *database))
            {
                throw layout_error(layout_error_code::parsing, "failed to parse C++ sources");
            }
#else
            throw layout_error(layout_error_code::configuring, "C++ sources given but {} was built without C++ support", LAYOUTOF_NAME);
#endif
        }

        if (database->empty())
        {
            SPDLOG_WARN("no type metadata loaded, every lookup will fail");
        }

        SPDLOG_DEBUG("loaded types, types={} aliases={} variables={}", database->types.size(), database->aliases.size(), database->variables.size());
        adapter.add_adapter(std::make_unique<type_adapter_database>(std::move(database)));
    }

    void layout_app::layout_of(const std::string_view type_name, const bool recursive, std::ostream& out) const
    {
        const type_descriptor_ptr type = resolve(adapter, type_name);

        if (!type->composite())
        {
            throw layout_error(layout_error_code::invalid, "\"{}\" is not a struct, union or enum, kind={}", type_name, to_string(type->kind));
        }

        const layout_result result {
            .display_name = make_display_name(type_name, *type),
            .tree = engine.compute_layout(*type, recursive),
            .recursive = recursive,
        };

        // Rendered into a buffer first so a failed command leaves no partial output.
        std::string output;
        if (!renderer->render_layout(result, output))
        {
            throw layout_error(layout_error_code::unknown, "failed to render layout, type={} format={}", type_name, config.format);
        }

        out << output;
    }

    void layout_app::offsets_of(const std::string_view type_name, std::ostream& out) const
    {
        const type_descriptor_ptr type = resolve(adapter, type_name);

        if (!type->composite())
        {
            throw layout_error(layout_error_code::invalid, "\"{}\" is not a struct, union or enum, kind={}", type_name, to_string(type->kind));
        }

        const offsets_result result {
            .display_name = make_display_name(type_name, *type),
            .type_name = type->name,
            .offsets = compute_offsets(*type),
        };

        std::string output;
        if (!renderer->render_offsets(result, output))
        {
            throw layout_error(layout_error_code::unknown, "failed to render offsets, type={} format={}", type_name, config.format);
        }

        out << output;
    }
}
