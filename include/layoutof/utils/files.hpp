#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "yaml-cpp/yaml.h"

#include "layoutof/utils/yaml.hpp"

namespace layoutof::files
{
    enum class data_file_type
    {
        none,
        json,
        yaml,
    };

    inline data_file_type get_data_file_type(const std::string_view path)
    {
        constexpr std::string_view json_exts[] {".json"};
        constexpr std::string_view yaml_exts[] {".yml", ".yaml"};

        const std::string ext = std::filesystem::path(path).extension().string();

        if (std::ranges::find(json_exts, ext) != std::end(json_exts))
        {
            return data_file_type::json;
        }

        if (std::ranges::find(yaml_exts, ext) != std::end(yaml_exts))
        {
            return data_file_type::yaml;
        }

        return data_file_type::none;
    }

    inline bool read_file(const std::string_view path, std::string& content)
    {
        std::ifstream stream {std::string(path)};
        if (!stream.is_open())
        {
            return false;
        }

        std::stringstream string;
        string << stream.rdbuf();
        content = string.str();
        return !stream.bad();
    }

    // Reads a JSON or YAML document, the format is chosen from the file extension.
    inline bool read_file(const std::string_view path, nlohmann::json& json)
    {
        json = nlohmann::json(nlohmann::json::value_t::discarded);

        std::string content;
        if (!read_file(path, content))
        {
            return false;
        }

        switch (get_data_file_type(path))
        {
            case data_file_type::json: {
                json = nlohmann::json::parse(content, nullptr, false, false);
                break;
            }

            case data_file_type::yaml: {
                try
                {
                    json = yaml::from_yaml(content);
                }
                catch (const YAML::Exception& e)
                {
                    SPDLOG_ERROR("invalid YAML, file={} error={}", path, e.what());
                }

                break;
            }

            default: {
                break;
            }
        }

        return !json.is_discarded();
    }
}
