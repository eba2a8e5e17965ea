#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

#include "layoutof/layout_error.hpp"

namespace layoutof::json
{
    template <typename value_t>
    bool get(const nlohmann::json& json, const std::string_view key, value_t& value)
    {
        if (json.contains(key))
        {
            json[key].get_to(value);
            return true;
        }

        return false;
    }

    template <typename value_t, typename default_value_t = value_t>
    void get_opt(const nlohmann::json& json, const std::string_view key, value_t& value, const default_value_t& default_value = {})
    {
        if (!get(json, key, value))
        {
            value = default_value;
        }
    }

    template <typename value_t>
    void get_checked(const nlohmann::json& json, const std::string_view key, value_t& value, const std::string_view context)
    {
        if (!get(json, key, value)) [[unlikely]]
        {
            throw layout_error(layout_error_code::parsing, "JSON property \"{}\" not found in {}", key, context);
        }
    }

    // Reads either a single string or a list of strings, appending to values.
    inline bool get_strings(const nlohmann::json& json, const std::string_view key, std::vector<std::string>& values)
    {
        if (!json.contains(key))
        {
            return false;
        }

        const nlohmann::json& json_values = json[key];

        if (json_values.is_string())
        {
            values.emplace_back(json_values.get<std::string>());
            return true;
        }

        if (!json_values.is_array())
        {
            throw layout_error(layout_error_code::configuring, "JSON property \"{}\" must be a string or a list of strings", key);
        }

        for (const nlohmann::json& json_value : json_values)
        {
            values.emplace_back(json_value.get<std::string>());
        }

        return true;
    }
}
