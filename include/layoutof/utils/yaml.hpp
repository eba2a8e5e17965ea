#pragma once

#include <cstdint>
#include <string>

#include "nlohmann/json.hpp"
#include "yaml-cpp/yaml.h"

namespace layoutof::yaml
{
    namespace detail
    {
        inline nlohmann::json from_scalar(const YAML::Node& node)
        {
            // Quoted scalars are strings even when they look like numbers, e.g. a type named "1".
            if (node.Tag() == "!")
            {
                return node.as<std::string>();
            }

            std::uint64_t unsigned_value;
            if (YAML::convert<std::uint64_t>::decode(node, unsigned_value))
                return unsigned_value;

            std::int64_t signed_value;
            if (YAML::convert<std::int64_t>::decode(node, signed_value))
                return signed_value;

            bool bool_value;
            if (YAML::convert<bool>::decode(node, bool_value))
                return bool_value;

            double double_value;
            if (YAML::convert<double>::decode(node, double_value))
                return double_value;

            return node.as<std::string>();
        }

        inline nlohmann::json from_yaml(const YAML::Node& node)
        {
            switch (node.Type())
            {
                case YAML::NodeType::Scalar: {
                    return from_scalar(node);
                }

                case YAML::NodeType::Sequence: {
                    nlohmann::json json = nlohmann::json::array();
                    for (const YAML::Node& child : node)
                    {
                        json.emplace_back(from_yaml(child));
                    }

                    return json;
                }

                case YAML::NodeType::Map: {
                    nlohmann::json json = nlohmann::json::object();
                    for (const auto& pair : node)
                    {
                        json[pair.first.as<std::string>()] = from_yaml(pair.second);
                    }

                    return json;
                }

                case YAML::NodeType::Null: {
                    return nullptr;
                }

                default: {
                    return nlohmann::json(nlohmann::json::value_t::discarded);
                }
            }
        }

        inline void to_yaml(const nlohmann::json& json, YAML::Emitter& emitter)
        {
            switch (json.type())
            {
                case nlohmann::json::value_t::object: {
                    emitter << YAML::BeginMap;
                    for (const auto& [key, value] : json.items())
                    {
                        emitter << YAML::Key << key << YAML::Value;
                        to_yaml(value, emitter);
                    }

                    emitter << YAML::EndMap;
                    break;
                }

                case nlohmann::json::value_t::array: {
                    emitter << YAML::BeginSeq;
                    for (const nlohmann::json& value : json)
                    {
                        to_yaml(value, emitter);
                    }

                    emitter << YAML::EndSeq;
                    break;
                }

                case nlohmann::json::value_t::string:
                    emitter << json.get_ref<const std::string&>();
                    break;
                case nlohmann::json::value_t::boolean:
                    emitter << json.get<bool>();
                    break;
                case nlohmann::json::value_t::number_integer:
                    emitter << json.get<std::int64_t>();
                    break;
                case nlohmann::json::value_t::number_unsigned:
                    emitter << json.get<std::uint64_t>();
                    break;
                case nlohmann::json::value_t::number_float:
                    emitter << json.get<double>();
                    break;
                default:
                    emitter << YAML::Null;
                    break;
            }
        }
    }

    inline std::string to_yaml(const nlohmann::json& json, const std::size_t indent = 2)
    {
        YAML::Emitter emitter;
        emitter.SetIndent(indent);
        detail::to_yaml(json, emitter);
        return emitter.c_str();
    }

    inline nlohmann::json from_yaml(const std::string& value)
    {
        return detail::from_yaml(YAML::Load(value));
    }
}
