#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "layoutof/layout_error.hpp"
#include "layoutof/parsers/type_parser.hpp"
#include "layoutof/utils/files.hpp"

namespace layoutof
{
    // Reads type metadata exported as JSON or YAML, later files override earlier ones.
    struct type_parser_json final : type_parser
    {
        [[nodiscard]] bool parse_types(const std::vector<std::string>& paths, type_database& database) override
        {
            for (const std::string& path : paths)
            {
                nlohmann::json json;
                if (!files::read_file(path, json))
                {
                    SPDLOG_ERROR("invalid type metadata file, file={}", path);
                    return false;
                }

                type_database file_database;

                try
                {
                    json.get_to(file_database);
                }
                catch (const nlohmann::json::exception& e)
                {
                    SPDLOG_ERROR("malformed type metadata, file={} error={}", path, e.what());
                    return false;
                }
                catch (const layout_error& e)
                {
                    SPDLOG_ERROR("malformed type metadata, file={} error={}", path, e.what());
                    return false;
                }

                SPDLOG_DEBUG("parsed type metadata, file={} types={} aliases={} variables={}", path, file_database.types.size(), file_database.aliases.size(), file_database.variables.size());
                database.merge(std::move(file_database));
            }

            return true;
        }
    };
}
