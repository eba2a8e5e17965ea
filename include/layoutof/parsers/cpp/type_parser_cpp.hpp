#pragma once

#include <span>
#include <string>
#include <vector>

#include "layoutof/parsers/type_parser.hpp"

namespace layoutof
{
    // Compiles C++ sources with clang and records the layout of every complete record.
    struct type_parser_cpp final : type_parser
    {
        std::vector<std::string> additional_args;

        explicit type_parser_cpp(const std::span<const std::string> args)
            : additional_args(args.begin(), args.end())
        {
        }

        [[nodiscard]] bool parse_types(const std::vector<std::string>& paths, type_database& database) override;
    };
}
