#pragma once

#include <algorithm>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "layoutof/layout_error.hpp"

namespace layoutof::strings
{
    constexpr std::string_view whitespaces = " \t\r\n";

    template <typename container_t, typename projection_t = std::identity>
    std::string join(const std::string_view separator, const container_t& values, const projection_t& projection = {})
    {
        std::string string;
        for (const auto& value : values)
        {
            string += projection(value);
            string += separator;
        }

        if (string.size() >= separator.size())
        {
            string.resize(string.size() - separator.size());
        }

        return string;
    }

    template <typename string_t>
    void trim_start(string_t& value, const std::string_view chars = whitespaces)
    {
        const std::size_t index = value.find_first_not_of(chars);
        value = value.substr(std::min(index, value.size()));
    }

    template <typename string_t>
    void trim_end(string_t& value, const std::string_view chars = whitespaces)
    {
        const std::size_t index = value.find_last_not_of(chars);
        value = value.substr(0, index != string_t::npos ? index + 1 : 0);
    }

    template <typename string_t>
    void trim(string_t& value, const std::string_view chars = whitespaces)
    {
        trim_start(value, chars);
        trim_end(value, chars);
    }

    // Splits a command line the way a debugger does: whitespace separates arguments, single
    // and double quotes group them, and a backslash escapes the next character.
    inline std::vector<std::string> split_args(const std::string_view line)
    {
        std::vector<std::string> args;
        std::string current;
        bool has_current = false;
        char quote = '\0';

        for (std::size_t index = 0; index < line.size(); ++index)
        {
            const char c = line[index];

            if (c == '\\' && quote != '\'')
            {
                if (++index == line.size())
                {
                    throw layout_error(layout_error_code::invalid, "trailing escape character in \"{}\"", line);
                }

                current += line[index];
                has_current = true;
            }
            else if (quote != '\0')
            {
                if (c == quote)
                {
                    quote = '\0';
                }
                else
                {
                    current += c;
                }
            }
            else if (c == '"' || c == '\'')
            {
                quote = c;
                has_current = true;
            }
            else if (whitespaces.find(c) != std::string_view::npos)
            {
                if (has_current)
                {
                    args.emplace_back(std::move(current));
                    current.clear();
                    has_current = false;
                }
            }
            else
            {
                current += c;
                has_current = true;
            }
        }

        if (quote != '\0')
        {
            throw layout_error(layout_error_code::invalid, "unterminated quote in \"{}\"", line);
        }

        if (has_current)
        {
            args.emplace_back(std::move(current));
        }

        return args;
    }
}
