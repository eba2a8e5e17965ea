#include "layoutof/layout_session.hpp"

#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "layoutof/utils/strings.hpp"

namespace layoutof
{
    namespace detail
    {
        namespace commands
        {
            constexpr std::string_view layout_of = "layout-of";
            constexpr std::string_view offsets_of = "offsets-of";
            constexpr std::string_view help = "help";
        }

        namespace usages
        {
            constexpr std::string_view layout_of = "usage: layout-of [-r] <type-name>";
            constexpr std::string_view offsets_of = "usage: offsets-of <type-name>";
        }

        bool is_recursive_flag(const std::string_view arg)
        {
            return arg == "-r" || arg == "--recursive";
        }

        bool is_quit(const std::string_view line)
        {
            return line == "quit" || line == "exit";
        }
    }

    void print_usage(std::ostream& out)
    {
        out << detail::usages::layout_of << '\n'
            << detail::usages::offsets_of << '\n';
    }

    layout_error_code layout_session::execute(const std::span<const std::string> args, std::ostream& out) const
    {
        try
        {
            dispatch(args, out);
        }
        catch (const layout_error& e)
        {
            SPDLOG_ERROR("{}", e.what());
            return e.error_code;
        }
        catch (const std::exception& e)
        {
            SPDLOG_ERROR("command failed, error={}", e.what());
            return layout_error_code::unknown;
        }

        return layout_error_code::none;
    }

    layout_error_code layout_session::execute_line(const std::string_view line, std::ostream& out) const
    {
        std::vector<std::string> args;

        try
        {
            args = strings::split_args(line);
        }
        catch (const layout_error& e)
        {
            SPDLOG_ERROR("{}", e.what());
            return e.error_code;
        }

        return execute(args, out);
    }

    void layout_session::run(std::istream& in, std::ostream& out) const
    {
        std::string line;

        while (std::getline(in, line))
        {
            strings::trim(line);

            if (line.empty() || line.starts_with('#'))
            {
                continue;
            }

            if (detail::is_quit(line))
            {
                break;
            }

            const layout_error_code error_code = execute_line(line, out);
            if (error_code != layout_error_code::none)
            {
                SPDLOG_DEBUG("command failed, line={} error_code={}", line, static_cast<int>(error_code));
            }

            out.flush();
        }
    }

    void layout_session::dispatch(const std::span<const std::string> args, std::ostream& out) const
    {
        if (args.empty())
        {
            return;
        }

        const std::string_view command = args.front();
        const std::span<const std::string> command_args = args.subspan(1);

        if (command == detail::commands::layout_of)
        {
            const bool recursive = !command_args.empty() && detail::is_recursive_flag(command_args.front());
            const std::span<const std::string> names = recursive ? command_args.subspan(1) : command_args;

            if (names.size() != 1)
            {
                out << detail::usages::layout_of << '\n';
                throw layout_error(layout_error_code::invalid, "layout-of expects exactly one type name, got {}", names.size());
            }

            app.layout_of(names.front(), recursive, out);
        }
        else if (command == detail::commands::offsets_of)
        {
            if (command_args.size() != 1)
            {
                out << detail::usages::offsets_of << '\n';
                throw layout_error(layout_error_code::invalid, "offsets-of expects exactly one type name, got {}", command_args.size());
            }

            app.offsets_of(command_args.front(), out);
        }
        else if (command == detail::commands::help)
        {
            print_usage(out);
        }
        else
        {
            print_usage(out);
            throw layout_error(layout_error_code::invalid, "unknown command, command={}", command);
        }
    }
}
