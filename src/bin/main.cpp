#include <algorithm>
#include <cstring>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "argparse/argparse.hpp"
#include "spdlog/spdlog.h"

#include "layoutof/layout_app.hpp"
#include "layoutof/layout_error.hpp"
#include "layoutof/layout_options.hpp"
#include "layoutof/layout_session.hpp"
#include "layoutof/layout_version.hpp"

namespace layoutof
{
    namespace detail
    {
        namespace metavars
        {
            constexpr auto file = "FILE";
            constexpr auto format = "FORMAT";
            constexpr auto depth = "DEPTH";
            constexpr auto command = "COMMAND";
        }

        std::size_t get_rest_index(const std::size_t argc, const char* argv[])
        {
            const auto predicate = [](const char* arg) { return std::strcmp(arg, "--") == 0; };
            const char** end = std::find_if(argv, argv + argc, predicate);
            return static_cast<std::size_t>(end - argv);
        }
    }
}

int main(const int argc, const char* argv[])
{
    using namespace layoutof;

    spdlog::set_pattern("%l: %v");

    argparse::ArgumentParser arg_parser {
        LAYOUTOF_NAME,
        LAYOUTOF_VERSION,
    };

    constexpr auto description =
        "Tool to inspect the memory layout of types: field offsets, holes and padding";

    constexpr auto epilog =
        "Commands:\n"
        "  layout-of [-r] <type-name>  print the layout tree, -r expands nested types\n"
        "  offsets-of <type-name>      print field offsets\n"
        "Without a command, commands are read from standard input, one per line.\n"
        "Arguments after \"--\" are forwarded to the C++ parser, e.g.\n"
        "  -- -std=c++20 -Iinclude/dir";

    arg_parser.add_description(description);
    arg_parser.add_epilog(epilog);

    arg_parser
        .add_argument("-c", "--config")
        .help("Configuration file to use")
        .metavar(detail::metavars::file)
        .default_value(std::string {"layoutof.yml"});

    arg_parser
        .add_argument("-t", "--types")
        .help("Type metadata files to load, JSON or YAML")
        .default_value(std::vector<std::string> {})
        .metavar(detail::metavars::file)
        .append();

    arg_parser
        .add_argument("-s", "--sources")
        .help("C++ sources to compile for type metadata")
        .default_value(std::vector<std::string> {})
        .metavar(detail::metavars::file)
        .append();

    arg_parser
        .add_argument("-f", "--format")
        .help("Output format, one of text, json or yaml")
        .metavar(detail::metavars::format);

    arg_parser
        .add_argument("-m", "--max-depth")
        .help("Maximum nesting depth of recursive layouts")
        .metavar(detail::metavars::depth)
        .scan<'u', std::size_t>();

    arg_parser
        .add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);

    arg_parser
        .add_argument("-d", "--debug")
        .help("Enable debug output")
        .default_value(false)
        .implicit_value(true);

    arg_parser
        .add_argument("command")
        .help("Command to run, omit to start an interactive session")
        .metavar(detail::metavars::command)
        .default_value(std::vector<std::string> {})
        .remaining();

    const std::size_t rest_index = detail::get_rest_index(static_cast<std::size_t>(argc), argv);

    try
    {
        arg_parser.parse_args(static_cast<int>(rest_index), argv);
    }
    catch (const std::exception& e)
    {
        std::cout << e.what() << std::endl;
        std::cout << arg_parser;
        return static_cast<int>(layout_error_code::invalid);
    }

    std::vector<std::string> additional_args;
    if (rest_index < static_cast<std::size_t>(argc))
    {
        const std::span rest {argv + rest_index + 1, argv + argc};
        additional_args.assign(rest.begin(), rest.end());
    }

    const layout_options options {
        .config = arg_parser.get<std::string>("--config"),
        .types = arg_parser.get<std::vector<std::string>>("--types"),
        .sources = arg_parser.get<std::vector<std::string>>("--sources"),
        .args = std::move(additional_args),
        .format = arg_parser.present<std::string>("--format"),
        .max_depth = arg_parser.present<std::size_t>("--max-depth"),
        .config_required = arg_parser.is_used("--config"),
        .no_color = arg_parser.get<bool>("--no-color"),
        .debug = arg_parser.get<bool>("--debug"),
    };

    if (options.debug)
    {
        spdlog::set_level(spdlog::level::debug);
    }

    const std::vector<std::string> command = arg_parser.get<std::vector<std::string>>("command");

    try
    {
        const layout_app app {options};
        const layout_session session {app};

        if (command.empty())
        {
            session.run(std::cin, std::cout);
            return static_cast<int>(layout_error_code::none);
        }

        return static_cast<int>(session.execute(command, std::cout));
    }
    catch (const layout_error& e)
    {
        SPDLOG_ERROR("{}", e.what());
        return static_cast<int>(e.error_code);
    }
    catch (const std::exception& e)
    {
        SPDLOG_ERROR("failed to run {}: {}", LAYOUTOF_NAME, e.what());
        return static_cast<int>(layout_error_code::unknown);
    }
}
