#pragma once

#include <istream>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "layoutof/layout_app.hpp"
#include "layoutof/layout_error.hpp"

namespace layoutof
{
    // Dispatches "layout-of" and "offsets-of" commands to an application. A failing command
    // is logged and reported through its error code, it never ends the session.
    struct layout_session
    {
        const layout_app& app;

        explicit layout_session(const layout_app& app)
            : app(app)
        {
        }

        [[nodiscard]] layout_error_code execute(std::span<const std::string> args, std::ostream& out) const;
        [[nodiscard]] layout_error_code execute_line(std::string_view line, std::ostream& out) const;

        // Executes one command per line until the end of input or "quit".
        void run(std::istream& in, std::ostream& out) const;

      private:
        void dispatch(std::span<const std::string> args, std::ostream& out) const;
    };

    void print_usage(std::ostream& out);
}
