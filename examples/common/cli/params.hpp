#pragma once

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"
#include "common/cli/validators.hpp"
#include "chunkwire/core/config/codec.hpp"


namespace chunkwire::examples::cli {

    // -------------------------------------------------------------
    // Common example parameters
    // -------------------------------------------------------------
    struct Params {
        std::size_t budget    = core::config::codec::DEFAULT_CHUNK_BUDGET;
        std::string input     = "-";
        std::string log_level = "warn";
        bool color            = false;
        bool stats            = false;

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Budget    : " << budget << " bytes\n"
               << "  Input     : " << (input == "-" ? "<stdin>" : input) << "\n"
               << "  Log Level : " << log_level << "\n"
               << "  Color     : " << (color ? "true" : "false") << "\n"
               << "  Stats     : " << (stats ? "true" : "false") << "\n";
        }
    };

    // -------------------------------------------------------------
    // Build CLI for examples
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description, std::string_view footer,
                            std::size_t default_budget = core::config::codec::DEFAULT_CHUNK_BUDGET) {
        CLI::App app{std::string(description)};
        Params params{};
        params.budget = default_budget;
        app.add_option("-b,--budget", params.budget, "Byte budget per chunk")->check(budget_validator)->default_val(params.budget);
        app.add_option("-i,--input", params.input, "Input file ('-' reads stdin)")->default_val(params.input);
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal | off")->check(log_level_validator)->default_val(params.log_level);
        app.add_flag("--color", params.color, "Colored log output");
        app.add_flag("--stats", params.stats, "Print codec telemetry to stderr when done");
        app.footer(std::string(footer));
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e, std::cout, std::cerr));
        }
        // -------------------------------------------------------------
        // Logging
        // -------------------------------------------------------------
        set_log_level(params.log_level, params.color);
        return params;
    }

} // namespace chunkwire::examples::cli
