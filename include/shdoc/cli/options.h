/***
 * Name: shdoc::cli::Options
 * Purpose: Typed configuration for one shdoc run, filled from the command line.
 */
#pragma once

#include <string>
#include <vector>

namespace shdoc::cli {

    struct Options {
        bool showHelp{false};     // -h, --help
        bool verbose{false};      // --verbose
        bool metrics{false};      // --metrics
        bool metricsJson{false};  // --metrics-json
        bool logScan{false};      // --log-scan
        std::string file{};       // --file=<script>
        std::string prefix{};     // --prefix=<prefix>
        std::string logPath{"."}; // --log-path=<dir> (defaults to ./)
        std::string command{};            // first positional argument
        std::vector<std::string> args{};  // remaining positional arguments
    };

} // namespace shdoc::cli
