/***
 * Name: shdoc::main
 * Purpose: Entry point for the shdoc documentation extractor.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: POSIX process status code (0 on success).
 * Theory of Operation:
 *   Parses options and hands them to the driver. Option errors print the
 *   usage and exit 2; every other shdoc error (unreadable script, unknown
 *   command) exits 1.
 */
#include <exception>
#include <iostream>

#include "shdoc/cli/options.h"
#include "shdoc/cli/parse_args.h"
#include "shdoc/cli/usage.h"
#include "shdoc/driver/app.h"
#include "shdoc/exceptions/config_error.h"
#include "shdoc/exceptions/shdoc_exception.h"

int main(int argc, char** argv) {
    try {
    shdoc::cli::Options opts;
    shdoc::cli::ParseArgs(argc, argv, opts);
    return shdoc::driver::Run(opts, std::cout, std::cerr);
    }
    catch (const shdoc::exceptions::ConfigError& ex) {
        std::cerr << "shdoc: error: " << ex.what() << '\n';
        std::cerr << shdoc::cli::Usage();
        return 2;
    }
    catch (const shdoc::exceptions::ShdocException& ex) {
        std::cerr << "shdoc: error: " << ex.what() << '\n';
        return 1;
    }
    catch (const std::exception& ex) {
        std::cerr << "shdoc: internal error: " << ex.what() << '\n';
        return 1;
    }
    catch (...) {
        std::cerr << "shdoc: unknown error" << '\n';
        return 1;
    }
}
