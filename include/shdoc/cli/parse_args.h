#pragma once

#include "shdoc/cli/options.h"

namespace shdoc::cli {

    // Parse argv into Options. Throws exceptions::ConfigError on bad input.
    void ParseArgs(int argc, char** argv, Options& out);

} // namespace shdoc::cli
