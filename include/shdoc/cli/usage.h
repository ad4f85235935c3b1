#pragma once

#include <string>

namespace shdoc::cli {

    // Help text for the shdoc executable itself.
    std::string Usage();

} // namespace shdoc::cli
