#include "shdoc/cli/parse_args_internals.h"
#include "shdoc/exceptions/config_error.h"

#include <string>

namespace shdoc::cli::detail {

static bool boolValue(const OptionArg& opt) {
    return opt.value ? parseBoolValue(opt.key, *opt.value) : true;
}

static std::string stringValue(const OptionArg& opt) {
    if (!opt.value) {
        throw exceptions::ConfigError("option '--" + std::string(opt.key) + "' requires a value");
    }
    return std::string(*opt.value);
}

/***
 * Name: shdoc::cli::detail::applyOption
 * Purpose: Store an allow-listed option into its typed Options field.
 */
void applyOption(const OptionArg& opt, Options& out) {
    if (isFlag(opt.key, "help")) {
        out.showHelp = boolValue(opt);
    } else if (isFlag(opt.key, "verbose")) {
        out.verbose = boolValue(opt);
    } else if (isFlag(opt.key, "metrics")) {
        out.metrics = boolValue(opt);
    } else if (isFlag(opt.key, "metrics-json")) {
        out.metricsJson = boolValue(opt);
    } else if (isFlag(opt.key, "log-scan")) {
        out.logScan = boolValue(opt);
    } else if (isFlag(opt.key, "file")) {
        out.file = stringValue(opt);
    } else if (isFlag(opt.key, "prefix")) {
        out.prefix = stringValue(opt);
    } else if (isFlag(opt.key, "log-path")) {
        out.logPath = stringValue(opt);
    } else {
        throw exceptions::ConfigError("unknown option '--" + std::string(opt.key) + "'");
    }
}

} // namespace shdoc::cli::detail
