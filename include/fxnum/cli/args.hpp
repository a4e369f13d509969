#pragma once

#include <fxnum/config/types.hpp>
#include <fxnum/logging/logger.hpp>

namespace fxnum::cli {

// Parse CLI using cxxopts, then layer config file < FXNUM_* environment < command line.
// Writes help/version and every error through the provided logger. On failure
// the returned ParseResult has no cfg and show_only is false.
fxnum::config::ParseResult parse(int argc, char** argv, fxnum::logging::Logger& log);

} // namespace fxnum::cli
