#pragma once

#include <juggl_tool/cli/Options.hpp>

#include <ostream>

namespace llvm {
class raw_fd_ostream;
} // namespace llvm

namespace juggl_tool::driver {

/// Decode -> map -> scan -> shuffle -> emit, writing chunks to stdout.
int run(const cli::Options& opt);

/// Same pipeline with explicit sinks; diagnostics and notes go to `log`.
int run(const cli::Options& opt, llvm::raw_fd_ostream& out, std::ostream& log);

} // namespace juggl_tool::driver
