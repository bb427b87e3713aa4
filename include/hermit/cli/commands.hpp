#pragma once

namespace hermit::cli {

/// Entry point for the `hermit` executable. Returns the process exit code.
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace hermit::cli
