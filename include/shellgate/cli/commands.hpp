#pragma once

namespace shellgate::cli {

/// Entry point for the `shellgate` executable. Returns the process exit code.
[[nodiscard]] int run_cli(int argc, char **argv);

void print_help();

} // namespace shellgate::cli
