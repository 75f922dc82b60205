#include "shellgate/cli/commands.hpp"

int main(int argc, char **argv) { return shellgate::cli::run_cli(argc, argv); }
