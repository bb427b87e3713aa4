#include "hermit/cli/commands.hpp"

int main(int argc, char **argv) { return hermit::cli::run_cli(argc, argv); }
