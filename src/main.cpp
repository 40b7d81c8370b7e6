#include "toolguard/cli/commands.hpp"

int main(int argc, char **argv) { return toolguard::cli::run_cli(argc, argv); }
