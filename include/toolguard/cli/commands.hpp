#pragma once

namespace toolguard::cli {

/// Entry point for the toolguard binary. argv[0] is the program name. Returns the
/// process exit code.
int run_cli(int argc, char **argv);

} // namespace toolguard::cli
