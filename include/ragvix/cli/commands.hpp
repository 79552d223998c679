#pragma once

namespace ragvix::cli {

/// Entry point for the `ragvix` executable. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace ragvix::cli
