#include "ragvix/cli/commands.hpp"

int main(int argc, char **argv) { return ragvix::cli::run_cli(argc, argv); }
