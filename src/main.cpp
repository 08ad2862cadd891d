#include "notegraph/cli/commands.hpp"

int main(int argc, char **argv) { return notegraph::cli::run_cli(argc, argv); }
