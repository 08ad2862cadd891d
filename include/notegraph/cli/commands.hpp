#pragma once

namespace notegraph::cli {

void print_help();
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace notegraph::cli
