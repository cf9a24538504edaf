#pragma once

namespace runclaw::cli {

int run_cli(int argc, char **argv);

} // namespace runclaw::cli
