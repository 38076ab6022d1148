#pragma once

/// Runs the checker with the process arguments and returns the exit code.
int pmc_main(int argc, char* argv[]);
