#pragma once
#include <iostream>

// Runs `splitmerge split|merge|inspect`. Summaries and progress go to `out`,
// usage and errors to `err`. Returns the process exit status.
int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err);
