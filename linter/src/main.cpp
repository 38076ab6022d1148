//! # pmc-lint Entry Point
//!
//! Delegates to the CLI driver.
//!
//! ## Usage
//!
//! ```bash
//! pmc-lint --annoy trees/              # check every *.json tree under trees/
//! pmc-lint --select=PMC001 dump.json   # only report inplace=True
//! pmc-lint --format=json dump.json     # machine-readable output
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return pmc_main(argc, argv);
}
