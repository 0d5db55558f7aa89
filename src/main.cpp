//! # cmscript Entry Point
//!
//! Delegates to the CLI driver, which parses the command line and runs the
//! requested command.
//!
//! ## Usage
//!
//! ```bash
//! cmscript fmt                        # Format every script under "."
//! cmscript fmt --check cmake/         # Check formatting
//! cmscript parse CMakeLists.txt       # Dump the syntax tree
//! cmscript complete CMakeLists.txt 4 7
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return cmscript_main(argc, argv);
}
