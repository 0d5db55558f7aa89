//! # Query Commands Interface
//!
//! Editor-style queries against one script. Cursors are 0-based.
//!
//! | Function         | Command                                  |
//! |------------------|------------------------------------------|
//! | `run_word()`     | `cmscript word <file> <line> <col>`      |
//! | `run_scope()`    | `cmscript scope <file> <line> <col>`     |
//! | `run_complete()` | `cmscript complete <file> <line> <col>`  |
//! | `run_help()`     | `cmscript help <file> <line> <col>`      |
//! | `run_context()`  | `cmscript context <file> <offset>`       |

#pragma once

#include "query/names.hpp"

#include <ostream>
#include <string>

namespace cmscript::cli {

class CMakeHelpRegistry;

int run_word(int argc, char* argv[]);
int run_scope(int argc, char* argv[]);
int run_complete(int argc, char* argv[], const query::NameRegistry& registry,
                 std::ostream& out);
int run_help(int argc, char* argv[], const CMakeHelpRegistry& registry, std::ostream& out);
int run_context(int argc, char* argv[]);

} // namespace cmscript::cli
