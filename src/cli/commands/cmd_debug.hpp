//! # Debug Commands Interface
//!
//! | Function      | Command          | Output                      |
//! |---------------|------------------|-----------------------------|
//! | `run_lex()`   | `cmscript lex`   | Token stream                |
//! | `run_parse()` | `cmscript parse` | Syntax tree outline         |

#pragma once
#include <string>

namespace cmscript::cli {

int run_lex(const std::string& path);
int run_parse(const std::string& path);

} // namespace cmscript::cli
