//! # Driver Interface
//!
//! `cmscript_main()` dispatches to the command handler named by argv[1].

#pragma once

int cmscript_main(int argc, char* argv[]);
