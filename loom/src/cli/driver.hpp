//! # CLI Driver Interface
//!
//! `loom_main()` dispatches to the command handler named by argv[1].

#pragma once

int loom_main(int argc, char* argv[]);
