//! # weft-json Driver Interface
//!
//! `weft_json_main()` parses the command line, reads the input document and
//! prints it normalized under the selected configuration.

#pragma once

int weft_json_main(int argc, char* argv[]);
