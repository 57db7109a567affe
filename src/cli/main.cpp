//! # weft-json Entry Point
//!
//! Reads a JSON document from a file or stdin, parses it with the selected
//! configuration, and prints it back in normalized form.
//!
//! ## Usage
//!
//! ```bash
//! weft-json data.json                   # Compact output
//! weft-json --pretty --indent=2 < data.json
//! weft-json --lenient --allow-comments config.json5
//! ```

#include "driver.hpp"

int main(int argc, char* argv[]) {
    return weft_json_main(argc, argv);
}
