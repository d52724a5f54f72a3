//! # odindoc Entry Point
//!
//! Prints Go-`doc`-style API documentation for Odin packages.
//!
//! ```bash
//! odindoc core:fmt              # document a package
//! odindoc core:strings.Builder  # document one symbol
//! odindoc ./src/mypkg           # document a local directory
//! odindoc --root                # show the resolved Odin installation
//! ```
//!
//! All work happens in `odindoc_main()` (`cli/dispatcher.cpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return odindoc_main(argc, argv);
}
