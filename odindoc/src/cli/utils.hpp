//! # CLI Utilities Interface
//!
//! | Function          | Description              |
//! |-------------------|--------------------------|
//! | `print_usage()`   | Print CLI help text      |
//! | `print_version()` | Print the tool version   |

#pragma once
#include <ostream>

namespace odindoc::cli {

// Help text
void print_usage(std::ostream& out);
void print_version(std::ostream& out);

} // namespace odindoc::cli
