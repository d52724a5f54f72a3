//! # CLI Dispatcher
//!
//! ```text
//! odindoc_main()
//!   ├─ (no args), --help, -h  → print_usage()
//!   ├─ --version, -v          → print_version()
//!   ├─ --root, -r             → run_root()
//!   └─ <target>               → run_doc()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                        |
//! |------|------------------------------------------------|
//! | 0    | Report printed (including not-found messages)  |
//! | 1    | Unexpected internal error                      |

#include "commands/cmd_doc.hpp"
#include "driver.hpp"
#include "log/log.hpp"

#include <exception>
#include <iostream>

int odindoc_main(int argc, char* argv[]) {
    using namespace odindoc;

    log::Logger::init(log::parse_log_options(argc, argv));

    try {
        auto options = cli::parse_doc_args(argc, argv);
        ODINDOC_LOG_DEBUG("cli", "mode=" << static_cast<int>(options.mode) << " target='"
                                         << options.target.package_ref << "'");

        int code = cli::run_doc(options, toolchain::RootSearchConfig::from_environment(),
                                std::cout);
        std::cout.flush();
        log::Logger::instance().flush();
        return code;
    } catch (const std::exception& e) {
        ODINDOC_LOG_ERROR("cli", "internal error: " << e.what());
        log::Logger::instance().flush();
        return 1;
    }
}
