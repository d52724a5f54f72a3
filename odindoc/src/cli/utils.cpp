#include "utils.hpp"

#include "commands/cmd_doc.hpp"
#include "common.hpp"

namespace odindoc::cli {

void print_usage(std::ostream& out) {
    out << "odindoc " << VERSION << " - API documentation for Odin packages\n";
    print_doc_help(out);
}

void print_version(std::ostream& out) {
    out << "odindoc " << VERSION << "\n";
}

} // namespace odindoc::cli
