//! # IRT Command-Line Driver
//!
//! Entry point of the `irt` tool.
//!
//! ```bash
//! irt sample                         # print the sample module to stdout
//! irt sample -o out.mlir --verify    # verify, then write to a file
//! irt sample --emit-locations -vv    # include loc(...) and debug logging
//! ```

#ifndef IRT_CLI_DRIVER_HPP
#define IRT_CLI_DRIVER_HPP

#include "common.hpp"

#include <string>
#include <vector>

namespace irt::cli {

/// Options of the `sample` command.
struct DriverOptions {
    std::string command;
    std::string output_path; ///< Empty = stdout
    bool emit_locations = false;
    bool verify = false;
};

/// Parses argv (logging flags are skipped; see log::parse_log_options).
auto parse_driver_options(const std::vector<std::string>& args) -> Result<DriverOptions>;

/// Writes `text` to `path`, returning the number of bytes written.
auto write_output(const std::string& path, const std::string& text) -> Result<size_t>;

} // namespace irt::cli

/// Runs the tool and returns the process exit code.
int irt_main(int argc, char* argv[]);

#endif // IRT_CLI_DRIVER_HPP
