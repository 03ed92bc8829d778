//! # IRT Command-Line Driver
//!
//! ## Return Codes
//!
//! | Code | Meaning                                        |
//! |------|------------------------------------------------|
//! | 0    | Success                                        |
//! | 1    | Usage error, verification failure or I/O error |

#include "driver.hpp"

#include "ir/ir_printer.hpp"
#include "ir/ir_verify.hpp"
#include "log/log.hpp"
#include "sample_module.hpp"

#include <fstream>
#include <iostream>

namespace irt::cli {

static void print_usage() {
    std::cout << "Usage: irt <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  sample              Print the built-in sample module\n"
              << "\n"
              << "Options:\n"
              << "  -o <file>           Write output to <file> instead of stdout\n"
              << "  --emit-locations    Append loc(...) to operations\n"
              << "  --verify            Verify the module before printing\n"
              << "  --log-level=<lvl>   trace, debug, info, warn, error, off\n"
              << "  --log-filter=<spec> e.g. printer=trace,*=warn\n"
              << "  --log-file=<path>   Also write log records to <path>\n"
              << "  -v, -vv, -vvv, -q   Adjust log verbosity\n"
              << "  -h, --help          Show this message\n"
              << "  -V, --version       Show the version\n";
}

// Help and version are spelled as flags but select a command.
static bool is_command_flag(const std::string& arg) {
    return arg == "-h" || arg == "--help" || arg == "-V" || arg == "--version";
}

auto parse_driver_options(const std::vector<std::string>& args) -> Result<DriverOptions> {
    DriverOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg == "-o") {
            if (i + 1 >= args.size()) {
                return std::string("-o requires a file name");
            }
            options.output_path = args[++i];
        } else if (arg == "--emit-locations") {
            options.emit_locations = true;
        } else if (arg == "--verify") {
            options.verify = true;
        } else if (!arg.empty() && arg[0] == '-' && !is_command_flag(arg)) {
            return "unknown option: " + arg;
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            // One command per invocation: `sample -V` is rejected.
            return "unexpected argument: " + arg;
        }
    }

    return options;
}

auto write_output(const std::string& path, const std::string& text) -> Result<size_t> {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        return "cannot open " + path + " for writing";
    }
    out << text;
    out.flush();
    if (!out) {
        return "failed to write " + path;
    }
    return text.size();
}

static int run_sample(const DriverOptions& options) {
    ir::Module module = build_sample_module();

    if (options.verify) {
        auto result = ir::verify_module(module);
        if (is_err(result)) {
            for (const auto& error : unwrap_err(result)) {
                IRT_LOG_ERROR("cli", ir::format_verify_error(error));
            }
            return 1;
        }
        IRT_LOG_INFO("cli", "Verified module, " << unwrap(result).size() << " symbols");
    }

    ir::PrintOptions print_options;
    print_options.emit_locations = options.emit_locations;
    std::string text = ir::print_module(module, print_options);

    if (options.output_path.empty()) {
        std::cout << text;
        return 0;
    }

    auto written = write_output(options.output_path, text);
    if (is_err(written)) {
        IRT_LOG_ERROR("cli", unwrap_err(written));
        return 1;
    }
    IRT_LOG_INFO("cli", "Wrote " << unwrap(written) << " bytes to " << options.output_path);
    return 0;
}

} // namespace irt::cli

int irt_main(int argc, char* argv[]) {
    using namespace irt;

    irt::log::Logger::init(irt::log::parse_log_options(argc, argv));

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = cli::parse_driver_options(args);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n";
        return 1;
    }
    const auto& options = unwrap(parsed);

    int code = 1;
    if (options.command.empty() || options.command == "-h" || options.command == "--help") {
        cli::print_usage();
        code = 0;
    } else if (options.command == "-V" || options.command == "--version") {
        std::cout << "irt " << VERSION << "\n";
        code = 0;
    } else if (options.command == "sample") {
        code = cli::run_sample(options);
    } else {
        std::cerr << "error: unknown command: " << options.command << "\n";
    }

    irt::log::Logger::instance().flush();
    return code;
}
