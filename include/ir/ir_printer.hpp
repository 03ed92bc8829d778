// IR Pretty Printer - renders a Module in MLIR's generic operation syntax
//
//     module {
//       %0 = "arith.constant"() {value = 42} : () -> i32
//       "func.return"(%0) : (i32) -> ()
//     }
//
// Printing is total: malformed input (unknown operands, payloads that
// disagree with their shape) renders as best-effort text instead of failing.

#pragma once

#include "ir/ir.hpp"

#include <map>
#include <string>
#include <vector>

namespace irt::ir {

// Types of the SSA values visible at a point in a block. Threaded by value:
// printing never mutates an environment it was given.
using SsaEnv = std::map<std::string, IrTypePtr>;

struct PrintOptions {
    // Emit loc(...) suffixes for known locations. Off by default, which
    // leaves every location suffix empty.
    bool emit_locations = false;
};

class IrPrinter {
public:
    explicit IrPrinter(PrintOptions options = {});

    auto print_module(const Module& module) -> std::string;
    auto print_operation(const Operation& op, const SsaEnv& env, int level) -> std::string;
    auto print_block(const std::string& label, const Block& block, int level) -> std::string;
    auto print_region(const Region& region, int level) -> std::string;
    auto print_type(const IrTypePtr& type) -> std::string;
    auto print_attr(const IrAttr& attr) -> std::string;
    auto print_attr_dict(const AttrMap& attrs) -> std::string;
    auto print_location(const SourceSpan& loc) -> std::string;

    // Renders `key = value` for each key in order, joined by ", ". A key that
    // is not in `attrs` renders as `key = <missing>`.
    auto print_attr_entries(const std::vector<std::string>& keys, const AttrMap& attrs)
        -> std::string;

    static auto indent(int level) -> std::string;
    static auto format_float(double value) -> std::string;

private:
    PrintOptions options_;

    auto print_dims(const std::vector<Dim>& dims, const IrTypePtr& element) -> std::string;
    auto print_type_list(const std::vector<IrTypePtr>& types) -> std::string;
    auto print_dense_payload(const DenseElements& payload) -> std::string;
};

// Binds the results of `op` on top of `env` and returns the new environment.
auto bind_results(SsaEnv env, const Operation& op) -> SsaEnv;

// Environment a block starts from: its own arguments and nothing else.
auto block_entry_env(const Block& block) -> SsaEnv;

// Convenience free functions
inline auto print_module(const Module& module, PrintOptions options = {}) -> std::string {
    IrPrinter printer(options);
    return printer.print_module(module);
}

inline auto print_type(const IrTypePtr& type) -> std::string {
    IrPrinter printer;
    return printer.print_type(type);
}

inline auto print_attr(const IrAttr& attr) -> std::string {
    IrPrinter printer;
    return printer.print_attr(attr);
}

} // namespace irt::ir
