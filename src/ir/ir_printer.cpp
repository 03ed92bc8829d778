//! # IR Pretty Printer
//!
//! Renders the IR model in MLIR's generic operation syntax.
//!
//! ## Output Format
//!
//! ```text
//! module {
//!   "func.func"() ({
//!       ^bb0(%a: i32, %b: i32):
//!       %0 = "arith.addi"(%a, %b) : (i32, i32) -> i32
//!       "func.return"(%0) : (i32) -> ()
//!   }) {function_type = (i32, i32) -> (i32), sym_name = "add"} : () -> ()
//! }
//! ```
//!
//! Block label lines share the indentation of the block's operations. A
//! labelled block always carries an argument list, `^exit():` when empty.
//!
//! ## SSA Environment
//!
//! Operand types are not stored on operations; they are recovered from an
//! `SsaEnv` that maps value names to types. A block starts from its own
//! arguments, each body operation sees the results of the operations before
//! it, and the terminator sees the whole body. Nothing flows across block or
//! region boundaries, so an operand defined outside the current block renders
//! as an empty type segment.

#include "ir/ir_printer.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace irt::ir {

// Joins rendered items with `sep`
template <typename Range, typename Fn>
static auto join(const Range& items, const char* sep, Fn&& render) -> std::string {
    std::ostringstream out;
    bool first = true;
    for (const auto& item : items) {
        if (!first)
            out << sep;
        first = false;
        out << render(item);
    }
    return out.str();
}

static auto escape_string(const std::string& s) -> std::string {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        default:
            out += c;
        }
    }
    return out;
}

// ============================================================================
// Environment
// ============================================================================

auto bind_results(SsaEnv env, const Operation& op) -> SsaEnv {
    for (const auto& result : op.results) {
        env.insert_or_assign(result.name, result.type);
    }
    return env;
}

auto block_entry_env(const Block& block) -> SsaEnv {
    SsaEnv env;
    for (const auto& arg : block.args) {
        env.insert_or_assign(arg.name, arg.type);
    }
    return env;
}

// ============================================================================
// IrPrinter
// ============================================================================

IrPrinter::IrPrinter(PrintOptions options) : options_(options) {}

auto IrPrinter::indent(int level) -> std::string {
    return std::string(static_cast<size_t>(std::max(level, 0)) * 2, ' ');
}

auto IrPrinter::format_float(double value) -> std::string {
    std::ostringstream out;
    out << std::fixed << std::setprecision(6);
    if (value < 0) {
        out << '-' << -value;
    } else {
        // -0.0 is not negative and prints without a sign
        out << (value == 0.0 ? 0.0 : value);
    }
    return out.str();
}

auto IrPrinter::print_module(const Module& module) -> std::string {
    IRT_LOG_DEBUG("printer", "Printing module with " << module.ops.size() << " operations");

    std::ostringstream out;
    out << "module {\n";

    // Top-level operations are threaded like the body of a block.
    SsaEnv env;
    for (const auto& op : module.ops) {
        out << print_operation(op, env, 1);
        env = bind_results(std::move(env), op);
    }

    out << "}" << print_location(module.loc) << "\n";
    return out.str();
}

auto IrPrinter::print_operation(const Operation& op, const SsaEnv& env, int level)
    -> std::string {
    std::ostringstream out;
    out << indent(level);

    if (!op.results.empty()) {
        out << join(op.results, ", ", [](const NamedValue& r) { return r.name; }) << " = ";
    }

    out << "\"" << op.name << "\"(";
    out << join(op.operands, ", ", [](const std::string& name) { return name; });
    out << ")";

    if (!op.regions.empty()) {
        out << " ({\n";
        for (size_t i = 0; i < op.regions.size(); ++i) {
            if (i > 0) {
                out << indent(level) << "}, {\n";
            }
            out << print_region(op.regions[i], level + 2);
        }
        out << indent(level) << "})";
    }

    if (!op.attrs.empty()) {
        out << " " << print_attr_dict(op.attrs);
    }

    out << " : (";
    out << join(op.operands, ", ", [this, &env, &op](const std::string& name) -> std::string {
        auto it = env.find(name);
        if (it == env.end()) {
            IRT_LOG_TRACE("printer", "Operand " << name << " of " << op.name
                                                << " has no type in scope");
            return "";
        }
        return print_type(it->second);
    });
    out << ") -> ";

    if (op.results.size() == 1) {
        out << print_type(op.results[0].type);
    } else {
        out << "(" << join(op.results, ", ", [this](const NamedValue& r) {
            return print_type(r.type);
        }) << ")";
    }

    if (!op.successors.empty()) {
        out << " ["
            << join(op.successors, ", ", [](const std::string& label) { return "^" + label; })
            << "]";
    }

    out << print_location(op.loc) << "\n";
    return out.str();
}

auto IrPrinter::print_block(const std::string& label, const Block& block, int level)
    -> std::string {
    std::ostringstream out;

    // Only an argument-less bb0 goes without a label line.
    bool implicit_entry = label == ENTRY_BLOCK_LABEL && block.args.empty();
    if (!implicit_entry) {
        out << indent(level) << "^" << label << "("
            << join(block.args, ", ",
                    [this](const NamedValue& arg) {
                        return arg.name + ": " + print_type(arg.type);
                    })
            << "):\n";
    }

    SsaEnv env = block_entry_env(block);
    for (const auto& op : block.body) {
        out << print_operation(op, env, level);
        env = bind_results(std::move(env), op);
    }
    out << print_operation(block.terminator, env, level);

    return out.str();
}

auto IrPrinter::print_region(const Region& region, int level) -> std::string {
    std::string out = print_block(ENTRY_BLOCK_LABEL, region.entry, level);
    for (const auto& [label, block] : region.blocks) {
        out += print_block(label, block, level);
    }
    return out;
}

auto IrPrinter::print_location(const SourceSpan& loc) -> std::string {
    if (!options_.emit_locations || loc.is_unknown()) {
        return "";
    }
    std::ostringstream out;
    out << " loc(\"" << escape_string(loc.file) << "\":" << loc.start.row << ":"
        << loc.start.column << ")";
    return out.str();
}

// ============================================================================
// Attributes
// ============================================================================

auto IrPrinter::print_attr_entries(const std::vector<std::string>& keys, const AttrMap& attrs)
    -> std::string {
    return join(keys, ", ", [this, &attrs](const std::string& key) {
        auto it = attrs.find(key);
        if (it == attrs.end()) {
            return key + " = <missing>";
        }
        return key + " = " + print_attr(it->second);
    });
}

auto IrPrinter::print_attr_dict(const AttrMap& attrs) -> std::string {
    std::vector<std::string> keys;
    keys.reserve(attrs.size());
    for (const auto& [key, _] : attrs) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());

    std::string entries = print_attr_entries(keys, attrs);

    // A callee entry marks the dictionary as inherent properties.
    if (attrs.count("callee") > 0) {
        return "<{" + entries + "}>";
    }
    return "{" + entries + "}";
}

auto IrPrinter::print_dense_payload(const DenseElements& payload) -> std::string {
    if (const auto* scalar = std::get_if<double>(&payload.value)) {
        return format_float(*scalar);
    }
    const auto& elements = std::get<std::vector<DenseElements>>(payload.value);
    return "[" +
           join(elements, ", ",
                [this](const DenseElements& e) { return print_dense_payload(e); }) +
           "]";
}

auto IrPrinter::print_attr(const IrAttr& attr) -> std::string {
    std::ostringstream out;

    std::visit(
        [&out, this](const auto& a) {
            using T = std::decay_t<decltype(a)>;

            if constexpr (std::is_same_v<T, StringAttr>) {
                out << "\"" << escape_string(a.value) << "\"";
            } else if constexpr (std::is_same_v<T, BoolAttr>) {
                out << (a.value ? "true" : "false");
            } else if constexpr (std::is_same_v<T, IntAttr>) {
                out << a.value;
                if (a.type) {
                    out << " : " << print_type(a.type);
                }
            } else if constexpr (std::is_same_v<T, FloatAttr>) {
                out << format_float(a.value);
                if (a.type) {
                    out << " : " << print_type(a.type);
                }
            } else if constexpr (std::is_same_v<T, TypeAttr>) {
                out << print_type(a.type);
            } else if constexpr (std::is_same_v<T, ArrayAttr>) {
                out << "["
                    << join(a.elements, ", ", [this](const IrAttr& e) { return print_attr(e); })
                    << "]";
            } else if constexpr (std::is_same_v<T, DenseAttr>) {
                std::vector<Dim> dims;
                dims.reserve(a.shape.size());
                for (uint64_t extent : a.shape) {
                    dims.push_back(Dim::fixed(extent));
                }
                out << "dense<" << print_dense_payload(a.payload) << "> : tensor<"
                    << print_dims(dims, a.element_type) << ">";
            } else if constexpr (std::is_same_v<T, SymbolRefAttr>) {
                out << "@" << a.name;
            } else if constexpr (std::is_same_v<T, VisibilityAttr>) {
                out << "\"" << visibility_name(a.visibility) << "\"";
            } else if constexpr (std::is_same_v<T, UnitAttr>) {
                out << "unit";
            } else if constexpr (std::is_same_v<T, CustomAttr>) {
                out << (a.ext ? a.ext->render() : "<null>");
            }
        },
        attr.kind);

    return out.str();
}

// ============================================================================
// Types
// ============================================================================

auto IrPrinter::print_dims(const std::vector<Dim>& dims, const IrTypePtr& element)
    -> std::string {
    std::ostringstream out;
    for (const auto& dim : dims) {
        if (dim.is_dynamic()) {
            out << "*";
        } else {
            out << *dim.extent;
        }
        out << "x";
    }
    out << print_type(element);
    return out.str();
}

auto IrPrinter::print_type_list(const std::vector<IrTypePtr>& types) -> std::string {
    return join(types, ", ", [this](const IrTypePtr& t) { return print_type(t); });
}

auto IrPrinter::print_type(const IrTypePtr& type) -> std::string {
    if (!type)
        return "<null>";

    std::ostringstream out;

    std::visit(
        [&out, this](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, IntegerType>) {
                out << "i" << static_cast<int>(t.width);
            } else if constexpr (std::is_same_v<T, FloatType>) {
                out << "f" << static_cast<int>(t.width);
            } else if constexpr (std::is_same_v<T, IndexType>) {
                out << "index";
            } else if constexpr (std::is_same_v<T, MemRefType>) {
                out << "memref<" << print_dims(t.dims, t.element) << ">";
            } else if constexpr (std::is_same_v<T, StructType>) {
                out << "struct<" << print_type_list(t.fields) << ">";
            } else if constexpr (std::is_same_v<T, NamedType>) {
                out << "!" << t.name;
            } else if constexpr (std::is_same_v<T, FunctionType>) {
                out << "(" << print_type_list(t.inputs) << ") -> (" << print_type_list(t.results)
                    << ")";
            } else if constexpr (std::is_same_v<T, RankedTensorType>) {
                out << "tensor<" << print_dims(t.dims, t.element) << ">";
            } else if constexpr (std::is_same_v<T, UnrankedTensorType>) {
                out << "tensor<*x" << print_type(t.element) << ">";
            } else if constexpr (std::is_same_v<T, CustomType>) {
                out << (t.ext ? t.ext->render() : "<null>");
            }
        },
        type->kind);

    return out.str();
}

} // namespace irt::ir
