//! # IR Verifier
//!
//! Structural checks over a Module. Checks are independent of dialects:
//!
//! | Check               | Diagnostic                                    |
//! |---------------------|-----------------------------------------------|
//! | Operand scoping     | operand is not defined in the enclosing block |
//! | SSA uniqueness      | value name bound twice in one block           |
//! | Terminator flags    | body op marked terminator, or the reverse     |
//! | Successors          | label not found in the enclosing region       |
//! | Dense literals      | payload nesting disagrees with the shape      |
//! | Symbols             | non-string or duplicate `sym_name`            |

#include "ir/ir_verify.hpp"

#include "ir/ir_printer.hpp"
#include "log/log.hpp"

#include <map>
#include <set>
#include <sstream>

namespace irt::ir {

namespace {

// A scalar payload is accepted for any shape (splat).
auto dense_matches_shape(const DenseElements& payload, const std::vector<uint64_t>& shape,
                         size_t dim) -> bool {
    if (payload.is_scalar()) {
        return dim == shape.size() || dim == 0;
    }
    if (dim == shape.size()) {
        return false;
    }
    const auto& elements = std::get<std::vector<DenseElements>>(payload.value);
    if (elements.size() != shape[dim]) {
        return false;
    }
    for (const auto& element : elements) {
        if (!dense_matches_shape(element, shape, dim + 1)) {
            return false;
        }
    }
    return true;
}

auto shape_string(const std::vector<uint64_t>& shape) -> std::string {
    std::ostringstream out;
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0)
            out << "x";
        out << shape[i];
    }
    return out.str();
}

class Verifier {
public:
    auto run(const Module& module) -> std::vector<VerifyError> {
        SsaEnv env;
        std::set<std::string> defined;
        for (const auto& op : module.ops) {
            check_op(op, env, nullptr, false);
            define_results(op, defined);
            env = bind_results(std::move(env), op);
        }
        check_symbols(module);
        return std::move(errors_);
    }

private:
    std::vector<VerifyError> errors_;

    void report(const Operation& op, std::string message) {
        IRT_LOG_DEBUG("verify", op.name << " (" << op.id << "): " << message);
        errors_.push_back(VerifyError{op.name, op.id, std::move(message), op.loc});
    }

    void define_results(const Operation& op, std::set<std::string>& defined) {
        for (const auto& result : op.results) {
            if (!defined.insert(result.name).second) {
                report(op, "redefinition of value " + result.name);
            }
        }
    }

    void check_op(const Operation& op, const SsaEnv& env, const Region* region,
                  bool terminator_position) {
        for (const auto& operand : op.operands) {
            if (env.find(operand) == env.end()) {
                report(op, "operand " + operand + " is not defined in the enclosing block");
            }
        }

        if (terminator_position && !op.is_terminator) {
            report(op, "block terminator is not marked as a terminator");
        } else if (!terminator_position && op.is_terminator) {
            report(op, "terminator appears before the end of its block");
        }

        for (const auto& label : op.successors) {
            if (region == nullptr) {
                report(op, "successor ^" + label + " used outside of a region");
            } else if (!region->has_block(label)) {
                report(op, "successor ^" + label + " does not name a block of the region");
            }
        }

        for (const auto& [key, attr] : op.attrs) {
            check_attr(op, key, attr);
        }

        for (const auto& nested : op.regions) {
            check_region(nested);
        }
    }

    void check_attr(const Operation& op, const std::string& key, const IrAttr& attr) {
        if (key == "sym_name" && !std::holds_alternative<StringAttr>(attr.kind)) {
            report(op, "sym_name must be a string attribute");
        }
        if (const auto* dense = std::get_if<DenseAttr>(&attr.kind)) {
            if (!dense_matches_shape(dense->payload, dense->shape, 0)) {
                report(op, "dense literal '" + key + "' does not match shape " +
                               shape_string(dense->shape));
            }
        } else if (const auto* array = std::get_if<ArrayAttr>(&attr.kind)) {
            for (const auto& element : array->elements) {
                check_attr(op, key, element);
            }
        }
    }

    void check_region(const Region& region) {
        std::set<std::string> labels{ENTRY_BLOCK_LABEL};
        for (const auto& [label, block] : region.blocks) {
            if (!labels.insert(label).second) {
                report(block.terminator, "duplicate block label ^" + label);
            }
        }

        check_block(region.entry, region);
        for (const auto& [_, block] : region.blocks) {
            check_block(block, region);
        }
    }

    void check_block(const Block& block, const Region& region) {
        std::set<std::string> defined;
        for (const auto& arg : block.args) {
            if (!defined.insert(arg.name).second) {
                report(block.terminator, "duplicate block argument " + arg.name);
            }
        }

        SsaEnv env = block_entry_env(block);
        for (const auto& op : block.body) {
            check_op(op, env, &region, false);
            define_results(op, defined);
            env = bind_results(std::move(env), op);
        }
        check_op(block.terminator, env, &region, true);
    }

    void check_symbols(const Module& module) {
        std::map<std::string, int> seen;
        for (const auto& top : module.ops) {
            walk_operation(top, [this, &seen](const Operation& op) {
                const IrAttr* attr = op.find_attr("sym_name");
                if (attr == nullptr) {
                    return;
                }
                if (const auto* name = std::get_if<StringAttr>(&attr->kind)) {
                    if (++seen[name->value] == 2) {
                        report(op, "duplicate symbol @" + name->value);
                    }
                }
            });
        }
    }
};

} // namespace

auto verify_module(const Module& module) -> Result<SymbolTable, std::vector<VerifyError>> {
    Verifier verifier;
    auto errors = verifier.run(module);
    if (!errors.empty()) {
        IRT_LOG_INFO("verify", "Module failed verification with " << errors.size() << " errors");
        return errors;
    }
    return collect_symbols(module);
}

auto format_verify_error(const VerifyError& error) -> std::string {
    std::ostringstream out;
    if (!error.loc.is_unknown()) {
        out << error.loc.file << ":" << error.loc.start.row << ":" << error.loc.start.column
            << ": ";
    }
    out << error.op_name << " (" << error.op_id << "): " << error.message;
    return out.str();
}

} // namespace irt::ir
