//! # Symbol Table Collection
//!
//! Depth-first walk gathering `sym_name` definitions.

#include "ir/symbol_table.hpp"

#include "log/log.hpp"

namespace irt::ir {

auto SymbolTable::insert(const std::string& name, const Operation* op) -> bool {
    return symbols_.try_emplace(name, op).second;
}

auto SymbolTable::lookup(const std::string& name) const -> const Operation* {
    auto it = symbols_.find(name);
    return it == symbols_.end() ? nullptr : it->second;
}

auto collect_symbols(const Module& module) -> SymbolTable {
    SymbolTable table;

    for (const auto& top : module.ops) {
        walk_operation(top, [&table](const Operation& op) {
            const IrAttr* attr = op.find_attr("sym_name");
            if (attr == nullptr) {
                return;
            }
            const auto* name = std::get_if<StringAttr>(&attr->kind);
            if (name == nullptr) {
                IRT_LOG_DEBUG("symbols", "Ignoring non-string sym_name on " << op.name);
                return;
            }
            if (!table.insert(name->value, &op)) {
                IRT_LOG_WARN("symbols", "Duplicate symbol @" << name->value << " defined by "
                                                             << op.name << " (" << op.id << ")");
            }
        });
    }

    IRT_LOG_DEBUG("symbols", "Collected " << table.size() << " symbols");
    return table;
}

} // namespace irt::ir
