// Symbol Table - maps sym_name attributes to their defining operations
//
// The generic printer never consults symbols; the table serves symbol-aware
// consumers such as the verifier.

#pragma once

#include "ir/ir.hpp"

#include <map>
#include <string>

namespace irt::ir {

class SymbolTable {
public:
    // Records `op` as the definition of `name` unless one already exists.
    // Returns false for a duplicate.
    auto insert(const std::string& name, const Operation* op) -> bool;

    // Defining operation of `name`, or nullptr
    [[nodiscard]] auto lookup(const std::string& name) const -> const Operation*;

    [[nodiscard]] auto size() const -> size_t {
        return symbols_.size();
    }
    [[nodiscard]] auto empty() const -> bool {
        return symbols_.empty();
    }
    [[nodiscard]] auto symbols() const -> const std::map<std::string, const Operation*>& {
        return symbols_;
    }

private:
    // Non-owning; valid while the module that was walked is alive
    std::map<std::string, const Operation*> symbols_;
};

// Collects every operation carrying a string `sym_name` attribute, depth-first
// through all regions, block bodies and terminators. The first definition of a
// name wins.
auto collect_symbols(const Module& module) -> SymbolTable;

// Invokes `fn` on `op` and, depth-first, on every operation nested in it.
template <typename Fn> void walk_operation(const Operation& op, Fn&& fn) {
    fn(op);
    for (const auto& region : op.regions) {
        auto walk_block = [&fn](const Block& block) {
            for (const auto& nested : block.body) {
                walk_operation(nested, fn);
            }
            walk_operation(block.terminator, fn);
        };
        walk_block(region.entry);
        for (const auto& [_, block] : region.blocks) {
            walk_block(block);
        }
    }
}

} // namespace irt::ir
