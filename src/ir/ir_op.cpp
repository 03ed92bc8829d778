//! # IR Structure Implementation
//!
//! Lookup helpers and direct constructors for operations, blocks and regions.

#include "ir/ir.hpp"

namespace irt::ir {

auto Operation::find_attr(const std::string& key) const -> const IrAttr* {
    auto it = attrs.find(key);
    if (it == attrs.end()) {
        return nullptr;
    }
    return &it->second;
}

auto Region::find_block(const std::string& label) const -> const Block* {
    if (label == ENTRY_BLOCK_LABEL) {
        return &entry;
    }
    for (const auto& [name, block] : blocks) {
        if (name == label) {
            return &block;
        }
    }
    return nullptr;
}

auto make_op(std::string name, std::string id) -> Operation {
    Operation op;
    op.name = std::move(name);
    op.id = std::move(id);
    return op;
}

auto make_block(Operation terminator, std::vector<Operation> body, std::vector<NamedValue> args)
    -> Block {
    Block block;
    block.args = std::move(args);
    block.body = std::move(body);
    block.terminator = std::move(terminator);
    return block;
}

auto make_region(Block entry, std::vector<std::pair<std::string, Block>> blocks) -> Region {
    Region region;
    region.entry = std::move(entry);
    region.blocks = std::move(blocks);
    return region;
}

} // namespace irt::ir
