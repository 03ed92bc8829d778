// IR Verifier - opt-in structural checks
//
// The printer accepts any model; callers that want diagnostics before
// emitting text run verify_module() first. Scoping follows the printer: a
// block sees its own arguments and the results defined earlier in it.

#pragma once

#include "common.hpp"
#include "ir/ir.hpp"
#include "ir/symbol_table.hpp"

#include <string>
#include <vector>

namespace irt::ir {

struct VerifyError {
    std::string op_name;
    std::string op_id;
    std::string message;
    SourceSpan loc;
};

// Returns the module's symbol table when no check fails, or every
// diagnostic found otherwise.
auto verify_module(const Module& module) -> Result<SymbolTable, std::vector<VerifyError>>;

// "op_name (op_id): message", prefixed with file:row:col when known
auto format_verify_error(const VerifyError& error) -> std::string;

} // namespace irt::ir
