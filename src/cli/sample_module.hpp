//! # Sample Module
//!
//! A small program assembled through OpBuilder, the way a frontend backend
//! would: a function adding a constant bias to a tensor, a function choosing
//! between two values with a conditional branch, and a caller.

#ifndef IRT_CLI_SAMPLE_MODULE_HPP
#define IRT_CLI_SAMPLE_MODULE_HPP

#include "ir/ir.hpp"

namespace irt::cli {

/// Builds the sample module. `file` is recorded in every operation location.
auto build_sample_module(const std::string& file = "sample.irt") -> ir::Module;

} // namespace irt::cli

#endif // IRT_CLI_SAMPLE_MODULE_HPP
