// IRT IR Model - in-memory form of a generic MLIR program
//
// The model mirrors the structure of MLIR's generic operation syntax:
// a Module owns Operations, an Operation owns Regions, a Region owns Blocks
// and a Block owns its body Operations plus one terminator.
//
// Design goals:
// 1. Pure data - every node is a value, built once and then only read
// 2. Closed catalogs of types and attributes, each with one extension hook
// 3. Structural typing - types compare and print by shape, not identity
// 4. Operands refer to results by name; no use-def pointers

#pragma once

#include "common.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace irt::ir {

// ============================================================================
// IR Types
// ============================================================================

struct IrType;
using IrTypePtr = Rc<IrType>;

enum class IntWidth { I1 = 1, I8 = 8, I16 = 16, I32 = 32, I64 = 64 };

enum class FloatWidth { F32 = 32, F64 = 64 };

// A tensor or memref extent: static and non-negative, or dynamic
struct Dim {
    std::optional<uint64_t> extent; // nullopt = dynamic

    [[nodiscard]] auto is_dynamic() const -> bool {
        return !extent.has_value();
    }

    [[nodiscard]] static auto fixed(uint64_t n) -> Dim {
        return Dim{n};
    }
    [[nodiscard]] static auto dynamic() -> Dim {
        return Dim{std::nullopt};
    }

    [[nodiscard]] auto operator==(const Dim& other) const -> bool = default;
};

/// Hook for type kinds outside the built-in catalog.
///
/// Implementations render their own syntax; the printer emits `render()`
/// verbatim wherever the type appears.
class TypeExtension {
public:
    virtual ~TypeExtension() = default;

    [[nodiscard]] virtual auto render() const -> std::string = 0;
};

struct IntegerType {
    IntWidth width;
};

struct FloatType {
    FloatWidth width;
};

struct IndexType {};

struct MemRefType {
    std::vector<Dim> dims;
    IrTypePtr element;
};

struct StructType {
    std::vector<IrTypePtr> fields;
};

// Opaque dialect type referenced by name, printed as !name
struct NamedType {
    std::string name;
};

struct FunctionType {
    std::vector<IrTypePtr> inputs;
    std::vector<IrTypePtr> results;
};

struct RankedTensorType {
    std::vector<Dim> dims;
    IrTypePtr element;
};

struct UnrankedTensorType {
    IrTypePtr element;
};

struct CustomType {
    std::shared_ptr<const TypeExtension> ext;
};

struct IrType {
    std::variant<IntegerType, FloatType, IndexType, MemRefType, StructType, NamedType,
                 FunctionType, RankedTensorType, UnrankedTensorType, CustomType>
        kind;

    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<IntegerType>(kind);
    }
    [[nodiscard]] auto is_float() const -> bool {
        return std::holds_alternative<FloatType>(kind);
    }
    [[nodiscard]] auto is_shaped() const -> bool {
        return std::holds_alternative<MemRefType>(kind) ||
               std::holds_alternative<RankedTensorType>(kind) ||
               std::holds_alternative<UnrankedTensorType>(kind);
    }
};

// Type constructors
auto make_int_type(IntWidth width) -> IrTypePtr;
auto make_i1_type() -> IrTypePtr;
auto make_i8_type() -> IrTypePtr;
auto make_i16_type() -> IrTypePtr;
auto make_i32_type() -> IrTypePtr;
auto make_i64_type() -> IrTypePtr;
auto make_float_type(FloatWidth width) -> IrTypePtr;
auto make_f32_type() -> IrTypePtr;
auto make_f64_type() -> IrTypePtr;
auto make_index_type() -> IrTypePtr;
auto make_memref_type(std::vector<Dim> dims, IrTypePtr element) -> IrTypePtr;
auto make_struct_type(std::vector<IrTypePtr> fields) -> IrTypePtr;
auto make_named_type(const std::string& name) -> IrTypePtr;
auto make_function_type(std::vector<IrTypePtr> inputs, std::vector<IrTypePtr> results)
    -> IrTypePtr;
auto make_tensor_type(std::vector<Dim> dims, IrTypePtr element) -> IrTypePtr;
auto make_unranked_tensor_type(IrTypePtr element) -> IrTypePtr;
auto make_custom_type(std::shared_ptr<const TypeExtension> ext) -> IrTypePtr;

// Structural equality. Null pointers are equal only to each other;
// custom types are equal when their rendered text matches.
auto types_equal(const IrTypePtr& a, const IrTypePtr& b) -> bool;

// ============================================================================
// IR Attributes
// ============================================================================

struct IrAttr;

/// Hook for attribute kinds outside the built-in catalog.
class AttrExtension {
public:
    virtual ~AttrExtension() = default;

    [[nodiscard]] virtual auto render() const -> std::string = 0;
};

enum class Visibility { Public, Private, Nested };

// Payload of a dense literal: a scalar, or a nested list of payloads
struct DenseElements {
    std::variant<double, std::vector<DenseElements>> value;

    [[nodiscard]] auto is_scalar() const -> bool {
        return std::holds_alternative<double>(value);
    }
};

struct StringAttr {
    std::string value;
};

struct BoolAttr {
    bool value;
};

struct IntAttr {
    IrTypePtr type; // null = untyped
    int64_t value;
};

struct FloatAttr {
    IrTypePtr type; // null = untyped
    double value;
};

struct TypeAttr {
    IrTypePtr type;
};

struct ArrayAttr {
    IrTypePtr element_type; // null = untyped
    std::vector<IrAttr> elements;
};

// dense<payload> : tensor<shape x element_type>
// The shape is not checked against the payload nesting.
struct DenseAttr {
    std::vector<uint64_t> shape;
    IrTypePtr element_type;
    DenseElements payload;
};

struct SymbolRefAttr {
    std::string name;
};

struct VisibilityAttr {
    Visibility visibility;
};

struct UnitAttr {};

struct CustomAttr {
    std::shared_ptr<const AttrExtension> ext;
};

struct IrAttr {
    std::variant<StringAttr, BoolAttr, IntAttr, FloatAttr, TypeAttr, ArrayAttr, DenseAttr,
                 SymbolRefAttr, VisibilityAttr, UnitAttr, CustomAttr>
        kind;
};

// Attribute constructors
auto string_attr(std::string value) -> IrAttr;
auto bool_attr(bool value) -> IrAttr;
auto int_attr(int64_t value, IrTypePtr type = nullptr) -> IrAttr;
auto float_attr(double value, IrTypePtr type = nullptr) -> IrAttr;
auto type_attr(IrTypePtr type) -> IrAttr;
auto array_attr(std::vector<IrAttr> elements, IrTypePtr element_type = nullptr) -> IrAttr;
auto dense_attr(std::vector<uint64_t> shape, DenseElements payload,
                IrTypePtr element_type = nullptr) -> IrAttr;
auto symbol_ref_attr(std::string name) -> IrAttr;
auto visibility_attr(Visibility visibility) -> IrAttr;
auto unit_attr() -> IrAttr;
auto custom_attr(std::shared_ptr<const AttrExtension> ext) -> IrAttr;

// Dense payload constructors
auto dense_scalar(double value) -> DenseElements;
auto dense_list(std::vector<DenseElements> elements) -> DenseElements;
auto dense_vector(const std::vector<double>& values) -> DenseElements;

auto visibility_name(Visibility visibility) -> const char*;

// Attribute dictionary; printed in sorted key order
using AttrMap = std::unordered_map<std::string, IrAttr>;

// ============================================================================
// Operations, Blocks, Regions
// ============================================================================

struct Region;

// A (name, type) pair: an operation result or a block argument
struct NamedValue {
    std::string name;
    IrTypePtr type;
};

struct Operation {
    std::string name;                    // Dialect-qualified, e.g. "arith.addi"
    std::string id;                      // Unique handle chosen at build time
    std::vector<std::string> operands;   // Names of previously defined values
    std::vector<NamedValue> results;
    AttrMap attrs;
    std::vector<Region> regions;
    bool is_terminator = false;
    SourceSpan loc;
    std::vector<std::string> successors; // Block labels, for branch terminators

    // Returns the attribute stored under `key`, or nullptr
    [[nodiscard]] auto find_attr(const std::string& key) const -> const IrAttr*;
};

struct Block {
    std::vector<NamedValue> args;
    std::vector<Operation> body; // Non-terminator operations
    Operation terminator;
};

// Label of the implicit entry block of every region
constexpr const char* ENTRY_BLOCK_LABEL = "bb0";

struct Region {
    Block entry;
    std::vector<std::pair<std::string, Block>> blocks; // Additional blocks, in order

    [[nodiscard]] auto find_block(const std::string& label) const -> const Block*;
    [[nodiscard]] auto has_block(const std::string& label) const -> bool {
        return find_block(label) != nullptr;
    }
};

// ============================================================================
// Module
// ============================================================================

struct Module {
    std::vector<Operation> ops;
    SourceSpan loc;
};

// Convenience for direct construction
auto make_op(std::string name, std::string id) -> Operation;
auto make_block(Operation terminator, std::vector<Operation> body = {},
                std::vector<NamedValue> args = {}) -> Block;
auto make_region(Block entry, std::vector<std::pair<std::string, Block>> blocks = {}) -> Region;

} // namespace irt::ir
