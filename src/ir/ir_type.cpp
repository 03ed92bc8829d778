//! # IR Type Implementation
//!
//! Type constructors and structural type equality.
//!
//! ## Type Constructors
//!
//! - `make_i1_type()` through `make_i64_type()`, `make_int_type(width)`
//! - `make_f32_type()`, `make_f64_type()`, `make_index_type()`
//! - `make_memref_type()`, `make_tensor_type()`, `make_unranked_tensor_type()`
//! - `make_struct_type()`, `make_named_type()`, `make_function_type()`
//! - `make_custom_type()` for types outside the catalog

#include "ir/ir.hpp"

#include <type_traits>

namespace irt::ir {

// ============================================================================
// Type Constructors
// ============================================================================

auto make_int_type(IntWidth width) -> IrTypePtr {
    return make_rc<IrType>(IrType{IntegerType{width}});
}

auto make_i1_type() -> IrTypePtr {
    return make_int_type(IntWidth::I1);
}

auto make_i8_type() -> IrTypePtr {
    return make_int_type(IntWidth::I8);
}

auto make_i16_type() -> IrTypePtr {
    return make_int_type(IntWidth::I16);
}

auto make_i32_type() -> IrTypePtr {
    return make_int_type(IntWidth::I32);
}

auto make_i64_type() -> IrTypePtr {
    return make_int_type(IntWidth::I64);
}

auto make_float_type(FloatWidth width) -> IrTypePtr {
    return make_rc<IrType>(IrType{FloatType{width}});
}

auto make_f32_type() -> IrTypePtr {
    return make_float_type(FloatWidth::F32);
}

auto make_f64_type() -> IrTypePtr {
    return make_float_type(FloatWidth::F64);
}

auto make_index_type() -> IrTypePtr {
    return make_rc<IrType>(IrType{IndexType{}});
}

auto make_memref_type(std::vector<Dim> dims, IrTypePtr element) -> IrTypePtr {
    return make_rc<IrType>(IrType{MemRefType{std::move(dims), std::move(element)}});
}

auto make_struct_type(std::vector<IrTypePtr> fields) -> IrTypePtr {
    return make_rc<IrType>(IrType{StructType{std::move(fields)}});
}

auto make_named_type(const std::string& name) -> IrTypePtr {
    return make_rc<IrType>(IrType{NamedType{name}});
}

auto make_function_type(std::vector<IrTypePtr> inputs, std::vector<IrTypePtr> results)
    -> IrTypePtr {
    return make_rc<IrType>(IrType{FunctionType{std::move(inputs), std::move(results)}});
}

auto make_tensor_type(std::vector<Dim> dims, IrTypePtr element) -> IrTypePtr {
    return make_rc<IrType>(IrType{RankedTensorType{std::move(dims), std::move(element)}});
}

auto make_unranked_tensor_type(IrTypePtr element) -> IrTypePtr {
    return make_rc<IrType>(IrType{UnrankedTensorType{std::move(element)}});
}

auto make_custom_type(std::shared_ptr<const TypeExtension> ext) -> IrTypePtr {
    return make_rc<IrType>(IrType{CustomType{std::move(ext)}});
}

// ============================================================================
// Structural Equality
// ============================================================================

static auto type_lists_equal(const std::vector<IrTypePtr>& a, const std::vector<IrTypePtr>& b)
    -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (!types_equal(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

auto types_equal(const IrTypePtr& a, const IrTypePtr& b) -> bool {
    if (!a || !b) {
        return !a && !b;
    }
    if (a == b) {
        return true;
    }
    if (a->kind.index() != b->kind.index()) {
        return false;
    }

    return std::visit(
        [&b](const auto& lhs) -> bool {
            using T = std::decay_t<decltype(lhs)>;
            const auto& rhs = std::get<T>(b->kind);

            if constexpr (std::is_same_v<T, IntegerType> || std::is_same_v<T, FloatType>) {
                return lhs.width == rhs.width;
            } else if constexpr (std::is_same_v<T, IndexType>) {
                return true;
            } else if constexpr (std::is_same_v<T, MemRefType> ||
                                 std::is_same_v<T, RankedTensorType>) {
                return lhs.dims == rhs.dims && types_equal(lhs.element, rhs.element);
            } else if constexpr (std::is_same_v<T, UnrankedTensorType>) {
                return types_equal(lhs.element, rhs.element);
            } else if constexpr (std::is_same_v<T, StructType>) {
                return type_lists_equal(lhs.fields, rhs.fields);
            } else if constexpr (std::is_same_v<T, NamedType>) {
                return lhs.name == rhs.name;
            } else if constexpr (std::is_same_v<T, FunctionType>) {
                return type_lists_equal(lhs.inputs, rhs.inputs) &&
                       type_lists_equal(lhs.results, rhs.results);
            } else if constexpr (std::is_same_v<T, CustomType>) {
                if (!lhs.ext || !rhs.ext) {
                    return !lhs.ext && !rhs.ext;
                }
                return lhs.ext->render() == rhs.ext->render();
            }
        },
        a->kind);
}

} // namespace irt::ir
