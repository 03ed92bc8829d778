//! # IR Attribute Implementation
//!
//! Attribute and dense-payload constructors.

#include "ir/ir.hpp"

namespace irt::ir {

auto string_attr(std::string value) -> IrAttr {
    return IrAttr{StringAttr{std::move(value)}};
}

auto bool_attr(bool value) -> IrAttr {
    return IrAttr{BoolAttr{value}};
}

auto int_attr(int64_t value, IrTypePtr type) -> IrAttr {
    return IrAttr{IntAttr{std::move(type), value}};
}

auto float_attr(double value, IrTypePtr type) -> IrAttr {
    return IrAttr{FloatAttr{std::move(type), value}};
}

auto type_attr(IrTypePtr type) -> IrAttr {
    return IrAttr{TypeAttr{std::move(type)}};
}

auto array_attr(std::vector<IrAttr> elements, IrTypePtr element_type) -> IrAttr {
    return IrAttr{ArrayAttr{std::move(element_type), std::move(elements)}};
}

auto dense_attr(std::vector<uint64_t> shape, DenseElements payload, IrTypePtr element_type)
    -> IrAttr {
    if (!element_type) {
        element_type = make_f64_type();
    }
    return IrAttr{DenseAttr{std::move(shape), std::move(element_type), std::move(payload)}};
}

auto symbol_ref_attr(std::string name) -> IrAttr {
    return IrAttr{SymbolRefAttr{std::move(name)}};
}

auto visibility_attr(Visibility visibility) -> IrAttr {
    return IrAttr{VisibilityAttr{visibility}};
}

auto unit_attr() -> IrAttr {
    return IrAttr{UnitAttr{}};
}

auto custom_attr(std::shared_ptr<const AttrExtension> ext) -> IrAttr {
    return IrAttr{CustomAttr{std::move(ext)}};
}

// ============================================================================
// Dense Payloads
// ============================================================================

auto dense_scalar(double value) -> DenseElements {
    return DenseElements{value};
}

auto dense_list(std::vector<DenseElements> elements) -> DenseElements {
    return DenseElements{std::move(elements)};
}

auto dense_vector(const std::vector<double>& values) -> DenseElements {
    std::vector<DenseElements> elements;
    elements.reserve(values.size());
    for (double v : values) {
        elements.push_back(dense_scalar(v));
    }
    return dense_list(std::move(elements));
}

auto visibility_name(Visibility visibility) -> const char* {
    switch (visibility) {
    case Visibility::Public:
        return "public";
    case Visibility::Private:
        return "private";
    case Visibility::Nested:
        return "nested";
    }
    return "public";
}

} // namespace irt::ir
