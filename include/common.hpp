//! # Common Definitions
//!
//! Types and utilities shared by every IRT component.
//!
//! ## Overview
//!
//! - **Version Information**: Library version constants
//! - **Source Locations**: `SourcePos` and `SourceSpan` with span merging
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Shared pointer alias for IR types
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Fallible operations return `Result<T, E>`
//! - **Shared Types**: `Rc<T>` for type objects referenced from many places
//! - **Value Semantics**: IR values are built once and then only read

#ifndef IRT_COMMON_HPP
#define IRT_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace irt {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string (e.g., "0.1.0").
constexpr const char* VERSION = "0.1.0";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 1;

/// Patch version number.
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Source Location Types
// ============================================================================

/// A (row, column) position in a source file.
struct SourcePos {
    uint32_t row = 0;
    uint32_t column = 0;

    [[nodiscard]] auto operator==(const SourcePos& other) const -> bool = default;

    /// Orders positions by row, then by column.
    [[nodiscard]] auto operator<(const SourcePos& other) const -> bool {
        if (row != other.row) {
            return row < other.row;
        }
        return column < other.column;
    }
};

/// A range of source text in one file.
///
/// Spans are attached to operations and modules by the frontend that built
/// them. A default-constructed span is the unknown location.
struct SourceSpan {
    /// Path of the source file.
    std::string file;

    /// First position covered by the span.
    SourcePos start;

    /// Last position covered by the span.
    SourcePos end;

    [[nodiscard]] auto operator==(const SourceSpan& other) const -> bool = default;

    /// Returns the unknown location.
    [[nodiscard]] static auto unknown() -> SourceSpan {
        return {};
    }

    /// True when this span carries no location information.
    [[nodiscard]] auto is_unknown() const -> bool {
        return file.empty() && start == SourcePos{} && end == SourcePos{};
    }

    /// Merges two spans into the smallest span covering both.
    ///
    /// Both spans are assumed to belong to the same file; the result keeps
    /// the file name of `a` and mismatched names are not reported.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        SourceSpan result;
        result.file = a.file;
        result.start = b.start < a.start ? b.start : a.start;
        result.end = a.end < b.end ? b.end : a.end;
        return result;
    }
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = irt::ir::verify_module(module);
/// if (is_err(result)) {
///     for (const auto& error : unwrap_err(result)) { ... }
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

/// Creates a new Rc containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace irt

#endif // IRT_COMMON_HPP
