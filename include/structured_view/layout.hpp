/**
 * @file layout.hpp
 * @brief Concrete type layouts and the layout calculator.
 *
 * compute_layout() resolves every offset, size and alignment of a
 * TypeDesc under the default packing rule:
 *
 * - scalars are aligned to their width;
 * - struct members are placed in declaration order, each at the running
 *   end offset rounded up to the member's alignment (or at an explicit
 *   offset);
 * - array elements are placed every `stride` bytes, stride defaulting to
 *   the element size rounded up to the element alignment.
 *
 * All validation happens here; a layout that comes out of compute_layout()
 * is always internally consistent.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "structured_view/errors.hpp"
#include "structured_view/scalar_kind.hpp"
#include "structured_view/type_desc.hpp"

namespace structured_view {

struct TypeLayout;

/// Layout nodes are immutable and shared between parents and accessors
using LayoutPtr = std::shared_ptr<const TypeLayout>;

/**
 * @struct ScalarLayout
 */
struct ScalarLayout {
    ScalarKind kind;
};

/**
 * @struct MemberLayout
 * @brief A struct member with its resolved placement.
 */
struct MemberLayout {
    std::string name;
    size_t      byte_offset;  ///< Offset relative to the start of the struct
    size_t      byte_align;   ///< Resolved alignment (override or type alignment)
    size_t      byte_size;    ///< Resolved size (override or type minimum size)
    LayoutPtr   type;
};

/**
 * @struct StructLayout
 */
struct StructLayout {
    std::vector<MemberLayout> members;

    /// Member by name, or nullptr
    const MemberLayout* find(const std::string& name) const noexcept;
};

/**
 * @struct ArrayLayout
 */
struct ArrayLayout {
    LayoutPtr               element;
    size_t                  byte_stride;
    std::optional<uint64_t> length;  ///< std::nullopt for unsized arrays
};

/**
 * @struct TypeLayout
 * @brief Resolved layout of one description node.
 *
 * For unsized nodes min_byte_size counts only the sized prefix.
 */
struct TypeLayout {
    using Shape = std::variant<ScalarLayout, StructLayout, ArrayLayout>;

    size_t min_byte_size = 0;
    size_t min_byte_align = 1;
    bool   unsized = false;
    Shape  shape;

    bool is_scalar() const noexcept { return std::holds_alternative<ScalarLayout>(shape); }
    bool is_struct() const noexcept { return std::holds_alternative<StructLayout>(shape); }
    bool is_array() const noexcept { return std::holds_alternative<ArrayLayout>(shape); }

    const ScalarLayout& as_scalar() const { return std::get<ScalarLayout>(shape); }
    const StructLayout& as_struct() const { return std::get<StructLayout>(shape); }
    const ArrayLayout& as_array() const { return std::get<ArrayLayout>(shape); }
};

/**
 * @brief Round n up to a multiple of alignment (alignment > 0).
 */
constexpr size_t align_up(size_t n, size_t alignment) noexcept {
    return ((n + alignment - 1) / alignment) * alignment;
}

/**
 * @brief Compute the layout of a type description.
 * @param desc Description to lay out.
 * @return Root of the layout tree.
 * @throws LayoutError if any packing rule is violated; the message names
 *         the offending member or array and the numbers involved.
 */
LayoutPtr compute_layout(const TypeDesc& desc);

/**
 * @brief Wrap a layout in a one-member struct `{ value: layout }`.
 *
 * The member sits at offset 0; size, alignment and unsizedness are those of
 * the wrapped layout. Accessors are always materialized through this
 * wrapper so that a bare scalar still gets a settable slot.
 */
LayoutPtr wrap_layout(LayoutPtr inner);

/// Name of the single member created by wrap_layout()
constexpr const char* WRAPPED_VALUE_NAME = "value";

/**
 * @brief One-line summary, e.g. "struct{x:i32@0, y:i8@4} size=5 align=4".
 */
std::string describe(const TypeLayout& layout);

}  // namespace structured_view
