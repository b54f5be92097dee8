/**
 * @file type_desc.hpp
 * @brief Declarative type descriptions (what the caller wants laid out).
 *
 * A TypeDesc is an immutable tree of scalars, structs and arrays. It says
 * nothing about any concrete buffer; compute_layout() turns it into a
 * TypeLayout with resolved offsets.
 *
 * Example:
 * @code
 *   using namespace structured_view;
 *   TypeDesc light = structure({
 *       member("position", array(scalar(ScalarKind::F32), 3)),
 *       member("intensity", scalar(ScalarKind::F32)),
 *       member("flags", scalar(ScalarKind::U32), MemberInfo::aligned(16)),
 *   });
 * @endcode
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "structured_view/scalar_kind.hpp"

namespace structured_view {

class TypeDesc;

/**
 * @struct MemberInfo
 * @brief Optional positioning overrides for one struct member.
 *
 * offset and align are alternative ways to position a member; size pads
 * the member beyond its type's minimum size.
 */
struct MemberInfo {
    std::optional<size_t> offset;  ///< Explicit byte offset within the struct
    std::optional<size_t> align;   ///< Explicit alignment (multiple of the type's)
    std::optional<size_t> size;    ///< Explicit size (>= the type's minimum)

    static MemberInfo at_offset(size_t byte_offset) {
        MemberInfo info;
        info.offset = byte_offset;
        return info;
    }

    static MemberInfo aligned(size_t byte_align) {
        MemberInfo info;
        info.align = byte_align;
        return info;
    }

    MemberInfo with_size(size_t byte_size) const {
        MemberInfo info = *this;
        info.size = byte_size;
        return info;
    }
};

/**
 * @struct ScalarDesc
 * @brief Leaf of a description.
 */
struct ScalarDesc {
    ScalarKind kind;
};

/**
 * @struct MemberDesc
 * @brief One named struct member.
 */
struct MemberDesc {
    std::string                     name;
    std::shared_ptr<const TypeDesc> type;
    MemberInfo                      info;
};

/**
 * @struct StructDesc
 * @brief Ordered members plus optional struct-level overrides.
 *
 * Declaration order is the packing order.
 */
struct StructDesc {
    std::vector<MemberDesc> members;
    std::optional<size_t>   align;
    std::optional<size_t>   size;
};

/**
 * @struct ArrayDesc
 * @brief Homogeneous array, fixed length or unsized (open-ended).
 */
struct ArrayDesc {
    std::shared_ptr<const TypeDesc> element;
    std::optional<uint64_t>         length;   ///< std::nullopt means unsized
    std::optional<size_t>           stride;   ///< Defaults to the padded element size

    bool is_unsized() const noexcept { return !length.has_value(); }
};

/**
 * @class TypeDesc
 * @brief Immutable description node: a scalar, a struct or an array.
 */
class TypeDesc {
public:
    using Shape = std::variant<ScalarDesc, StructDesc, ArrayDesc>;

    TypeDesc(ScalarDesc desc) : shape_(std::move(desc)) {}
    TypeDesc(StructDesc desc) : shape_(std::move(desc)) {}
    TypeDesc(ArrayDesc desc) : shape_(std::move(desc)) {}

    const Shape& shape() const noexcept { return shape_; }

    bool is_scalar() const noexcept { return std::holds_alternative<ScalarDesc>(shape_); }
    bool is_struct() const noexcept { return std::holds_alternative<StructDesc>(shape_); }
    bool is_array() const noexcept { return std::holds_alternative<ArrayDesc>(shape_); }

private:
    Shape shape_;
};

// ============================================================================
// Builders
// ============================================================================

TypeDesc scalar(ScalarKind kind);

/**
 * @brief Scalar from its tag ("i8" ... "u64").
 * @throws std::invalid_argument if the tag is not a known scalar kind.
 */
TypeDesc scalar(std::string_view tag);

/**
 * @brief Fixed-length array.
 * @param element Element description (must lay out to a sized type).
 * @param length Number of elements, may be 0.
 * @param stride Byte distance between elements; defaults to the element
 *               size rounded up to the element alignment.
 */
TypeDesc array(TypeDesc element, uint64_t length,
               std::optional<size_t> stride = std::nullopt);

/**
 * @brief Open-ended array; may only be the last member of a struct.
 */
TypeDesc unsized_array(TypeDesc element, std::optional<size_t> stride = std::nullopt);

MemberDesc member(std::string name, TypeDesc type, MemberInfo info = {});

TypeDesc structure(std::vector<MemberDesc> members,
                   std::optional<size_t> align = std::nullopt,
                   std::optional<size_t> size = std::nullopt);

}  // namespace structured_view
