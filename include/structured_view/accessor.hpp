/**
 * @file accessor.hpp
 * @brief Live read/write handles over a buffer, shaped like a layout.
 *
 * An Accessor tree mirrors a TypeLayout: one node per layout node, each
 * bound to the bytes it governs. Nodes never copy data; every get() reads
 * the buffer and every set() writes it.
 *
 * Usage:
 * @code
 *   Accessor& light = root.value();
 *   light["intensity"].set(2.5f);
 *   light["position"][1].set(1.0f);
 *   float y = light["position"][1].get_as<float>();
 * @endcode
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "structured_view/indexed.hpp"
#include "structured_view/layout.hpp"
#include "structured_view/scalar_kind.hpp"
#include "structured_view/view_bank.hpp"

namespace structured_view {

/**
 * @class Accessor
 * @brief One node of an accessor tree.
 *
 * Scalar nodes support get()/set(). Struct nodes expose their members by
 * name; array nodes expose their elements by index. Nested struct/array
 * nodes are returned by reference and are mutated through their own
 * members, never replaced.
 */
class Accessor {
public:
    enum class Kind {
        Scalar,
        Struct,
        Array,
        UnsizedArray
    };

    /// Named children of a struct node, in declaration order
    using Fields = std::vector<std::pair<std::string, std::unique_ptr<Accessor>>>;

    Accessor(const TypeLayout& layout, size_t byte_offset, ScalarSlot slot);
    Accessor(const TypeLayout& layout, size_t byte_offset, Fields fields);
    Accessor(const TypeLayout& layout, size_t byte_offset,
             std::unique_ptr<IndexedContainer> elements);
    ~Accessor();

    // Children are referenced by address
    Accessor(const Accessor&) = delete;
    Accessor& operator=(const Accessor&) = delete;
    Accessor(Accessor&&) = delete;
    Accessor& operator=(Accessor&&) = delete;

    Kind kind() const noexcept { return kind_; }
    const TypeLayout& layout() const noexcept { return *layout_; }

    /// Absolute offset of this node in the buffer
    size_t byte_offset() const noexcept { return byte_offset_; }

    // ------------------------------------------------------------------------
    // Scalar nodes
    // ------------------------------------------------------------------------

    /// @throws std::logic_error if this is not a scalar node
    ScalarValue get() const;

    /// Converts value to the node's kind. @throws std::logic_error if not a scalar node
    void set(const ScalarValue& value);

    template <typename T>
    T get_as() const { return scalar_cast<T>(get()); }

    template <typename T>
    void set_as(T value) { set(to_scalar_value(value)); }

    // ------------------------------------------------------------------------
    // Struct nodes
    // ------------------------------------------------------------------------

    /**
     * @brief Member accessor by name.
     * @throws std::logic_error if this is not a struct node.
     * @throws std::out_of_range if there is no such member.
     */
    Accessor& field(std::string_view name);
    const Accessor& field(std::string_view name) const;

    Accessor& operator[](std::string_view name) { return field(name); }

    bool has_field(std::string_view name) const noexcept;

    /// Member names in declaration order (empty for non-struct nodes)
    std::vector<std::string> field_names() const;

    // ------------------------------------------------------------------------
    // Array nodes
    // ------------------------------------------------------------------------

    /**
     * @brief Element accessor by index.
     *
     * Unsized arrays build and cache the element on first access.
     * @throws std::logic_error if this is not an array node.
     * @throws std::out_of_range for a fixed array index >= length.
     * @throws AccessError if an unsized element does not fit the buffer.
     */
    Accessor& at(size_t index);

    Accessor& operator[](size_t index) { return at(index); }

    /// Read scalar element `index`
    ScalarValue get(size_t index);

    /// Write scalar element `index`
    void set(size_t index, const ScalarValue& value);

    /// Element count; std::nullopt for unsized arrays and non-array nodes
    std::optional<uint64_t> length() const noexcept;

    /// Elements built so far (cache size for unsized arrays)
    size_t materialized() const noexcept;

private:
    IndexedContainer& elements() const;

    const TypeLayout* layout_;
    size_t            byte_offset_;
    Kind              kind_;
    std::variant<ScalarSlot, Fields, std::unique_ptr<IndexedContainer>> node_;
};

/**
 * @brief Build the accessor tree for a struct or array layout.
 * @param bank Views over the buffer; must outlive the result.
 * @param base_offset Absolute offset of the node in the buffer.
 * @param layout Struct or array layout; must outlive the result.
 * @throws std::logic_error if layout is a scalar (scalars are always
 *         reached through a parent or a wrapping struct).
 * @throws AccessError if a scalar leaf is misaligned or outside the buffer.
 */
std::unique_ptr<Accessor> make_accessor(const ViewBank& bank, size_t base_offset,
                                        const TypeLayout& layout);

}  // namespace structured_view
