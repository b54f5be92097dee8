/**
 * @file indexed.hpp
 * @brief Indexed containers behind array accessors.
 *
 * Fixed-length arrays build every element up front. Unsized arrays build
 * elements on first access and keep them in an append-only cache for the
 * life of the accessor.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "structured_view/layout.hpp"
#include "structured_view/scalar_kind.hpp"

namespace structured_view {

class Accessor;
class ViewBank;

/**
 * @class IndexedContainer
 * @brief Element access shared by fixed and unsized array accessors.
 */
class IndexedContainer {
public:
    virtual ~IndexedContainer() = default;

    /**
     * @brief Accessor for element `index`.
     *
     * For struct/array elements this is the nested accessor itself; for
     * scalar elements it is the scalar node (use get/set on it).
     */
    virtual Accessor& element(size_t index) = 0;

    /**
     * @brief Read a scalar element.
     * @throws std::logic_error if the element type is not a scalar.
     */
    virtual ScalarValue get(size_t index) = 0;

    /**
     * @brief Write a scalar element.
     * @throws std::logic_error if the element type is not a scalar.
     */
    virtual void set(size_t index, const ScalarValue& value) = 0;

    /// Element count, or std::nullopt for unsized arrays
    virtual std::optional<uint64_t> length() const noexcept = 0;

    /// Number of element accessors built so far
    virtual size_t materialized() const noexcept = 0;
};

/**
 * @class FixedArrayContainer
 * @brief Eagerly built elements of a fixed-length array.
 */
class FixedArrayContainer final : public IndexedContainer {
public:
    explicit FixedArrayContainer(std::vector<std::unique_ptr<Accessor>> elements);
    ~FixedArrayContainer() override;

    /// @throws std::out_of_range if index >= length
    Accessor& element(size_t index) override;
    ScalarValue get(size_t index) override;
    void set(size_t index, const ScalarValue& value) override;
    std::optional<uint64_t> length() const noexcept override { return elements_.size(); }
    size_t materialized() const noexcept override { return elements_.size(); }

private:
    std::vector<std::unique_ptr<Accessor>> elements_;
};

/**
 * @class LazyArrayContainer
 * @brief Elements of an unsized array, materialized on first access.
 *
 * Element `i` lives at base_offset + i * stride. It is built through the
 * wrapping struct (see wrap_layout()) whatever its shape, so scalar
 * elements get a settable slot too. There is no upper bound on the index;
 * an element past the end of the buffer fails with AccessError when its
 * scalar leaves are bound.
 *
 * The cache is not synchronized.
 */
class LazyArrayContainer final : public IndexedContainer {
public:
    LazyArrayContainer(const ViewBank& bank, size_t base_offset, const ArrayLayout& layout);
    ~LazyArrayContainer() override;

    Accessor& element(size_t index) override;
    ScalarValue get(size_t index) override;
    void set(size_t index, const ScalarValue& value) override;
    std::optional<uint64_t> length() const noexcept override { return std::nullopt; }
    size_t materialized() const noexcept override { return cache_.size(); }

    /// Element offset for an index; @throws AccessError on overflow
    size_t element_offset(size_t index) const;

private:
    /// Wrapped accessor `{ value: element }` for an index, built on first use
    Accessor& wrapped(size_t index);

    const ViewBank* bank_;
    size_t          base_offset_;
    size_t          stride_;
    LayoutPtr       wrapped_element_;
    std::map<size_t, std::unique_ptr<Accessor>> cache_;
};

}  // namespace structured_view
