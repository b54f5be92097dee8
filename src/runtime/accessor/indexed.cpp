/**
 * @file indexed.cpp
 * @brief Fixed and lazily-materialized array containers.
 */

#include "structured_view/indexed.hpp"
#include "structured_view/accessor.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>

namespace structured_view {

// ============================================================================
// FixedArrayContainer
// ============================================================================

FixedArrayContainer::FixedArrayContainer(std::vector<std::unique_ptr<Accessor>> elements)
    : elements_(std::move(elements))
{
}

FixedArrayContainer::~FixedArrayContainer() = default;

Accessor& FixedArrayContainer::element(size_t index) {
    if (index >= elements_.size()) {
        std::ostringstream oss;
        oss << "Accessor: index " << index << " out of range for array of length "
            << elements_.size();
        throw std::out_of_range(oss.str());
    }
    return *elements_[index];
}

ScalarValue FixedArrayContainer::get(size_t index) {
    return element(index).get();
}

void FixedArrayContainer::set(size_t index, const ScalarValue& value) {
    element(index).set(value);
}

// ============================================================================
// LazyArrayContainer
// ============================================================================

LazyArrayContainer::LazyArrayContainer(const ViewBank& bank, size_t base_offset,
                                       const ArrayLayout& layout)
    : bank_(&bank)
    , base_offset_(base_offset)
    , stride_(layout.byte_stride)
    , wrapped_element_(wrap_layout(layout.element))
{
}

LazyArrayContainer::~LazyArrayContainer() = default;

size_t LazyArrayContainer::element_offset(size_t index) const {
    const size_t max = std::numeric_limits<size_t>::max();
    if (stride_ != 0 && index > (max - base_offset_) / stride_) {
        std::ostringstream oss;
        oss << "element " << index << " of unsized array at offset " << base_offset_
            << " with stride " << stride_ << " overflows size_t";
        throw AccessError(oss.str());
    }
    return base_offset_ + index * stride_;
}

Accessor& LazyArrayContainer::wrapped(size_t index) {
    auto it = cache_.find(index);
    if (it == cache_.end()) {
        auto accessor = make_accessor(*bank_, element_offset(index), *wrapped_element_);
        it = cache_.emplace(index, std::move(accessor)).first;
    }
    return *it->second;
}

Accessor& LazyArrayContainer::element(size_t index) {
    return wrapped(index).field(WRAPPED_VALUE_NAME);
}

ScalarValue LazyArrayContainer::get(size_t index) {
    return element(index).get();
}

void LazyArrayContainer::set(size_t index, const ScalarValue& value) {
    element(index).set(value);
}

}  // namespace structured_view
