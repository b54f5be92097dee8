/**
 * @file accessor.cpp
 * @brief Accessor nodes and the accessor generator.
 */

#include "structured_view/accessor.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>

namespace structured_view {

namespace {

Accessor::Kind kind_for(const TypeLayout& layout) {
    if (layout.is_scalar()) {
        return Accessor::Kind::Scalar;
    }
    if (layout.is_struct()) {
        return Accessor::Kind::Struct;
    }
    return layout.as_array().length ? Accessor::Kind::Array : Accessor::Kind::UnsizedArray;
}

const char* kind_name(Accessor::Kind kind) {
    switch (kind) {
        case Accessor::Kind::Scalar:       return "scalar";
        case Accessor::Kind::Struct:       return "struct";
        case Accessor::Kind::Array:        return "array";
        case Accessor::Kind::UnsizedArray: return "unsized array";
    }
    return "?";
}

[[noreturn]] void wrong_kind(Accessor::Kind actual, const char* wanted) {
    throw std::logic_error(std::string("Accessor: ") + wanted + " operation on a " +
                           kind_name(actual) + " accessor");
}

// Scalars become leaf nodes bound to one view slot; everything else recurses.
std::unique_ptr<Accessor> make_child(const ViewBank& bank, size_t byte_offset,
                                     const TypeLayout& layout) {
    if (layout.is_scalar()) {
        ScalarSlot slot = bank.bind_scalar(layout.as_scalar().kind, byte_offset);
        return std::make_unique<Accessor>(layout, byte_offset, slot);
    }
    return make_accessor(bank, byte_offset, layout);
}

size_t child_offset(size_t base, size_t offset) {
    if (base > std::numeric_limits<size_t>::max() - offset) {
        std::ostringstream oss;
        oss << "offset " << base << " + " << offset << " overflows size_t";
        throw AccessError(oss.str());
    }
    return base + offset;
}

}  // namespace

// ============================================================================
// Accessor
// ============================================================================

Accessor::Accessor(const TypeLayout& layout, size_t byte_offset, ScalarSlot slot)
    : layout_(&layout)
    , byte_offset_(byte_offset)
    , kind_(Kind::Scalar)
    , node_(slot)
{
}

Accessor::Accessor(const TypeLayout& layout, size_t byte_offset, Fields fields)
    : layout_(&layout)
    , byte_offset_(byte_offset)
    , kind_(Kind::Struct)
    , node_(std::move(fields))
{
}

Accessor::Accessor(const TypeLayout& layout, size_t byte_offset,
                   std::unique_ptr<IndexedContainer> elements)
    : layout_(&layout)
    , byte_offset_(byte_offset)
    , kind_(kind_for(layout))
    , node_(std::move(elements))
{
}

Accessor::~Accessor() = default;

ScalarValue Accessor::get() const {
    if (kind_ != Kind::Scalar) {
        wrong_kind(kind_, "get()");
    }
    return std::get<ScalarSlot>(node_).load();
}

void Accessor::set(const ScalarValue& value) {
    if (kind_ != Kind::Scalar) {
        wrong_kind(kind_, "set()");
    }
    std::get<ScalarSlot>(node_).store(value);
}

Accessor& Accessor::field(std::string_view name) {
    return const_cast<Accessor&>(static_cast<const Accessor&>(*this).field(name));
}

const Accessor& Accessor::field(std::string_view name) const {
    if (kind_ != Kind::Struct) {
        wrong_kind(kind_, "field()");
    }
    for (const auto& entry : std::get<Fields>(node_)) {
        if (entry.first == name) {
            return *entry.second;
        }
    }
    throw std::out_of_range("Accessor: no member named '" + std::string(name) + "'");
}

bool Accessor::has_field(std::string_view name) const noexcept {
    if (kind_ != Kind::Struct) {
        return false;
    }
    for (const auto& entry : std::get<Fields>(node_)) {
        if (entry.first == name) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> Accessor::field_names() const {
    std::vector<std::string> names;
    if (kind_ == Kind::Struct) {
        for (const auto& entry : std::get<Fields>(node_)) {
            names.push_back(entry.first);
        }
    }
    return names;
}

IndexedContainer& Accessor::elements() const {
    if (kind_ != Kind::Array && kind_ != Kind::UnsizedArray) {
        wrong_kind(kind_, "indexed");
    }
    return *std::get<std::unique_ptr<IndexedContainer>>(node_);
}

Accessor& Accessor::at(size_t index) {
    return elements().element(index);
}

ScalarValue Accessor::get(size_t index) {
    return elements().get(index);
}

void Accessor::set(size_t index, const ScalarValue& value) {
    elements().set(index, value);
}

std::optional<uint64_t> Accessor::length() const noexcept {
    if (kind_ != Kind::Array) {
        return std::nullopt;
    }
    return std::get<std::unique_ptr<IndexedContainer>>(node_)->length();
}

size_t Accessor::materialized() const noexcept {
    if (kind_ != Kind::Array && kind_ != Kind::UnsizedArray) {
        return 0;
    }
    return std::get<std::unique_ptr<IndexedContainer>>(node_)->materialized();
}

// ============================================================================
// Generator
// ============================================================================

std::unique_ptr<Accessor> make_accessor(const ViewBank& bank, size_t base_offset,
                                        const TypeLayout& layout) {
    if (layout.is_struct()) {
        Accessor::Fields fields;
        for (const auto& m : layout.as_struct().members) {
            size_t offset = child_offset(base_offset, m.byte_offset);
            fields.emplace_back(m.name, make_child(bank, offset, *m.type));
        }
        return std::make_unique<Accessor>(layout, base_offset, std::move(fields));
    }

    if (layout.is_array()) {
        const ArrayLayout& arr = layout.as_array();
        if (!arr.length) {
            return std::make_unique<Accessor>(
                layout, base_offset,
                std::make_unique<LazyArrayContainer>(bank, base_offset, arr));
        }

        // Elements are built eagerly. A sized stride already bounds the count
        // by the buffer; zero-size elements need their own cap.
        if (*arr.length != 0 && *arr.length - 1 > static_cast<uint64_t>(bank.byte_length())) {
            std::ostringstream oss;
            oss << "fixed array of " << *arr.length << " elements with stride "
                << arr.byte_stride << " at offset " << base_offset
                << " has more elements than a buffer of " << bank.byte_length()
                << " bytes can address";
            throw AccessError(oss.str());
        }

        std::vector<std::unique_ptr<Accessor>> elements;
        elements.reserve(static_cast<size_t>(*arr.length));
        for (uint64_t k = 0; k < *arr.length; ++k) {
            // Layout computation already checked (length-1)*stride fits size_t.
            size_t offset = child_offset(base_offset, static_cast<size_t>(k) * arr.byte_stride);
            elements.push_back(make_child(bank, offset, *arr.element));
        }
        return std::make_unique<Accessor>(
            layout, base_offset,
            std::make_unique<FixedArrayContainer>(std::move(elements)));
    }

    throw std::logic_error("make_accessor should not have recursed on a scalar type");
}

}  // namespace structured_view
