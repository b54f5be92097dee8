/**
 * @file view_bank.cpp
 * @brief View bank implementation.
 */

#include "structured_view/view_bank.hpp"

#include <sstream>

namespace structured_view {

namespace {

template <typename T>
ScalarValue load_as(const std::byte* address) noexcept {
    T value;
    std::memcpy(&value, address, sizeof(T));
    return value;
}

template <typename T>
void store_as(std::byte* address, const ScalarValue& value) noexcept {
    const T native = std::get<T>(value);
    std::memcpy(address, &native, sizeof(T));
}

}  // namespace

ScalarValue ScalarSlot::load() const noexcept {
    switch (kind_) {
        case ScalarKind::I8:  return load_as<int8_t>(address_);
        case ScalarKind::U8:  return load_as<uint8_t>(address_);
        case ScalarKind::I16: return load_as<int16_t>(address_);
        case ScalarKind::U16: return load_as<uint16_t>(address_);
        case ScalarKind::I32: return load_as<int32_t>(address_);
        case ScalarKind::U32: return load_as<uint32_t>(address_);
        case ScalarKind::F32: return load_as<float>(address_);
        case ScalarKind::F64: return load_as<double>(address_);
        case ScalarKind::I64: return load_as<int64_t>(address_);
        case ScalarKind::U64: return load_as<uint64_t>(address_);
    }
    return ScalarValue{};
}

void ScalarSlot::store(const ScalarValue& value) const noexcept {
    const ScalarValue converted = convert_scalar(value, kind_);
    switch (kind_) {
        case ScalarKind::I8:  store_as<int8_t>(address_, converted); break;
        case ScalarKind::U8:  store_as<uint8_t>(address_, converted); break;
        case ScalarKind::I16: store_as<int16_t>(address_, converted); break;
        case ScalarKind::U16: store_as<uint16_t>(address_, converted); break;
        case ScalarKind::I32: store_as<int32_t>(address_, converted); break;
        case ScalarKind::U32: store_as<uint32_t>(address_, converted); break;
        case ScalarKind::F32: store_as<float>(address_, converted); break;
        case ScalarKind::F64: store_as<double>(address_, converted); break;
        case ScalarKind::I64: store_as<int64_t>(address_, converted); break;
        case ScalarKind::U64: store_as<uint64_t>(address_, converted); break;
    }
}

ViewBank::ViewBank(void* data, size_t byte_length) noexcept
    : data_(static_cast<std::byte*>(data))
    , byte_length_(data ? byte_length : 0)
{
    // Round each view down so that any buffer length is valid here.
    for (const auto& info : SCALAR_KINDS) {
        views_[static_cast<size_t>(info.kind)] = ScalarView(info.kind, data_, byte_length_);
    }
}

ScalarSlot ViewBank::bind_scalar(ScalarKind kind, size_t byte_offset) const {
    const ScalarView& v = view(kind);

    if (byte_offset % v.width() != 0) {
        std::ostringstream oss;
        oss << "final offset " << byte_offset << " of a " << scalar_kind_name(kind)
            << " scalar accessor must be a multiple of its alignment " << v.width();
        throw AccessError(oss.str());
    }
    if (byte_offset >= v.byte_length()) {
        std::ostringstream oss;
        oss << "final offset " << byte_offset << " of a " << scalar_kind_name(kind)
            << " scalar accessor must be within the buffer view of size "
            << v.byte_length() << " bytes";
        throw AccessError(oss.str());
    }

    return ScalarSlot(kind, data_ + byte_offset);
}

}  // namespace structured_view
