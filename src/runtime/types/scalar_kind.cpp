/**
 * @file scalar_kind.cpp
 * @brief Scalar kind lookup and value conversion.
 */

#include "structured_view/scalar_kind.hpp"

#include <cmath>

namespace structured_view {

namespace {

// Truncate toward zero and wrap modulo 2^bits (ToInt32-style store).
template <typename T>
T wrap_floating(double d) noexcept {
    if (!std::isfinite(d)) {
        return T{0};
    }
    d = std::trunc(d);
    const double modulus = std::ldexp(1.0, static_cast<int>(sizeof(T) * 8));
    d = std::fmod(d, modulus);

    // Negate in unsigned arithmetic; adding the modulus in double would
    // round for 64-bit kinds.
    uint64_t bits = d < 0.0
        ? uint64_t{0} - static_cast<uint64_t>(-d)
        : static_cast<uint64_t>(d);
    return static_cast<T>(bits);
}

template <typename T>
T convert_to(const ScalarValue& value) noexcept {
    return std::visit([](auto v) -> T {
        using Src = decltype(v);
        if constexpr (std::is_floating_point_v<T>) {
            return static_cast<T>(v);
        } else if constexpr (std::is_floating_point_v<Src>) {
            return wrap_floating<T>(static_cast<double>(v));
        } else {
            // Integer to integer: two's-complement truncation.
            return static_cast<T>(v);
        }
    }, value);
}

}  // namespace

std::optional<ScalarKind> parse_scalar_kind(std::string_view tag) noexcept {
    for (const auto& info : SCALAR_KINDS) {
        if (info.tag == tag) {
            return info.kind;
        }
    }
    return std::nullopt;
}

ScalarValue convert_scalar(const ScalarValue& value, ScalarKind kind) noexcept {
    switch (kind) {
        case ScalarKind::I8:  return convert_to<int8_t>(value);
        case ScalarKind::U8:  return convert_to<uint8_t>(value);
        case ScalarKind::I16: return convert_to<int16_t>(value);
        case ScalarKind::U16: return convert_to<uint16_t>(value);
        case ScalarKind::I32: return convert_to<int32_t>(value);
        case ScalarKind::U32: return convert_to<uint32_t>(value);
        case ScalarKind::F32: return convert_to<float>(value);
        case ScalarKind::F64: return convert_to<double>(value);
        case ScalarKind::I64: return convert_to<int64_t>(value);
        case ScalarKind::U64: return convert_to<uint64_t>(value);
    }
    return value;
}

}  // namespace structured_view
