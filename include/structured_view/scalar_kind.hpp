/**
 * @file scalar_kind.hpp
 * @brief Scalar kinds supported by layouts and their fixed byte widths.
 *
 * Every leaf of a type description is one of these kinds. The table below
 * is the single source of truth for tag names and widths; both the layout
 * calculator and the view bank read from it.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <variant>

namespace structured_view {

/**
 * @brief Primitive numeric kinds.
 *
 * The enumerator order matches the alternative order of ScalarValue.
 */
enum class ScalarKind : uint8_t {
    I8,
    U8,
    I16,
    U16,
    I32,
    U32,
    F32,
    F64,
    I64,
    U64
};

/// Number of scalar kinds
constexpr size_t SCALAR_KIND_COUNT = 10;

/**
 * @struct ScalarKindInfo
 * @brief Static properties of one scalar kind.
 */
struct ScalarKindInfo {
    ScalarKind       kind;         ///< Kind described by this entry
    std::string_view tag;          ///< Tag used in type descriptions ("i32", ...)
    size_t           width;        ///< Byte width (also the natural alignment)
    bool             is_floating;  ///< IEEE-754 float kind
    bool             is_signed;    ///< Signed integer or float kind
};

/// Scalar kind table, indexed by static_cast<size_t>(ScalarKind)
constexpr std::array<ScalarKindInfo, SCALAR_KIND_COUNT> SCALAR_KINDS = {{
    {ScalarKind::I8,  "i8",  1, false, true},
    {ScalarKind::U8,  "u8",  1, false, false},
    {ScalarKind::I16, "i16", 2, false, true},
    {ScalarKind::U16, "u16", 2, false, false},
    {ScalarKind::I32, "i32", 4, false, true},
    {ScalarKind::U32, "u32", 4, false, false},
    {ScalarKind::F32, "f32", 4, true,  true},
    {ScalarKind::F64, "f64", 8, true,  true},
    {ScalarKind::I64, "i64", 8, false, true},
    {ScalarKind::U64, "u64", 8, false, false},
}};

/// A value of any scalar kind; alternative index == static_cast<size_t>(ScalarKind)
using ScalarValue = std::variant<int8_t, uint8_t, int16_t, uint16_t, int32_t,
                                 uint32_t, float, double, int64_t, uint64_t>;

static_assert(std::variant_size_v<ScalarValue> == SCALAR_KIND_COUNT,
              "ScalarValue must have one alternative per ScalarKind");

constexpr const ScalarKindInfo& scalar_info(ScalarKind kind) noexcept {
    return SCALAR_KINDS[static_cast<size_t>(kind)];
}

constexpr size_t scalar_width(ScalarKind kind) noexcept {
    return scalar_info(kind).width;
}

constexpr std::string_view scalar_kind_name(ScalarKind kind) noexcept {
    return scalar_info(kind).tag;
}

/**
 * @brief True for the 64-bit integer kinds (i64, u64).
 */
constexpr bool is_wide_integer(ScalarKind kind) noexcept {
    return kind == ScalarKind::I64 || kind == ScalarKind::U64;
}

/**
 * @brief Look up a kind by its description tag.
 * @param tag One of "i8", "u8", "i16", "u16", "i32", "u32", "f32", "f64",
 *            "i64", "u64".
 * @return The kind, or std::nullopt if the tag is unknown.
 */
std::optional<ScalarKind> parse_scalar_kind(std::string_view tag) noexcept;

/**
 * @brief Kind of the alternative currently held by a value.
 */
inline ScalarKind kind_of(const ScalarValue& value) noexcept {
    return static_cast<ScalarKind>(value.index());
}

/**
 * @brief Convert a value to the given kind with typed-array store semantics.
 *
 * - integer -> integer wraps modulo 2^bits
 * - float -> integer truncates toward zero, then wraps; NaN and +-inf give 0
 * - anything -> float is a plain numeric conversion
 */
ScalarValue convert_scalar(const ScalarValue& value, ScalarKind kind) noexcept;

/**
 * @brief Wrap a native arithmetic value in the ScalarValue alternative of
 *        the same width and signedness.
 */
template <typename T>
ScalarValue to_scalar_value(T value) noexcept {
    static_assert(std::is_arithmetic_v<T>, "to_scalar_value requires an arithmetic type");
    if constexpr (std::is_floating_point_v<T>) {
        if constexpr (sizeof(T) <= sizeof(float)) {
            return static_cast<float>(value);
        } else {
            return static_cast<double>(value);
        }
    } else if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return static_cast<int8_t>(value);
        else if constexpr (sizeof(T) == 2) return static_cast<int16_t>(value);
        else if constexpr (sizeof(T) == 4) return static_cast<int32_t>(value);
        else return static_cast<int64_t>(value);
    } else {
        if constexpr (sizeof(T) == 1) return static_cast<uint8_t>(value);
        else if constexpr (sizeof(T) == 2) return static_cast<uint16_t>(value);
        else if constexpr (sizeof(T) == 4) return static_cast<uint32_t>(value);
        else return static_cast<uint64_t>(value);
    }
}

/**
 * @brief Extract a value as native type T, converting if needed.
 */
template <typename T>
T scalar_cast(const ScalarValue& value) noexcept {
    return std::visit([](auto v) -> T {
        using Src = decltype(v);
        if constexpr (std::is_floating_point_v<Src> && std::is_integral_v<T>) {
            ScalarValue converted = convert_scalar(
                ScalarValue(v),
                std::is_signed_v<T> ? ScalarKind::I64 : ScalarKind::U64);
            return std::is_signed_v<T>
                ? static_cast<T>(std::get<int64_t>(converted))
                : static_cast<T>(std::get<uint64_t>(converted));
        } else {
            return static_cast<T>(v);
        }
    }, value);
}

}  // namespace structured_view
