/**
 * @file view_bank.hpp
 * @brief Fixed-width aliasing views over one borrowed byte buffer.
 *
 * A ViewBank holds one ScalarView per scalar kind, all over the same bytes.
 * Each view's element count is rounded down to what fits in the buffer, so
 * a buffer of any length is valid input. The bank never owns or frees the
 * buffer; the caller keeps it alive for as long as accessors built on the
 * bank are in use.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "structured_view/errors.hpp"
#include "structured_view/scalar_kind.hpp"

namespace structured_view {

/**
 * @class ScalarSlot
 * @brief Read/write handle to one element of one scalar view.
 *
 * Loads and stores go through std::memcpy, so the buffer base pointer does
 * not need any particular alignment.
 */
class ScalarSlot {
public:
    ScalarSlot(ScalarKind kind, std::byte* address) noexcept
        : kind_(kind), address_(address) {}

    ScalarKind kind() const noexcept { return kind_; }
    std::byte* address() const noexcept { return address_; }

    /**
     * @brief Read the current value.
     */
    ScalarValue load() const noexcept;

    /**
     * @brief Write a value, converting it to this slot's kind first.
     */
    void store(const ScalarValue& value) const noexcept;

private:
    ScalarKind kind_;
    std::byte* address_;
};

/**
 * @class ScalarView
 * @brief One scalar kind's view of the whole buffer.
 */
class ScalarView {
public:
    ScalarView() = default;
    ScalarView(ScalarKind kind, std::byte* data, size_t buffer_bytes) noexcept
        : kind_(kind)
        , data_(data)
        , size_(buffer_bytes / scalar_width(kind)) {}

    ScalarKind kind() const noexcept { return kind_; }
    size_t width() const noexcept { return scalar_width(kind_); }

    /// Number of whole elements that fit in the buffer
    size_t size() const noexcept { return size_; }

    /// Bytes covered by the view (size() * width(), never above the buffer length)
    size_t byte_length() const noexcept { return size_ * width(); }

    std::byte* data() const noexcept { return data_; }

private:
    ScalarKind kind_ = ScalarKind::U8;
    std::byte* data_ = nullptr;
    size_t     size_ = 0;
};

/**
 * @class ViewBank
 * @brief The set of per-kind views over a single buffer.
 */
class ViewBank {
public:
    /**
     * @brief Build views over a borrowed buffer.
     * @param data Start of the buffer (may be null when byte_length is 0).
     * @param byte_length Buffer size in bytes.
     */
    ViewBank(void* data, size_t byte_length) noexcept;

    // Accessors keep pointers into the bank; it stays where it was built.
    ViewBank(const ViewBank&) = delete;
    ViewBank& operator=(const ViewBank&) = delete;

    const ScalarView& view(ScalarKind kind) const noexcept {
        return views_[static_cast<size_t>(kind)];
    }

    std::byte* data() const noexcept { return data_; }
    size_t byte_length() const noexcept { return byte_length_; }

    /**
     * @brief Bind a slot for one scalar leaf.
     * @param kind Scalar kind of the leaf.
     * @param byte_offset Absolute offset of the leaf in the buffer.
     * @throws AccessError if byte_offset is not a multiple of the kind's
     *         width, or is not below the view's byte length.
     */
    ScalarSlot bind_scalar(ScalarKind kind, size_t byte_offset) const;

private:
    std::byte* data_;
    size_t     byte_length_;
    std::array<ScalarView, SCALAR_KIND_COUNT> views_;
};

}  // namespace structured_view
