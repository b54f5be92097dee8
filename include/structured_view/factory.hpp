/**
 * @file factory.hpp
 * @brief Public entry point: lay out a description once, bind it many times.
 *
 * @code
 *   AccessorFactory factory(structure({
 *       member("count", scalar("u32")),
 *       member("items", unsized_array(scalar("f32"))),
 *   }));
 *
 *   std::vector<std::byte> bytes(64);
 *   RootAccessor root = factory.create(bytes.data(), bytes.size());
 *   root["count"].set(uint32_t{3});
 *   root["items"].set(2, 1.5f);
 * @endcode
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "structured_view/accessor.hpp"
#include "structured_view/errors.hpp"
#include "structured_view/layout.hpp"
#include "structured_view/type_desc.hpp"
#include "structured_view/view_bank.hpp"

namespace structured_view {

/**
 * @class RootAccessor
 * @brief Accessor tree for one (buffer, base offset) binding.
 *
 * The real root node is value(). Struct and array roots can also be used
 * directly through operator[] / field() / at(); scalar roots through
 * get() / set(). The buffer is borrowed and must outlive this object.
 */
class RootAccessor {
public:
    RootAccessor(LayoutPtr layout, std::unique_ptr<ViewBank> backing, size_t base_offset);

    // Non-copyable, movable
    RootAccessor(const RootAccessor&) = delete;
    RootAccessor& operator=(const RootAccessor&) = delete;
    RootAccessor(RootAccessor&&) noexcept = default;
    RootAccessor& operator=(RootAccessor&&) noexcept = default;

    /// The node for the described type
    Accessor& value() { return wrapper_->field(WRAPPED_VALUE_NAME); }
    const Accessor& value() const { return wrapper_->field(WRAPPED_VALUE_NAME); }

    Accessor* operator->() { return &value(); }
    Accessor& operator*() { return value(); }

    ScalarValue get() const { return value().get(); }
    void set(const ScalarValue& v) { value().set(v); }

    template <typename T>
    T get_as() const { return value().get_as<T>(); }

    template <typename T>
    void set_as(T v) { value().set_as(v); }

    Accessor& field(std::string_view name) { return value().field(name); }
    Accessor& operator[](std::string_view name) { return value().field(name); }
    Accessor& at(size_t index) { return value().at(index); }
    Accessor& operator[](size_t index) { return value().at(index); }

    // Read-only metadata
    const TypeLayout& layout() const noexcept { return *layout_; }
    const LayoutPtr& layout_ptr() const noexcept { return layout_; }
    const ViewBank& backing() const noexcept { return *backing_; }
    size_t base_offset() const noexcept { return base_offset_; }

private:
    LayoutPtr                 layout_;
    LayoutPtr                 wrapped_;
    std::unique_ptr<ViewBank> backing_;
    size_t                    base_offset_;
    std::unique_ptr<Accessor> wrapper_;  // destroyed first
};

/**
 * @class AccessorFactory
 * @brief Holds a precomputed layout and stamps out accessors.
 */
class AccessorFactory {
public:
    /**
     * @struct Config
     * @brief Factory options.
     */
    struct Config {
        bool trace = false;  ///< Log layouts and create() calls at info level
    };

    /**
     * @brief Compute and retain the layout of a description.
     * @throws LayoutError if the description violates a packing rule.
     */
    explicit AccessorFactory(const TypeDesc& desc);
    AccessorFactory(const TypeDesc& desc, const Config& config);

    /**
     * @brief Bind an accessor tree to a buffer.
     * @param data Start of the buffer (borrowed).
     * @param byte_length Buffer size in bytes.
     * @param base_offset Offset of the root within the buffer.
     * @return Independent accessor tree; only the layout is shared.
     * @throws AccessError if fewer than layout().min_byte_size bytes remain
     *         past base_offset, or a scalar leaf cannot be bound.
     */
    RootAccessor create(void* data, size_t byte_length, size_t base_offset = 0) const;

    const TypeLayout& layout() const noexcept { return *layout_; }
    const LayoutPtr& layout_ptr() const noexcept { return layout_; }
    const Config& config() const noexcept { return config_; }

private:
    Config    config_;
    LayoutPtr layout_;
};

}  // namespace structured_view
