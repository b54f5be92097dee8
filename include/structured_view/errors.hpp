/**
 * @file errors.hpp
 * @brief Exception types raised by layout computation and accessor binding.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace structured_view {

/**
 * @class LayoutError
 * @brief A type description violates a packing rule.
 *
 * Thrown only while computing a layout, i.e. from compute_layout() and the
 * AccessorFactory constructor.
 */
class LayoutError : public std::invalid_argument {
public:
    explicit LayoutError(const std::string& what)
        : std::invalid_argument("LayoutError: " + what) {}
};

/**
 * @class AccessError
 * @brief A buffer region cannot hold the requested layout.
 *
 * Thrown only while binding accessors to a buffer: the region is smaller
 * than the layout, or a scalar leaf is misaligned or past the end of its
 * view. Reads and writes through a bound accessor never throw it.
 */
class AccessError : public std::out_of_range {
public:
    explicit AccessError(const std::string& what)
        : std::out_of_range("AccessError: " + what) {}
};

}  // namespace structured_view
