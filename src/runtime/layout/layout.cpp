/**
 * @file layout.cpp
 * @brief Layout calculator implementation.
 */

#include "structured_view/layout.hpp"
#include "structured_view/log.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace structured_view {

namespace {

size_t checked_add(size_t a, size_t b, const std::string& path) {
    if (a > std::numeric_limits<size_t>::max() - b) {
        throw LayoutError("Size of " + path + " overflows size_t");
    }
    return a + b;
}

size_t checked_mul(size_t a, size_t b, const std::string& path) {
    if (a != 0 && b > std::numeric_limits<size_t>::max() / a) {
        throw LayoutError("Size of " + path + " overflows size_t");
    }
    return a * b;
}

LayoutPtr layout_node(const TypeDesc& desc, const std::string& path);

LayoutPtr layout_scalar(const ScalarDesc& desc) {
    auto layout = std::make_shared<TypeLayout>();
    layout->min_byte_size = scalar_width(desc.kind);
    layout->min_byte_align = scalar_width(desc.kind);
    layout->unsized = false;
    layout->shape = ScalarLayout{desc.kind};
    return layout;
}

LayoutPtr layout_array(const ArrayDesc& desc, const std::string& path) {
    if (!desc.element) {
        throw LayoutError("Array " + path + " has no element type");
    }
    LayoutPtr element = layout_node(*desc.element, path + "[]");

    if (element->unsized) {
        throw LayoutError("Array element types must be sized, but element of " + path +
                          " is unsized");
    }

    size_t stride = 0;
    if (desc.stride) {
        stride = *desc.stride;
        if (element->min_byte_size > stride) {
            std::ostringstream oss;
            oss << "Array element of size " << element->min_byte_size
                << " must fit within array stride " << stride << " of " << path;
            throw LayoutError(oss.str());
        }
        if (stride % element->min_byte_align != 0) {
            std::ostringstream oss;
            oss << "Array stride " << stride << " of " << path
                << " must be a multiple of element alignment " << element->min_byte_align;
            throw LayoutError(oss.str());
        }
    } else {
        stride = align_up(element->min_byte_size, element->min_byte_align);
    }

    auto layout = std::make_shared<TypeLayout>();
    layout->min_byte_align = element->min_byte_align;
    layout->unsized = desc.is_unsized();

    if (desc.is_unsized() || *desc.length == 0) {
        layout->min_byte_size = 0;
    } else {
        if (*desc.length - 1 > std::numeric_limits<size_t>::max()) {
            throw LayoutError("Length of " + path + " overflows size_t");
        }
        size_t head = checked_mul(static_cast<size_t>(*desc.length - 1), stride, path);
        layout->min_byte_size = checked_add(head, element->min_byte_size, path);
    }

    layout->shape = ArrayLayout{std::move(element), stride, desc.length};
    return layout;
}

LayoutPtr layout_struct(const StructDesc& desc, const std::string& path) {
    StructLayout result;
    result.members.reserve(desc.members.size());

    std::unordered_set<std::string> seen;
    size_t cursor = 0;           // end of the last sized member
    bool cursor_unsized = false; // an unsized member has been placed
    size_t type_align = 1;       // max of the members' type alignments
    const std::string* prev_name = nullptr;

    for (const auto& m : desc.members) {
        const std::string member_path = path + "." + m.name;

        if (!seen.insert(m.name).second) {
            throw LayoutError("Duplicate member name " + member_path);
        }
        if (cursor_unsized) {
            throw LayoutError("Unsized struct member " + path + "." + *prev_name +
                              " must be last, but found subsequent member " + m.name);
        }
        if (!m.type) {
            throw LayoutError("Member " + member_path + " has no type");
        }

        LayoutPtr type = layout_node(*m.type, member_path);

        // Alignment
        size_t align = type->min_byte_align;
        if (m.info.align) {
            if (*m.info.align == 0) {
                throw LayoutError("Member " + member_path + " has explicit alignment 0");
            }
            if (*m.info.align % type->min_byte_align != 0) {
                std::ostringstream oss;
                oss << "Member " << member_path << " has explicit alignment " << *m.info.align
                    << " that is not a multiple of its type alignment " << type->min_byte_align;
                throw LayoutError(oss.str());
            }
            align = *m.info.align;
        }

        // Offset
        size_t offset = 0;
        if (m.info.offset) {
            offset = *m.info.offset;
            if (offset % align != 0) {
                std::ostringstream oss;
                oss << "Member " << member_path << " has offset " << offset
                    << " but alignment " << align;
                throw LayoutError(oss.str());
            }
            if (offset < cursor) {
                std::ostringstream oss;
                oss << "Found member " << member_path << " with explicit offset " << offset
                    << " that is less than the end offset " << cursor
                    << " of previous member " << (prev_name ? *prev_name : std::string());
                throw LayoutError(oss.str());
            }
        } else {
            checked_add(cursor, align - 1, member_path);
            offset = align_up(cursor, align);
        }

        // Size
        size_t size = type->min_byte_size;
        if (m.info.size) {
            if (type->unsized) {
                throw LayoutError("Unsized member " + member_path + " cannot have an explicit size");
            }
            if (*m.info.size < type->min_byte_size) {
                std::ostringstream oss;
                oss << "Member " << member_path << " has explicit size " << *m.info.size
                    << " smaller than its type size " << type->min_byte_size;
                throw LayoutError(oss.str());
            }
            size = *m.info.size;
        }

        if (type->unsized) {
            // The tail is placed at `offset` but adds nothing to the static
            // size; cursor stays at the end of the last sized member.
            cursor_unsized = true;
        } else {
            cursor = checked_add(offset, size, member_path);
        }
        type_align = std::max(type_align, type->min_byte_align);

        result.members.push_back(MemberLayout{m.name, offset, align, size, std::move(type)});
        prev_name = &m.name;
    }

    auto layout = std::make_shared<TypeLayout>();
    layout->unsized = cursor_unsized;
    layout->min_byte_size = cursor;
    layout->min_byte_align = type_align;

    if (desc.align) {
        if (*desc.align == 0 || *desc.align % type_align != 0) {
            std::ostringstream oss;
            oss << "Struct " << path << " has explicit alignment " << *desc.align
                << " that is not a multiple of its member alignment " << type_align;
            throw LayoutError(oss.str());
        }
        layout->min_byte_align = *desc.align;
    }
    if (desc.size) {
        if (cursor_unsized) {
            throw LayoutError("Unsized struct " + path + " cannot have an explicit size");
        }
        if (*desc.size < cursor) {
            std::ostringstream oss;
            oss << "Struct " << path << " has explicit size " << *desc.size
                << " smaller than its minimum size " << cursor;
            throw LayoutError(oss.str());
        }
        layout->min_byte_size = *desc.size;
    }

    layout->shape = std::move(result);
    return layout;
}

LayoutPtr layout_node(const TypeDesc& desc, const std::string& path) {
    return std::visit([&path](const auto& shape) -> LayoutPtr {
        using T = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<T, ScalarDesc>) {
            return layout_scalar(shape);
        } else if constexpr (std::is_same_v<T, ArrayDesc>) {
            return layout_array(shape, path);
        } else {
            return layout_struct(shape, path);
        }
    }, desc.shape());
}

void describe_shape(std::ostream& os, const TypeLayout& layout) {
    if (layout.is_scalar()) {
        os << scalar_kind_name(layout.as_scalar().kind);
    } else if (layout.is_struct()) {
        os << "struct{";
        bool first = true;
        for (const auto& m : layout.as_struct().members) {
            if (!first) {
                os << ", ";
            }
            first = false;
            os << m.name << ":";
            describe_shape(os, *m.type);
            os << "@" << m.byte_offset;
        }
        os << "}";
    } else {
        const auto& arr = layout.as_array();
        os << "array<";
        describe_shape(os, *arr.element);
        os << ", ";
        if (arr.length) {
            os << *arr.length;
        } else {
            os << "unsized";
        }
        os << ", stride=" << arr.byte_stride << ">";
    }
}

}  // namespace

const MemberLayout* StructLayout::find(const std::string& name) const noexcept {
    for (const auto& m : members) {
        if (m.name == name) {
            return &m;
        }
    }
    return nullptr;
}

LayoutPtr compute_layout(const TypeDesc& desc) {
    LayoutPtr layout = layout_node(desc, "<root>");
    if (logx::enabled(logx::Level::Debug)) {
        logx::debug("computed layout %s", describe(*layout).c_str());
    }
    return layout;
}

LayoutPtr wrap_layout(LayoutPtr inner) {
    auto wrapper = std::make_shared<TypeLayout>();
    wrapper->min_byte_size = inner->min_byte_size;
    wrapper->min_byte_align = inner->min_byte_align;
    wrapper->unsized = inner->unsized;

    StructLayout shape;
    const size_t align = inner->min_byte_align;
    const size_t size = inner->min_byte_size;
    shape.members.push_back(MemberLayout{WRAPPED_VALUE_NAME, 0, align, size, std::move(inner)});
    wrapper->shape = std::move(shape);
    return wrapper;
}

std::string describe(const TypeLayout& layout) {
    std::ostringstream oss;
    describe_shape(oss, layout);
    oss << " size=" << layout.min_byte_size << " align=" << layout.min_byte_align;
    if (layout.unsized) {
        oss << " unsized";
    }
    return oss.str();
}

}  // namespace structured_view
