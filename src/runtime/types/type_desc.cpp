/**
 * @file type_desc.cpp
 * @brief Type description builders.
 */

#include "structured_view/type_desc.hpp"

#include <stdexcept>
#include <utility>

namespace structured_view {

TypeDesc scalar(ScalarKind kind) {
    return TypeDesc(ScalarDesc{kind});
}

TypeDesc scalar(std::string_view tag) {
    auto kind = parse_scalar_kind(tag);
    if (!kind) {
        throw std::invalid_argument("TypeDesc: unknown scalar kind '" + std::string(tag) + "'");
    }
    return TypeDesc(ScalarDesc{*kind});
}

TypeDesc array(TypeDesc element, uint64_t length, std::optional<size_t> stride) {
    ArrayDesc desc;
    desc.element = std::make_shared<const TypeDesc>(std::move(element));
    desc.length = length;
    desc.stride = stride;
    return TypeDesc(std::move(desc));
}

TypeDesc unsized_array(TypeDesc element, std::optional<size_t> stride) {
    ArrayDesc desc;
    desc.element = std::make_shared<const TypeDesc>(std::move(element));
    desc.length = std::nullopt;
    desc.stride = stride;
    return TypeDesc(std::move(desc));
}

MemberDesc member(std::string name, TypeDesc type, MemberInfo info) {
    return MemberDesc{std::move(name),
                      std::make_shared<const TypeDesc>(std::move(type)),
                      info};
}

TypeDesc structure(std::vector<MemberDesc> members,
                   std::optional<size_t> align,
                   std::optional<size_t> size) {
    StructDesc desc;
    desc.members = std::move(members);
    desc.align = align;
    desc.size = size;
    return TypeDesc(std::move(desc));
}

}  // namespace structured_view
