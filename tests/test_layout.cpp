/**
 * @file test_layout.cpp
 * @brief Unit tests for the layout calculator.
 *
 * Tests cover:
 * - Scalar, array and struct layout rules
 * - Member placement with explicit offsets, alignments and sizes
 * - Every rejected description (LayoutError)
 * - Unsized tails and the wrapping struct
 */

#include <gtest/gtest.h>

#include <string>

#include "structured_view/layout.hpp"
#include "structured_view/type_desc.hpp"

using namespace structured_view;

namespace {

// Expect compute_layout to throw a LayoutError whose message contains `needle`.
void expect_layout_error(const TypeDesc& desc, const std::string& needle) {
    try {
        compute_layout(desc);
        FAIL() << "expected LayoutError containing '" << needle << "'";
    } catch (const LayoutError& e) {
        EXPECT_NE(std::string(e.what()).find(needle), std::string::npos)
            << "message was: " << e.what();
    }
}

}  // namespace

// ============================================================================
// Scalars
// ============================================================================

TEST(LayoutScalar, SizeEqualsAlignEqualsWidth) {
    for (const auto& info : SCALAR_KINDS) {
        LayoutPtr layout = compute_layout(scalar(info.kind));
        EXPECT_EQ(layout->min_byte_size, info.width) << info.tag;
        EXPECT_EQ(layout->min_byte_align, info.width) << info.tag;
        EXPECT_FALSE(layout->unsized) << info.tag;
        ASSERT_TRUE(layout->is_scalar());
        EXPECT_EQ(layout->as_scalar().kind, info.kind);
    }
}

TEST(LayoutScalar, UnknownTagRejectedByBuilder) {
    EXPECT_THROW(scalar("i24"), std::invalid_argument);
}

// ============================================================================
// Arrays
// ============================================================================

TEST(LayoutArray, ExplicitStride) {
    LayoutPtr layout = compute_layout(array(scalar("i32"), 2, 4));
    EXPECT_EQ(layout->min_byte_size, 8u);
    EXPECT_EQ(layout->min_byte_align, 4u);
    EXPECT_FALSE(layout->unsized);
    EXPECT_EQ(layout->as_array().byte_stride, 4u);
    EXPECT_EQ(*layout->as_array().length, 2u);
}

TEST(LayoutArray, LastElementDoesNotFillStride) {
    LayoutPtr layout = compute_layout(array(scalar("i32"), 3, 16));
    EXPECT_EQ(layout->min_byte_size, 2u * 16u + 4u);
}

TEST(LayoutArray, DefaultStrideRoundsToElementAlignment) {
    // struct { f64 a; u8 b; } has size 9, align 8 -> stride 16
    TypeDesc elem = structure({
        member("a", scalar("f64")),
        member("b", scalar("u8")),
    });
    LayoutPtr layout = compute_layout(array(elem, 2));
    EXPECT_EQ(layout->as_array().byte_stride, 16u);
    EXPECT_EQ(layout->min_byte_size, 16u + 9u);
    EXPECT_EQ(layout->min_byte_align, 8u);
}

TEST(LayoutArray, ZeroLengthHasZeroSize) {
    LayoutPtr layout = compute_layout(array(scalar("f64"), 0));
    EXPECT_EQ(layout->min_byte_size, 0u);
    EXPECT_EQ(layout->min_byte_align, 8u);
    EXPECT_FALSE(layout->unsized);
}

TEST(LayoutArray, Unsized) {
    LayoutPtr layout = compute_layout(unsized_array(scalar("u16")));
    EXPECT_EQ(layout->min_byte_size, 0u);
    EXPECT_EQ(layout->min_byte_align, 2u);
    EXPECT_TRUE(layout->unsized);
    EXPECT_FALSE(layout->as_array().length.has_value());
    EXPECT_EQ(layout->as_array().byte_stride, 2u);
}

TEST(LayoutArray, RejectsStrideSmallerThanElement) {
    expect_layout_error(array(scalar("i32"), 2, 2), "must fit within array stride 2");
}

TEST(LayoutArray, RejectsStrideNotMultipleOfAlignment) {
    expect_layout_error(array(scalar("i32"), 2, 6), "must be a multiple of element alignment 4");
}

TEST(LayoutArray, RejectsUnsizedElement) {
    TypeDesc tail = structure({member("data", unsized_array(scalar("u8")))});
    expect_layout_error(array(tail, 4), "must be sized");
    expect_layout_error(unsized_array(unsized_array(scalar("u8"))), "must be sized");
}

TEST(LayoutArray, RejectsOverflowingSize) {
    expect_layout_error(array(scalar("u64"), UINT64_MAX), "overflows");
}

// ============================================================================
// Structs
// ============================================================================

TEST(LayoutStruct, OffsetAndAlignOverrides) {
    // {x: ['i32', {offset: 0}], y: ['i8', {align: 4}]}
    LayoutPtr layout = compute_layout(structure({
        member("x", scalar("i32"), MemberInfo::at_offset(0)),
        member("y", scalar("i8"), MemberInfo::aligned(4)),
    }));

    const auto& members = layout->as_struct().members;
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[0].name, "x");
    EXPECT_EQ(members[0].byte_offset, 0u);
    EXPECT_EQ(members[0].byte_size, 4u);
    EXPECT_EQ(members[1].name, "y");
    EXPECT_EQ(members[1].byte_offset, 4u);
    EXPECT_EQ(members[1].byte_align, 4u);
    EXPECT_EQ(layout->min_byte_size, 5u);
    EXPECT_EQ(layout->min_byte_align, 4u);
    EXPECT_FALSE(layout->unsized);
}

TEST(LayoutStruct, DefaultPackingPadsToTypeAlignment) {
    LayoutPtr layout = compute_layout(structure({
        member("a", scalar("u8")),
        member("b", scalar("u32")),
        member("c", scalar("u16")),
        member("d", scalar("f64")),
    }));
    const auto& m = layout->as_struct().members;
    EXPECT_EQ(m[0].byte_offset, 0u);
    EXPECT_EQ(m[1].byte_offset, 4u);
    EXPECT_EQ(m[2].byte_offset, 8u);
    EXPECT_EQ(m[3].byte_offset, 16u);
    EXPECT_EQ(layout->min_byte_size, 24u);
    EXPECT_EQ(layout->min_byte_align, 8u);
}

TEST(LayoutStruct, OffsetsAreNonDecreasingAndAligned) {
    LayoutPtr layout = compute_layout(structure({
        member("a", scalar("u8")),
        member("b", array(scalar("u16"), 3)),
        member("c", scalar("u8"), MemberInfo::aligned(8)),
        member("d", scalar("f32"), MemberInfo::at_offset(20)),
        member("e", scalar("u8"), MemberInfo().with_size(3)),
        member("f", scalar("u16")),
    }));
    size_t prev = 0;
    for (const auto& m : layout->as_struct().members) {
        EXPECT_GE(m.byte_offset, prev) << m.name;
        EXPECT_EQ(m.byte_offset % m.byte_align, 0u) << m.name;
        prev = m.byte_offset;
    }
    // e occupies 24..27 because of its size override, f is then padded to 28
    EXPECT_EQ(layout->as_struct().find("e")->byte_offset, 24u);
    EXPECT_EQ(layout->as_struct().find("f")->byte_offset, 28u);
    EXPECT_EQ(layout->min_byte_size, 30u);
}

TEST(LayoutStruct, MemberAlignOverrideDoesNotRaiseStructAlignment) {
    LayoutPtr layout = compute_layout(structure({
        member("a", scalar("u8")),
        member("b", scalar("u8"), MemberInfo::aligned(16)),
    }));
    EXPECT_EQ(layout->as_struct().members[1].byte_offset, 16u);
    EXPECT_EQ(layout->min_byte_size, 17u);
    EXPECT_EQ(layout->min_byte_align, 1u);
}

TEST(LayoutStruct, Empty) {
    LayoutPtr layout = compute_layout(structure({}));
    EXPECT_EQ(layout->min_byte_size, 0u);
    EXPECT_EQ(layout->min_byte_align, 1u);
    EXPECT_FALSE(layout->unsized);
    EXPECT_TRUE(layout->as_struct().members.empty());
}

TEST(LayoutStruct, StructLevelOverrides) {
    LayoutPtr layout = compute_layout(structure({
        member("a", scalar("u32")),
        member("b", scalar("u8")),
    }, 16, 32));
    EXPECT_EQ(layout->min_byte_align, 16u);
    EXPECT_EQ(layout->min_byte_size, 32u);
}

TEST(LayoutStruct, NestedStructUsesItsOwnAlignment) {
    TypeDesc inner = structure({member("v", scalar("f32"))}, 16, 16);
    LayoutPtr layout = compute_layout(structure({
        member("a", scalar("u8")),
        member("inner", inner),
    }));
    EXPECT_EQ(layout->as_struct().find("inner")->byte_offset, 16u);
    EXPECT_EQ(layout->min_byte_size, 32u);
    EXPECT_EQ(layout->min_byte_align, 16u);
}

TEST(LayoutStruct, UnsizedTail) {
    LayoutPtr layout = compute_layout(structure({
        member("count", scalar("u8")),
        member("items", unsized_array(scalar("u32"))),
    }));
    EXPECT_TRUE(layout->unsized);
    EXPECT_EQ(layout->as_struct().find("items")->byte_offset, 4u);
    // Padding before the tail is not part of the static size.
    EXPECT_EQ(layout->min_byte_size, 1u);
    EXPECT_EQ(layout->min_byte_align, 4u);
}

TEST(LayoutStruct, OnlyUnsizedMember) {
    LayoutPtr layout = compute_layout(structure({
        member("x", unsized_array(scalar("i32"))),
    }));
    EXPECT_TRUE(layout->unsized);
    EXPECT_EQ(layout->min_byte_size, 0u);
}

TEST(LayoutStruct, NestedUnsizedStructMustBeLast) {
    TypeDesc tail = structure({member("data", unsized_array(scalar("u8")))});
    LayoutPtr ok = compute_layout(structure({
        member("n", scalar("u32")),
        member("tail", tail),
    }));
    EXPECT_TRUE(ok->unsized);

    expect_layout_error(structure({
        member("tail", tail),
        member("n", scalar("u32")),
    }), "must be last");
}

TEST(LayoutStruct, RejectsMemberAfterUnsized) {
    expect_layout_error(structure({
        member("x", unsized_array(scalar("i32"))),
        member("y", scalar("i32")),
    }), "Unsized struct member <root>.x must be last, but found subsequent member y");

    expect_layout_error(structure({
        member("x", unsized_array(scalar("i32"))),
        member("y", scalar("i32"), MemberInfo::at_offset(64)),
    }), "must be last");
}

TEST(LayoutStruct, RejectsMisalignedExplicitOffset) {
    expect_layout_error(structure({
        member("x", scalar("u8")),
        member("y", scalar("u32"), MemberInfo::at_offset(2)),
    }), "has offset 2 but alignment 4");
}

TEST(LayoutStruct, RejectsOverlappingExplicitOffset) {
    expect_layout_error(structure({
        member("x", scalar("u32")),
        member("y", scalar("u16"), MemberInfo::at_offset(2)),
    }), "less than the end offset 4");
}

TEST(LayoutStruct, RejectsAlignNotMultipleOfTypeAlign) {
    expect_layout_error(structure({
        member("x", scalar("u32"), MemberInfo::aligned(2)),
    }), "not a multiple of its type alignment 4");
    expect_layout_error(structure({
        member("x", scalar("u32"), MemberInfo::aligned(6)),
    }), "not a multiple of its type alignment 4");
}

TEST(LayoutStruct, RejectsZeroAlign) {
    expect_layout_error(structure({
        member("x", scalar("u8"), MemberInfo::aligned(0)),
    }), "alignment 0");
    expect_layout_error(structure({member("x", scalar("u8"))}, 0), "explicit alignment 0");
}

TEST(LayoutStruct, RejectsExplicitOffsetNotMultipleOfAlignOverride) {
    MemberInfo info = MemberInfo::at_offset(4);
    info.align = 8;
    expect_layout_error(structure({member("x", scalar("u8"), info)}),
                        "has offset 4 but alignment 8");
}

TEST(LayoutStruct, RejectsMemberSizeTooSmall) {
    expect_layout_error(structure({
        member("x", scalar("f64"), MemberInfo().with_size(4)),
    }), "explicit size 4 smaller than its type size 8");
}

TEST(LayoutStruct, RejectsStructSizeTooSmall) {
    expect_layout_error(structure({
        member("x", scalar("f64")),
        member("y", scalar("u8")),
    }, std::nullopt, 8), "explicit size 8 smaller than its minimum size 9");
}

TEST(LayoutStruct, RejectsStructAlignNotMultiple) {
    expect_layout_error(structure({member("x", scalar("u32"))}, 2),
                        "not a multiple of its member alignment 4");
}

TEST(LayoutStruct, RejectsSizeOnUnsized) {
    expect_layout_error(structure({
        member("x", unsized_array(scalar("u8")), MemberInfo().with_size(16)),
    }), "cannot have an explicit size");
    expect_layout_error(structure({
        member("x", unsized_array(scalar("u8"))),
    }, std::nullopt, 16), "cannot have an explicit size");
}

TEST(LayoutStruct, RejectsDuplicateNames) {
    expect_layout_error(structure({
        member("x", scalar("u8")),
        member("x", scalar("u16")),
    }), "Duplicate member name <root>.x");
}

TEST(LayoutStruct, ErrorNamesNestedPath) {
    expect_layout_error(structure({
        member("outer", structure({
            member("values", array(scalar("f32"), 4, 2)),
        })),
    }), "<root>.outer.values");
}

// ============================================================================
// Wrapping and description
// ============================================================================

TEST(LayoutWrap, SingleValueMemberAtZero) {
    LayoutPtr inner = compute_layout(scalar("u16"));
    LayoutPtr wrapped = wrap_layout(inner);

    ASSERT_TRUE(wrapped->is_struct());
    const auto& members = wrapped->as_struct().members;
    ASSERT_EQ(members.size(), 1u);
    EXPECT_EQ(members[0].name, WRAPPED_VALUE_NAME);
    EXPECT_EQ(members[0].byte_offset, 0u);
    EXPECT_EQ(members[0].type, inner);
    EXPECT_EQ(wrapped->min_byte_size, 2u);
    EXPECT_EQ(wrapped->min_byte_align, 2u);
}

TEST(LayoutWrap, KeepsUnsizedness) {
    LayoutPtr wrapped = wrap_layout(compute_layout(unsized_array(scalar("u8"))));
    EXPECT_TRUE(wrapped->unsized);
}

TEST(LayoutDescribe, Summary) {
    LayoutPtr layout = compute_layout(structure({
        member("x", scalar("i32"), MemberInfo::at_offset(0)),
        member("y", scalar("i8"), MemberInfo::aligned(4)),
        member("z", unsized_array(scalar("u8"))),
    }));
    EXPECT_EQ(describe(*layout),
              "struct{x:i32@0, y:i8@4, z:array<u8, unsized, stride=1>@5} size=5 align=4 unsized");
}
