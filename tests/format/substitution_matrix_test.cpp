// =============================================================================
// cramdec - Substitution Matrix Tests
// =============================================================================

#include <gtest/gtest.h>

#include <array>
#include <cstdint>

#include "cramdec/format/substitution_matrix.h"

namespace cramdec::format::test {

TEST(SubstitutionMatrixTest, DefaultOrdersOtherBases) {
    const SubstitutionMatrix matrix;

    EXPECT_EQ(*matrix.get('A', 0), 'C');
    EXPECT_EQ(*matrix.get('A', 1), 'G');
    EXPECT_EQ(*matrix.get('A', 2), 'T');
    EXPECT_EQ(*matrix.get('A', 3), 'N');
    EXPECT_EQ(*matrix.get('T', 3), 'N');
    EXPECT_EQ(*matrix.get('N', 0), 'A');
    EXPECT_EQ(*matrix.get('N', 3), 'T');

    const std::array<std::uint8_t, kSubstitutionMatrixSize> expected = {0x1B, 0x1B, 0x1B, 0x1B,
                                                                        0x1B};
    EXPECT_EQ(matrix.toBytes(), expected);
}

TEST(SubstitutionMatrixTest, ParsesPackedCodes) {
    // Row A: C=3 G=2 T=1 N=0.
    const std::array<std::uint8_t, kSubstitutionMatrixSize> bytes = {0xE4, 0x1B, 0x1B, 0x1B,
                                                                     0x1B};
    auto matrix = SubstitutionMatrix::fromBytes(bytes);
    ASSERT_TRUE(matrix.has_value());

    EXPECT_EQ(*matrix->get('A', 0), 'N');
    EXPECT_EQ(*matrix->get('A', 1), 'T');
    EXPECT_EQ(*matrix->get('A', 2), 'G');
    EXPECT_EQ(*matrix->get('A', 3), 'C');
    EXPECT_EQ(matrix->toBytes(), bytes);
}

TEST(SubstitutionMatrixTest, NonAcgtReferenceCountsAsN) {
    const SubstitutionMatrix matrix;
    EXPECT_EQ(*matrix.get('a', 0), 'C');
    EXPECT_EQ(*matrix.get('R', 0), *matrix.get('N', 0));
}

TEST(SubstitutionMatrixTest, RejectsReusedCode) {
    const std::array<std::uint8_t, kSubstitutionMatrixSize> bytes = {0x1B, 0x00, 0x1B, 0x1B,
                                                                     0x1B};
    auto matrix = SubstitutionMatrix::fromBytes(bytes);
    ASSERT_FALSE(matrix.has_value());
    EXPECT_EQ(matrix.error().code(), ErrorCode::kInvalidData);
}

TEST(SubstitutionMatrixTest, RejectsCodeAboveThree) {
    const SubstitutionMatrix matrix;
    auto base = matrix.get('A', 4);
    ASSERT_FALSE(base.has_value());
    EXPECT_EQ(base.error().code(), ErrorCode::kInvalidData);
}

}  // namespace cramdec::format::test
