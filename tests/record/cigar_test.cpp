// =============================================================================
// cramdec - CIGAR Conversion Tests
// =============================================================================

#include <gtest/gtest.h>

#include <vector>

#include "cramdec/record/cigar.h"

namespace cramdec::record::test {

TEST(CigarTest, NoFeaturesIsOneMatch) {
    auto cigar = featuresToCigar({}, 5);
    ASSERT_TRUE(cigar.has_value());
    EXPECT_EQ(*cigar, (Cigar{{CigarOpKind::kMatch, 5}}));
    EXPECT_EQ(cigarToString(*cigar), "5M");
}

TEST(CigarTest, EmptyReadIsStar) {
    auto cigar = featuresToCigar({}, 0);
    ASSERT_TRUE(cigar.has_value());
    EXPECT_TRUE(cigar->empty());
    EXPECT_EQ(cigarToString(*cigar), "*");
}

TEST(CigarTest, MixedFeatures) {
    const std::vector<Feature> features = {
        feature::Substitution{3, 0},
        feature::Insertion{5, {'A', 'C'}},
        feature::Deletion{7, 2},
        feature::QualityScore{8, 30},
        feature::SoftClip{9, {'G', 'G'}},
    };

    auto cigar = featuresToCigar(features, 10);
    ASSERT_TRUE(cigar.has_value()) << cigar.error().describe();
    EXPECT_EQ(cigarToString(*cigar), "4M2I2D2M2S");
}

TEST(CigarTest, LeadingHardClipAndSkip) {
    const std::vector<Feature> features = {
        feature::HardClip{1, 5},
        feature::ReferenceSkip{3, 100},
        feature::Padding{3, 1},
    };

    auto cigar = featuresToCigar(features, 4);
    ASSERT_TRUE(cigar.has_value());
    EXPECT_EQ(cigarToString(*cigar), "5H2M100N1P2M");
}

TEST(CigarTest, OverlappingFeaturesAreInvalidData) {
    const std::vector<Feature> features = {
        feature::Insertion{3, {'A', 'A', 'A'}},
        feature::Substitution{4, 1},
    };

    auto cigar = featuresToCigar(features, 10);
    ASSERT_FALSE(cigar.has_value());
    EXPECT_EQ(cigar.error().code(), ErrorCode::kInvalidData);
}

TEST(CigarTest, FeaturesPastReadLengthAreInvalidData) {
    const std::vector<Feature> runsPast = {feature::SoftClip{9, {'A', 'A', 'A'}}};
    auto a = featuresToCigar(runsPast, 10);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().code(), ErrorCode::kInvalidData);

    const std::vector<Feature> outside = {feature::Deletion{12, 1}};
    auto b = featuresToCigar(outside, 10);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error().code(), ErrorCode::kInvalidData);
}

TEST(CigarTest, TrailingDeletionAfterLastBase) {
    const std::vector<Feature> features = {feature::Deletion{4, 3}};
    auto cigar = featuresToCigar(features, 3);
    ASSERT_TRUE(cigar.has_value());
    EXPECT_EQ(cigarToString(*cigar), "3M3D");
}

}  // namespace cramdec::record::test
