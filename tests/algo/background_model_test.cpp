// =============================================================================
// infinium-norm - Background Model Tests
// =============================================================================

#include "inorm/algo/background_model.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "inorm/algo/intensity_extractor.h"
#include "inorm/common/error.h"
#include "test_fixtures.h"

namespace inorm::algo {
namespace {

using namespace inorm::test;

// =============================================================================
// Thresholds
// =============================================================================

TEST(BackgroundThresholdTest, DetectionZ) {
    EXPECT_NEAR(detectionZ(0.05), 1.6448536269514722, 1e-12);
    EXPECT_EQ(detectionZ(1.0), -std::numeric_limits<double>::infinity());
}

TEST(BackgroundThresholdTest, GreenThresholdAtFivePercent) {
    // 2 * 100 + 1.6449 * sqrt(2) * 10
    EXPECT_NEAR(channelThreshold(100.0, 10.0, detectionZ(0.05)), 223.26, 0.01);
}

TEST(BackgroundThresholdTest, DetectionOneDisablesThreshold) {
    EXPECT_EQ(channelThreshold(100.0, 0.0, detectionZ(1.0)),
              -std::numeric_limits<double>::infinity());
}

RC_GTEST_PROP(BackgroundThresholdProperty, IncreasesAsDetectionDecreases, ()) {
    const int stricter = *rc::gen::inRange(1, 998);
    const int looser = *rc::gen::inRange(stricter + 1, 1000);
    const double mean = *rc::gen::inRange(10, 1000);
    const double sd = *rc::gen::inRange(1, 200);

    RC_ASSERT(channelThreshold(mean, sd, detectionZ(stricter / 1000.0)) >
              channelThreshold(mean, sd, detectionZ(looser / 1000.0)));
}

// =============================================================================
// Estimation
// =============================================================================

class BackgroundModelTest : public ::testing::Test {
protected:
    SampleIntensities extract(const BeadSummary& beads) const {
        return IntensityExtractor(manifest_, kDefaultMinBeads).extract(beads);
    }

    Manifest manifest_ = syntheticManifest();
    BackgroundModel model_{manifest_, 0.05};
};

TEST_F(BackgroundModelTest, UsesNegativeControlsOnly) {
    EXPECT_EQ(model_.negativeControls().size(), 4u);
}

TEST_F(BackgroundModelTest, EstimateFromNegativeControls) {
    const Background bg = model_.estimate(extract(syntheticSample("S1")));

    // Green negatives 90, 100, 110, 100; red 80, 100, 120, 100
    EXPECT_DOUBLE_EQ(bg.negMeanGrn, 100.0);
    EXPECT_DOUBLE_EQ(bg.negMeanRed, 100.0);
    EXPECT_NEAR(bg.negSdGrn, std::sqrt(200.0 / 3.0), 1e-9);
    EXPECT_NEAR(bg.negSdRed, std::sqrt(800.0 / 3.0), 1e-9);
    EXPECT_DOUBLE_EQ(bg.negMeanOverall, 100.0);
    EXPECT_NEAR(bg.negSdOverall, (bg.negSdRed - bg.negSdGrn) / 2.0, 1e-9);

    const double z = model_.z();
    EXPECT_NEAR(bg.thresholdGrn, 200.0 + z * std::sqrt(2.0) * bg.negSdGrn, 1e-9);
    EXPECT_NEAR(bg.thresholdRed, 200.0 + z * std::sqrt(2.0) * bg.negSdRed, 1e-9);
    EXPECT_NEAR(bg.thresholdII, 100.0 + z * std::sqrt(2.0) * bg.negSdOverall, 1e-9);

    EXPECT_DOUBLE_EQ(bg.threshold(ProbeType::kInfIGrn), bg.thresholdGrn);
    EXPECT_DOUBLE_EQ(bg.threshold(ProbeType::kInfII), bg.thresholdII);
}

TEST_F(BackgroundModelTest, AllNegativesMissingIsDegenerate) {
    SampleBuilder builder;
    for (BeadAddress address : {kNeg1, kNeg2, kNeg3, kNeg4}) {
        builder.set(address, bead(100.0, 100.0, 0));
    }
    const SampleIntensities intensities = extract(builder.build("S1"));
    EXPECT_THROW((void)model_.estimate(intensities), DegenerateInputError);
}

TEST_F(BackgroundModelTest, SingleNegativeInOneChannelIsDegenerate) {
    SampleBuilder builder;
    for (BeadAddress address : {kNeg1, kNeg2, kNeg3}) {
        builder.set(address, BeadRecord{5, 100.0, 1.0, 0, 100.0, 1.0});
    }
    try {
        (void)model_.estimate(extract(builder.build("GSM3")));
        FAIL() << "expected DegenerateInputError";
    } catch (const DegenerateInputError& e) {
        EXPECT_EQ(e.context()->sampleId, "GSM3");
    }
}

TEST_F(BackgroundModelTest, DetectionOneAcceptsEverything) {
    const BackgroundModel lenient(manifest_, 1.0);
    const Background bg = lenient.estimate(extract(syntheticSample("S1")));
    EXPECT_TRUE(std::isinf(bg.thresholdGrn));
    EXPECT_LT(bg.thresholdII, 0.0);
}

TEST_F(BackgroundModelTest, EstimateAllFollowsColumns) {
    const std::vector<BeadSummary> samples{syntheticSample("S1"), syntheticSample("S2")};
    const IntensityMatrices matrices =
        IntensityExtractor(manifest_, kDefaultMinBeads).extractAll(samples);
    const auto backgrounds = model_.estimateAll(matrices);
    ASSERT_EQ(backgrounds.size(), 2u);
    EXPECT_DOUBLE_EQ(backgrounds[1].negMeanRed, 100.0);
}

}  // namespace
}  // namespace inorm::algo
