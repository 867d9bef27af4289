// =============================================================================
// infinium-norm - QC Summary Tests
// =============================================================================

#include "inorm/algo/qc_summary.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "inorm/algo/intensity_extractor.h"
#include "test_fixtures.h"

namespace inorm::algo {
namespace {

[[nodiscard]] std::size_t metric(std::string_view name) {
    const auto it = std::find(kQcMetricNames.begin(), kQcMetricNames.end(), name);
    return static_cast<std::size_t>(it - kQcMetricNames.begin());
}

class QcSummaryTest : public ::testing::Test {
protected:
    QcSummaryTest()
        : intensities_(IntensityExtractor(manifest_, kDefaultMinBeads)
                           .extract(test::syntheticSample("S1"))) {}

    Manifest manifest_ = test::syntheticManifest();
    SampleIntensities intensities_;
    QcPlan plan_{manifest_};
    // cg01 .. cg05; cg04 on X, cg05 on Y
    std::vector<double> betas_{0.75, 0.5, 0.25, 0.5, 0.75};
};

TEST_F(QcSummaryTest, MetricNames) {
    const auto names = QcPlan::metricNames();
    ASSERT_EQ(names.size(), kQcMetricCount);
    EXPECT_EQ(names.front(), "bc1_grn");
    EXPECT_EQ(names.back(), "missing_chrY");
}

TEST_F(QcSummaryTest, PlanMarksUnresolvedSubgroups) {
    const auto rules = plan_.rules();
    ASSERT_EQ(rules.size(), kQcMetricCount - 3);
    EXPECT_TRUE(rules[metric("bc1_grn")].available);
    EXPECT_FALSE(rules[metric("bc1_red")].available);
    EXPECT_TRUE(rules[metric("ext_a")].available);
    EXPECT_FALSE(rules[metric("hyb_low")].available);
    EXPECT_EQ(rules[metric("tr")].signal.size(), 2u);
}

TEST_F(QcSummaryTest, BisulfiteSignalDerivedFromBackground) {
    const QcRule& rule = plan_.rules()[metric("bc1_grn")];
    ASSERT_EQ(rule.signal.size(), 1u);
    ASSERT_EQ(rule.background.size(), 1u);
    EXPECT_EQ(manifest_.control(rule.signal[0]).address, test::kBsC1);
    EXPECT_EQ(manifest_.control(rule.background[0]).address, test::kBsU1);
}

TEST_F(QcSummaryTest, ControlMetrics) {
    const auto qc = plan_.compute(intensities_.controlGrn, intensities_.controlRed, betas_);

    EXPECT_DOUBLE_EQ(qc[metric("ext_a")], 6000.0);
    EXPECT_DOUBLE_EQ(qc[metric("bc1_grn")], 20.0);
    EXPECT_DOUBLE_EQ(qc[metric("st_grn")], 40.0);
    EXPECT_DOUBLE_EQ(qc[metric("tr")], 250.0);
    EXPECT_TRUE(isMissing(qc[metric("bc1_red")]));
    EXPECT_TRUE(isMissing(qc[metric("st_red")]));
    EXPECT_TRUE(isMissing(qc[metric("spec2")]));
}

TEST_F(QcSummaryTest, BetaMetrics) {
    const auto qc = plan_.compute(intensities_.controlGrn, intensities_.controlRed, betas_);
    EXPECT_DOUBLE_EQ(qc[metric("missing")], 0.0);
    EXPECT_DOUBLE_EQ(qc[metric("median_chrX")], 0.5);
    EXPECT_DOUBLE_EQ(qc[metric("missing_chrY")], 0.0);
}

TEST_F(QcSummaryTest, AllChrYMissing) {
    betas_[4] = kMissing;
    const auto qc = plan_.compute(intensities_.controlGrn, intensities_.controlRed, betas_);
    EXPECT_DOUBLE_EQ(qc[metric("missing_chrY")], 1.0);
    EXPECT_DOUBLE_EQ(qc[metric("missing")], 0.2);
}

TEST_F(QcSummaryTest, SummarizeIsSampleByMetric) {
    const std::vector<std::string> samples{"S1"};
    LabeledMatrix grn(controlIds(manifest_), samples);
    LabeledMatrix red(controlIds(manifest_), samples);
    grn.setColumn(0, intensities_.controlGrn);
    red.setColumn(0, intensities_.controlRed);
    LabeledMatrix betas({"cg01", "cg02", "cg03", "cg04", "cg05"}, samples);
    betas.setColumn(0, betas_);

    const LabeledMatrix summary = plan_.summarize(grn, red, betas);
    EXPECT_EQ(summary.rows(), 1u);
    EXPECT_EQ(summary.cols(), kQcMetricCount);
    EXPECT_DOUBLE_EQ(summary.value("S1", "ext_a"), 6000.0);
}

// =============================================================================
// Full Control Panel
// =============================================================================

/// @brief Synthetic manifest extended with one bead for every remaining
///        QC subgroup.
class QcControlPanelTest : public ::testing::Test {
protected:
    QcControlPanelTest()
        : manifest_(makeManifest()),
          intensities_(IntensityExtractor(manifest_, kDefaultMinBeads).extract(makeSample())) {}

    [[nodiscard]] static Manifest makeManifest() {
        auto controls = test::syntheticControls();
        for (const auto& [address, type, description] : panel()) {
            controls.push_back(test::control(address, type, description));
        }
        return Manifest(ProbeManifest(test::syntheticProbes()),
                        ControlManifest(std::move(controls)));
    }

    [[nodiscard]] static BeadSummary makeSample() {
        test::SampleBuilder builder;
        builder.set(3103, test::bead(900, 100))
            .set(3104, test::bead(900, 2500))
            .set(3203, test::bead(100, 9000))
            .set(3204, test::bead(100, 300))
            .set(3401, test::bead(200, 900))
            .set(3402, test::bead(3000, 900))
            .set(3403, test::bead(900, 150))
            .set(3404, test::bead(900, 4500))
            .set(3501, test::bead(600, 1800))
            .set(3601, test::bead(500, 2000))
            .set(3701, test::bead(1000, 80))
            .set(3702, test::bead(5000, 80))
            .set(3703, test::bead(12000, 80))
            .set(3801, test::bead(80, 7000))
            .set(3802, test::bead(3500, 80));
        return builder.build("S1");
    }

    struct PanelBead {
        BeadAddress address;
        ControlType type;
        std::string description;
    };

    [[nodiscard]] static std::vector<PanelBead> panel() {
        return {
            {3103, ControlType::kBisulfiteConversionI, "BS Conversion I-U4"},
            {3104, ControlType::kBisulfiteConversionI, "BS Conversion I-C4"},
            {3203, ControlType::kStaining, "DNP (High)"},
            {3204, ControlType::kStaining, "DNP (Bkg)"},
            {3401, ControlType::kSpecificityI, "GT Mismatch 1 (MM)"},
            {3402, ControlType::kSpecificityI, "GT Mismatch 1 (PM)"},
            {3403, ControlType::kSpecificityI, "GT Mismatch 4 (MM)"},
            {3404, ControlType::kSpecificityI, "GT Mismatch 4 (PM)"},
            {3501, ControlType::kBisulfiteConversionII, "BS Conversion II-1"},
            {3601, ControlType::kSpecificityII, "Specificity 1"},
            {3701, ControlType::kHybridization, "Hyb (Low)"},
            {3702, ControlType::kHybridization, "Hyb (Medium)"},
            {3703, ControlType::kHybridization, "Hyb (High)"},
            {3801, ControlType::kNonPolymorphic, "NP (A)"},
            {3802, ControlType::kNonPolymorphic, "NP (C)"},
        };
    }

    [[nodiscard]] std::array<double, kQcMetricCount> compute() const {
        const QcPlan plan(manifest_);
        return plan.compute(intensities_.controlGrn, intensities_.controlRed, betas_);
    }

    Manifest manifest_;
    SampleIntensities intensities_;
    std::vector<double> betas_{0.75, 0.5, 0.25, 0.5, 0.75};
};

TEST_F(QcControlPanelTest, SpecificitySignalIsPerfectMatchBead) {
    const QcPlan plan(manifest_);
    const QcRule& rule = plan.rules()[metric("spec1_grn")];
    ASSERT_TRUE(rule.available);
    ASSERT_EQ(rule.signal.size(), 1u);
    ASSERT_EQ(rule.background.size(), 1u);
    EXPECT_EQ(manifest_.control(rule.signal[0]).address, 3402u);
    EXPECT_EQ(manifest_.control(rule.background[0]).address, 3401u);
}

TEST_F(QcControlPanelTest, SpecificityRatios) {
    const auto qc = compute();
    EXPECT_DOUBLE_EQ(qc[metric("spec1_grn")], 15.0);
    EXPECT_DOUBLE_EQ(qc[metric("spec1_red")], 30.0);
}

TEST_F(QcControlPanelTest, RedChannelRatios) {
    const auto qc = compute();
    EXPECT_DOUBLE_EQ(qc[metric("bc1_red")], 25.0);
    EXPECT_DOUBLE_EQ(qc[metric("st_red")], 30.0);
    // Green-channel ratios are unaffected by the extra beads
    EXPECT_DOUBLE_EQ(qc[metric("bc1_grn")], 20.0);
}

TEST_F(QcControlPanelTest, CrossChannelRatios) {
    const auto qc = compute();
    EXPECT_DOUBLE_EQ(qc[metric("bc2")], 3.0);
    EXPECT_DOUBLE_EQ(qc[metric("spec2")], 4.0);
}

TEST_F(QcControlPanelTest, HybridizationAndNonPolymorphicValues) {
    const auto qc = compute();
    EXPECT_DOUBLE_EQ(qc[metric("hyb_low")], 1000.0);
    EXPECT_DOUBLE_EQ(qc[metric("hyb_med")], 5000.0);
    EXPECT_DOUBLE_EQ(qc[metric("hyb_high")], 12000.0);
    EXPECT_DOUBLE_EQ(qc[metric("np_a")], 7000.0);
    EXPECT_DOUBLE_EQ(qc[metric("np_c")], 3500.0);
    EXPECT_TRUE(isMissing(qc[metric("np_g")]));
}

}  // namespace
}  // namespace inorm::algo
