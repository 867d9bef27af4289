// =============================================================================
// infinium-norm - Preprocessing Pipeline Tests
// =============================================================================
// End-to-end behaviour of the pipeline on the synthetic array: output modes,
// configuration validation, error propagation and run-to-run
// reproducibility across thread counts.
// =============================================================================

#include "inorm/pipeline/pipeline.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "inorm/common/error.h"
#include "test_fixtures.h"

namespace inorm::pipeline {
namespace {

using namespace inorm::test;

class PipelineTest : public ::testing::Test {
protected:
    Manifest manifest_ = syntheticManifest();
    std::vector<BeadSummary> samples_{syntheticSample("S1"), syntheticSample("S2", 2.0),
                                      syntheticSample("S3", 0.5)};
};

// =============================================================================
// Configuration
// =============================================================================

TEST(PreprocessConfigTest, DefaultsValidate) {
    PreprocessConfig config;
    EXPECT_EQ(config.minBeads, 3);
    EXPECT_DOUBLE_EQ(config.detection, 0.05);
    EXPECT_TRUE(config.validate().has_value());
}

TEST(PreprocessConfigTest, RejectsBadValues) {
    PreprocessConfig config;
    config.minBeads = 0;
    ASSERT_FALSE(config.validate().has_value());
    EXPECT_EQ(config.validate().error().code(), ErrorCode::kConfigurationError);

    config = PreprocessConfig{};
    config.detection = 0.0;
    EXPECT_FALSE(config.validate().has_value());
    config.detection = 1.5;
    EXPECT_FALSE(config.validate().has_value());
    config.detection = 1.0;
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(PipelineTest, ConstructorRejectsInvalidConfig) {
    PreprocessConfig config;
    config.detection = -0.1;
    EXPECT_THROW((void)PreprocessPipeline(manifest_, config), ConfigurationError);
}

TEST_F(PipelineTest, PreprocessReportsConfigurationError) {
    PreprocessConfig config;
    config.minBeads = -1;
    auto result = preprocess(manifest_, samples_, config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().exitCode(), 1);
}

// =============================================================================
// Output Modes
// =============================================================================

TEST_F(PipelineTest, DefaultOutputs) {
    auto result = preprocess(manifest_, samples_, PreprocessConfig{});
    ASSERT_TRUE(result.has_value()) << result.error().describe();

    ASSERT_TRUE(result->summary.has_value());
    ASSERT_TRUE(result->betas.has_value());
    ASSERT_TRUE(result->snpTheta.has_value());
    EXPECT_FALSE(result->snpR.has_value());
    EXPECT_FALSE(result->intensitiesA.has_value());
    EXPECT_FALSE(result->controlGrn.has_value());

    EXPECT_EQ(result->summary->rowIds(), (std::vector<std::string>{"S1", "S2", "S3"}));
    EXPECT_EQ(result->betas->rows(), 5u);
    EXPECT_EQ(result->snpTheta->rowIds(), (std::vector<std::string>{"rs01", "rs02"}));
}

TEST_F(PipelineTest, BetaValuesOfSyntheticArray) {
    auto result = preprocess(manifest_, samples_, PreprocessConfig{});
    ASSERT_TRUE(result.has_value()) << result.error().describe();
    const LabeledMatrix& betas = *result->betas;

    for (const std::string sample : {"S1", "S2", "S3"}) {
        EXPECT_DOUBLE_EQ(betas.value("cg01", sample), 0.75);
        EXPECT_DOUBLE_EQ(betas.value("cg02", sample), 0.5);
        EXPECT_DOUBLE_EQ(betas.value("cg03", sample), 0.25);
        EXPECT_DOUBLE_EQ(betas.value("cg04", sample), 0.5);
        EXPECT_DOUBLE_EQ(betas.value("cg05", sample), 0.75);
    }
    EXPECT_DOUBLE_EQ(result->snpTheta->value("rs01", "S1"), 0.5);
    EXPECT_DOUBLE_EQ(result->summary->value("S1", "missing"), 0.0);
}

TEST_F(PipelineTest, ReturnIntensities) {
    PreprocessConfig config;
    config.returnIntensities = true;
    config.returnSnpsR = true;
    auto result = preprocess(manifest_, samples_, config);
    ASSERT_TRUE(result.has_value()) << result.error().describe();

    ASSERT_TRUE(result->intensitiesA.has_value());
    ASSERT_TRUE(result->intensitiesB.has_value());
    ASSERT_TRUE(result->controlGrn.has_value());
    ASSERT_TRUE(result->controlRed.has_value());
    EXPECT_TRUE(result->betas.has_value());
    // Intensities take precedence over the radius-only mode
    EXPECT_FALSE(result->snpR.has_value());

    EXPECT_DOUBLE_EQ(result->intensitiesA->value("cg02", "S2"), 4800.0);
    EXPECT_DOUBLE_EQ(result->controlGrn->value("1001", "S1"), 90.0);
}

TEST_F(PipelineTest, SnpsROnly) {
    PreprocessConfig config;
    config.returnSnpsR = true;
    auto result = preprocess(manifest_, samples_, config);
    ASSERT_TRUE(result.has_value()) << result.error().describe();

    EXPECT_FALSE(result->summary.has_value());
    EXPECT_FALSE(result->betas.has_value());
    EXPECT_FALSE(result->snpTheta.has_value());
    ASSERT_TRUE(result->snpR.has_value());
    EXPECT_NEAR(result->snpR->value("rs01", "S1"), std::sqrt(2.0) * 2000.0, 1e-9);
}

TEST_F(PipelineTest, SubtractBackground) {
    PreprocessConfig config;
    config.subtractBackground = true;
    config.returnIntensities = true;
    auto result = preprocess(manifest_, samples_, config);
    ASSERT_TRUE(result.has_value()) << result.error().describe();

    // cg01 A: green 1000 minus green negative mean 100
    EXPECT_DOUBLE_EQ(result->intensitiesA->value("cg01", "S1"), 900.0);
}

// =============================================================================
// Per-Sample Processing
// =============================================================================

TEST_F(PipelineTest, ProcessSampleRecordsIntermediates) {
    const PreprocessPipeline pipeline(manifest_, PreprocessConfig{});
    const SampleResult result = pipeline.processSample(samples_[0]);

    EXPECT_EQ(result.sampleId, "S1");
    EXPECT_DOUBLE_EQ(result.dyeBias.grn, 1.0);
    EXPECT_DOUBLE_EQ(result.dyeBias.red, 1.0);
    EXPECT_DOUBLE_EQ(result.background.negMeanGrn, 100.0);
    EXPECT_EQ(result.betas.size(), 5u);
    EXPECT_EQ(result.theta.size(), 2u);
}

TEST_F(PipelineTest, MinBeadCensorReachesBetas) {
    samples_[1] = SampleBuilder(2.0).set(kII, bead(3000.0, 1000.0, 2)).build("S2");
    auto result = preprocess(manifest_, samples_, PreprocessConfig{});
    ASSERT_TRUE(result.has_value()) << result.error().describe();

    EXPECT_TRUE(isMissing(result->betas->value("cg03", "S2")));
    EXPECT_DOUBLE_EQ(result->betas->value("cg03", "S1"), 0.25);
    EXPECT_DOUBLE_EQ(result->summary->value("S2", "missing"), 0.2);
    EXPECT_EQ(result->stats.missingBetas, 1u);
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(PipelineTest, MissingAddressAbortsBatch) {
    samples_[2] = SampleBuilder().erase(kSnpGrnB).build("S3");
    auto result = preprocess(manifest_, samples_, PreprocessConfig{});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kMissingAddress);
    ASSERT_TRUE(result.error().context().has_value());
    EXPECT_EQ(result.error().context()->sampleId, "S3");
}

TEST_F(PipelineTest, DuplicateSampleIdIsSchemaError) {
    samples_[2] = syntheticSample("S1", 0.5);
    auto result = preprocess(manifest_, samples_, PreprocessConfig{});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kSchemaError);
    ASSERT_TRUE(result.error().context().has_value());
    EXPECT_EQ(result.error().context()->sampleId, "S1");
    EXPECT_NE(result.error().message().find("S1"), std::string::npos);
}

TEST_F(PipelineTest, MissingNegativesAbortBatch) {
    SampleBuilder builder;
    for (BeadAddress address : {kNeg1, kNeg2, kNeg3, kNeg4}) {
        builder.set(address, bead(kMissing, kMissing, 0));
    }
    samples_[0] = builder.build("S1");

    auto result = preprocess(manifest_, samples_, PreprocessConfig{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().exitCode(), 5);
}

// =============================================================================
// Reproducibility
// =============================================================================

TEST_F(PipelineTest, DigestIndependentOfThreadCount) {
    PreprocessConfig serial;
    serial.numThreads = 1;
    serial.returnIntensities = true;
    PreprocessConfig parallel = serial;
    parallel.numThreads = 4;

    auto first = preprocess(manifest_, samples_, serial);
    auto second = preprocess(manifest_, samples_, parallel);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->digest(), second->digest());
    EXPECT_EQ(first->stats.samples, 3u);
    EXPECT_EQ(first->stats.probes, 7u);
}

TEST_F(PipelineTest, DigestDependsOnValues) {
    auto base = preprocess(manifest_, samples_, PreprocessConfig{});
    samples_[0] = SampleBuilder().set(kII, bead(1500.0, 600.0)).build("S1");
    auto changed = preprocess(manifest_, samples_, PreprocessConfig{});
    ASSERT_TRUE(base.has_value());
    ASSERT_TRUE(changed.has_value());
    EXPECT_NE(base->digest(), changed->digest());
}

RC_GTEST_PROP(PipelineProperty, RepeatedRunsAreIdentical, ()) {
    const auto scales = *rc::gen::container<std::vector<int>>(
        *rc::gen::inRange<std::size_t>(1, 6), rc::gen::inRange(1, 50));
    const Manifest manifest = syntheticManifest();

    std::vector<BeadSummary> samples;
    for (std::size_t i = 0; i < scales.size(); ++i) {
        samples.push_back(syntheticSample("S" + std::to_string(i), scales[i] / 10.0));
    }

    PreprocessConfig config;
    config.numThreads = *rc::gen::inRange<std::size_t>(1, 5);
    auto first = preprocess(manifest, samples, config);
    auto second = preprocess(manifest, samples, PreprocessConfig{});
    RC_ASSERT(first.has_value());
    RC_ASSERT(second.has_value());
    RC_ASSERT(first->digest() == second->digest());
}

}  // namespace
}  // namespace inorm::pipeline
