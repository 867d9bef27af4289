// =============================================================================
// infinium-norm - Bead Summary Tests
// =============================================================================

#include "inorm/model/bead_summary.h"

#include <gtest/gtest.h>

#include "inorm/common/error.h"
#include "test_fixtures.h"

namespace inorm {
namespace {

TEST(BeadSummaryTest, FromTableWithUnnamedKeyColumn) {
    const Table table = test::makeTable(
        {"", "grn_n", "grn_mean", "grn_sd", "red_n", "red_mean", "red_sd"},
        {{"101", "12", "1500.5", "80.2", "12", "700", "50"},
         {"102", "0", "NA", "NA", "0", "NA", "NA"}});

    const BeadSummary summary = BeadSummary::fromTable("S1", table);
    EXPECT_EQ(summary.sampleId(), "S1");
    EXPECT_EQ(summary.size(), 2u);

    const BeadRecord* record = summary.find(101);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->grnCount, 12u);
    EXPECT_DOUBLE_EQ(record->mean(Channel::kGreen), 1500.5);
    EXPECT_DOUBLE_EQ(record->mean(Channel::kRed), 700.0);
    EXPECT_TRUE(isMissing(summary.find(102)->grnMean));
}

TEST(BeadSummaryTest, MissingColumnIsSchemaError) {
    const Table table = test::makeTable({"address", "grn_n", "grn_mean", "grn_sd"},
                                        {{"101", "3", "1.0", "1.0"}});
    EXPECT_THROW((void)BeadSummary::fromTable("S1", table), SchemaError);
}

TEST(BeadSummaryTest, BadCountIsSchemaErrorWithRow) {
    const Table table = test::makeTable(
        {"address", "grn_n", "grn_mean", "grn_sd", "red_n", "red_mean", "red_sd"},
        {{"101", "3", "1", "1", "3", "1", "1"}, {"102", "many", "1", "1", "3", "1", "1"}});
    try {
        (void)BeadSummary::fromTable("S1", table);
        FAIL() << "expected SchemaError";
    } catch (const SchemaError& e) {
        ASSERT_TRUE(e.hasContext());
        EXPECT_EQ(e.context()->row, 2u);
    }
}

TEST(BeadSummaryTest, DuplicateAddressIsSchemaError) {
    BeadSummary summary("S1");
    summary.add(5, test::bead(1, 1));
    EXPECT_THROW(summary.add(5, test::bead(2, 2)), SchemaError);
}

TEST(BeadSummaryTest, AtNamesSampleAndFeature) {
    BeadSummary summary("GSM7");
    try {
        (void)summary.at(404, "cg01");
        FAIL() << "expected MissingAddressError";
    } catch (const MissingAddressError& e) {
        EXPECT_EQ(e.address(), 404u);
        EXPECT_EQ(e.context()->sampleId, "GSM7");
        EXPECT_EQ(e.context()->featureId, "cg01");
    }
}

}  // namespace
}  // namespace inorm
