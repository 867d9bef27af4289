// =============================================================================
// infinium-norm - Table Reader Tests
// =============================================================================

#include "inorm/io/table_reader.h"

#include <gtest/gtest.h>
#include <zlib.h>

#include <sstream>
#include <string>
#include <vector>

#include "inorm/common/error.h"
#include "test_fixtures.h"

namespace inorm::io {
namespace {

using Fields = std::vector<std::string>;

[[nodiscard]] std::vector<Fields> readAll(const std::string& text, char delimiter = ',') {
    std::istringstream input(text);
    DelimitedReader reader(input, delimiter);
    std::vector<Fields> records;
    while (auto record = reader.next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

// =============================================================================
// DelimitedReader
// =============================================================================

TEST(DelimitedReaderTest, SplitsPlainFields) {
    const auto records = readAll("a,b,c\n1,,3\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], (Fields{"a", "b", "c"}));
    EXPECT_EQ(records[1], (Fields{"1", "", "3"}));
}

TEST(DelimitedReaderTest, QuotedFields) {
    const auto records = readAll("\"x,y\",\"say \"\"hi\"\"\",z\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (Fields{"x,y", "say \"hi\"", "z"}));
}

TEST(DelimitedReaderTest, QuotedFieldSpansLines) {
    const auto records = readAll("id,comment\n1,\"first\nsecond\"\n2,done\n");
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[1], (Fields{"1", "first\nsecond"}));
    EXPECT_EQ(records[2], (Fields{"2", "done"}));
}

TEST(DelimitedReaderTest, CrlfAndBlankLines) {
    const auto records = readAll("a,b\r\n\r\n1,2\r\n\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1], (Fields{"1", "2"}));
}

TEST(DelimitedReaderTest, TracksRecordLine) {
    std::istringstream input("a\n\n\"b\nc\"\nd\n");
    DelimitedReader reader(input, ',');
    ASSERT_TRUE(reader.next().has_value());
    EXPECT_EQ(reader.lineNumber(), 1u);
    ASSERT_TRUE(reader.next().has_value());
    EXPECT_EQ(reader.lineNumber(), 3u);
    ASSERT_TRUE(reader.next().has_value());
    EXPECT_EQ(reader.lineNumber(), 5u);
    EXPECT_FALSE(reader.next().has_value());
}

TEST(DelimitedReaderTest, UnterminatedQuoteIsSchemaError) {
    std::istringstream input("a,\"open\n");
    DelimitedReader reader(input, ',');
    EXPECT_THROW((void)reader.next(), SchemaError);
}

TEST(DelimitedReaderTest, TabDelimiter) {
    const auto records = readAll("a\tb,c\n", '\t');
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (Fields{"a", "b,c"}));
}

TEST(DetectDelimiterTest, TabWinsOverComma) {
    EXPECT_EQ(detectDelimiter("a\tb"), '\t');
    EXPECT_EQ(detectDelimiter("a,b\tc"), '\t');
    EXPECT_EQ(detectDelimiter("a,b"), ',');
    EXPECT_EQ(detectDelimiter("single"), ',');
}

// =============================================================================
// Tables
// =============================================================================

TEST(ReadDelimitedTableTest, HeaderAndRows) {
    std::istringstream input("address,grn_n\n101,3\n102,4\n");
    const Table table = readDelimitedTable(input, ',', "beads.csv");
    EXPECT_EQ(table.header, (Fields{"address", "grn_n"}));
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.rows[1], (Fields{"102", "4"}));
    EXPECT_EQ(table.source, "beads.csv");
}

TEST(ReadDelimitedTableTest, WidthMismatchReportsRow) {
    std::istringstream input("a,b\n1,2\n3\n");
    try {
        (void)readDelimitedTable(input, ',', "t.csv");
        FAIL() << "expected SchemaError";
    } catch (const SchemaError& e) {
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->row, 2u);
        EXPECT_EQ(e.context()->filePath, "t.csv");
    }
}

TEST(ReadDelimitedTableTest, EmptyInputIsSchemaError) {
    std::istringstream input("\n\n");
    EXPECT_THROW((void)readDelimitedTable(input, ','), SchemaError);
}

TEST(LoadTableTest, TsvWithByteOrderMark) {
    test::TempDirectory dir;
    const auto path = dir.write("probes.tsv", "\xEF\xBB\xBFprobe_id\ttype\ncg01\tII\n");
    const Table table = loadTable(path);
    EXPECT_EQ(table.header, (Fields{"probe_id", "type"}));
    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table.rows[0], (Fields{"cg01", "II"}));
    EXPECT_EQ(table.source, path.string());
}

TEST(LoadTableTest, GzipCompressed) {
    test::TempDirectory dir;
    const auto path = dir.path() / "beads.csv.gz";
    const std::string text = "address,grn_n\n101,3\n102,\"4\"\n";
    gzFile file = gzopen(path.string().c_str(), "wb");
    ASSERT_NE(file, nullptr);
    ASSERT_EQ(gzwrite(file, text.data(), static_cast<unsigned>(text.size())),
              static_cast<int>(text.size()));
    ASSERT_EQ(gzclose(file), Z_OK);

    const Table table = loadTable(path);
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.rows[1], (Fields{"102", "4"}));
}

TEST(LoadTableTest, MissingFileIsIOError) {
    test::TempDirectory dir;
    EXPECT_THROW((void)loadTable(dir.path() / "absent.csv"), IOError);
}

// =============================================================================
// Adapters
// =============================================================================

TEST(SampleIdFromPathTest, StripsKnownSuffixes) {
    EXPECT_EQ(sampleIdFromPath("/data/GSM1_beads.csv.gz"), "GSM1");
    EXPECT_EQ(sampleIdFromPath("GSM2_beads.csv"), "GSM2");
    EXPECT_EQ(sampleIdFromPath("dir/S3.tsv"), "S3");
    EXPECT_EQ(sampleIdFromPath("S4.csv.gz"), "S4");
    EXPECT_EQ(sampleIdFromPath("S5"), "S5");
}

TEST(LoadBeadSummaryTest, ReadsRecordsAndNamesSample) {
    test::TempDirectory dir;
    const auto path = dir.write("GSM9_beads.csv",
                                ",grn_n,grn_mean,grn_sd,red_n,red_mean,red_sd\n"
                                "101,12,1500.5,80.2,12,700,50\n"
                                "102,0,NA,NA,0,NA,NA\n");

    const BeadSummary summary = loadBeadSummary(path);
    EXPECT_EQ(summary.sampleId(), "GSM9");
    EXPECT_EQ(summary.size(), 2u);
    const BeadRecord* record = summary.find(101);
    ASSERT_NE(record, nullptr);
    EXPECT_DOUBLE_EQ(record->grnMean, 1500.5);
    EXPECT_EQ(record->redCount, 12u);

    EXPECT_EQ(loadBeadSummary(path, "custom").sampleId(), "custom");
}

TEST(LoadBeadSummaryTest, SummariesKeepInputOrder) {
    test::TempDirectory dir;
    const std::string text = "address,grn_n,grn_mean,grn_sd,red_n,red_mean,red_sd\n"
                             "101,3,1,1,3,1,1\n";
    const std::vector<std::filesystem::path> paths{dir.write("B.csv", text),
                                                   dir.write("A.csv", text)};
    const auto samples = loadBeadSummaries(paths);
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples[0].sampleId(), "B");
    EXPECT_EQ(samples[1].sampleId(), "A");
}

TEST(LoadManifestTest, ReadsProbesAndControls) {
    test::TempDirectory dir;
    const auto probes = dir.write("probes.csv",
                                  "probe_id,chr,pos,type,address_a,address_b\n"
                                  "cg01,chr1,100,I-Grn,101,102\n"
                                  "cg03,chr3,300,II,301,NA\n"
                                  "rs01,chr1,600,II,601,\n");
    const auto controls = dir.write("controls.tsv",
                                    "address\ttype\tcolor\tdescription\tcomment\n"
                                    "1001\tNEGATIVE\tBlack\tNegative 1\t\n"
                                    "2001\tNORM_C\tGreen\tNorm_C1\t\n"
                                    "2002\tNORM_T\tRed\tNorm_T1\t\n");

    const Manifest manifest = loadManifest(probes, controls);
    EXPECT_EQ(manifest.probes().size(), 3u);
    EXPECT_EQ(manifest.controls().size(), 3u);
}

TEST(LoadManifestTest, SchemaErrorNamesFile) {
    test::TempDirectory dir;
    const auto probes = dir.write("probes.csv",
                                  "probe_id,chr,pos,type,address_a,address_b\n"
                                  "cg01,chr1,100,III,101,102\n");
    const auto controls = dir.write("controls.csv", "address,type,description\n");
    try {
        (void)loadManifest(probes, controls);
        FAIL() << "expected SchemaError";
    } catch (const SchemaError& e) {
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->filePath, probes.string());
        EXPECT_EQ(e.context()->featureId, "cg01");
    }
}

}  // namespace
}  // namespace inorm::io
