// =============================================================================
// infinium-norm - Delimited Table Reader
// =============================================================================
// Reads CSV / TSV tables (optionally gzip-compressed) into Tables, and the
// loaders that turn them into bead summaries and manifests.
//
// This module provides:
// - DelimitedReader: streaming record reader with RFC 4180 quoting
// - loadTable: whole-file reader with delimiter detection
// - loadBeadSummary / loadManifest: file-level adapters for the pipeline
//
// Usage:
//   auto manifest = loadManifest("probes.csv", "controls.csv");
//   auto sample = loadBeadSummary("GSM1234_beads.csv.gz");
// =============================================================================

#ifndef INORM_IO_TABLE_READER_H
#define INORM_IO_TABLE_READER_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "inorm/model/bead_summary.h"
#include "inorm/model/manifest.h"
#include "inorm/model/table.h"

namespace inorm::io {

// =============================================================================
// DelimitedReader
// =============================================================================

/// @brief Splits a text stream into delimited records.
/// @note Quoted fields may contain the delimiter, doubled quotes and line
///       breaks. Carriage returns before a line break are dropped.
class DelimitedReader {
public:
    /// @param input Stream to read; must outlive the reader.
    /// @param delimiter Field separator.
    DelimitedReader(std::istream& input, char delimiter) noexcept
        : input_(input), delimiter_(delimiter) {}

    /// @brief Read the next record.
    /// @return Fields, or nullopt at end of input. Blank lines are skipped.
    /// @throws SchemaError on an unterminated quoted field.
    [[nodiscard]] std::optional<std::vector<std::string>> next();

    /// @brief 1-based line number where the last record started.
    [[nodiscard]] std::uint64_t lineNumber() const noexcept { return recordLine_; }

    [[nodiscard]] char delimiter() const noexcept { return delimiter_; }

private:
    std::istream& input_;
    char delimiter_;
    std::uint64_t line_ = 0;
    std::uint64_t recordLine_ = 0;
};

/// @brief Tab if the header line contains one, comma otherwise.
[[nodiscard]] char detectDelimiter(std::string_view headerLine) noexcept;

/// @brief Read a whole table: a header record, then data records.
/// @param source Name used in error messages.
/// @throws SchemaError on an empty input or a row whose width differs from
///         the header.
[[nodiscard]] Table readDelimitedTable(std::istream& input, char delimiter,
                                       std::string source = {});

/// @brief Read a table file, gzip-compressed or not; the delimiter is
///        detected from the header line.
/// @throws IOError if the file cannot be opened.
[[nodiscard]] Table loadTable(const std::filesystem::path& path);

// =============================================================================
// Adapters
// =============================================================================

/// @brief Sample id of a bead-summary file: the file name without
///        "_beads.csv", ".csv" or ".tsv" and an optional ".gz".
[[nodiscard]] std::string sampleIdFromPath(const std::filesystem::path& path);

/// @brief Load one sample's bead summary.
/// @param sampleId Sample id; derived from the file name when empty.
[[nodiscard]] BeadSummary loadBeadSummary(const std::filesystem::path& path,
                                          std::string sampleId = {});

/// @brief Load several bead summaries, in the given order.
[[nodiscard]] std::vector<BeadSummary> loadBeadSummaries(
    std::span<const std::filesystem::path> paths);

/// @brief Load the probe and control manifests.
[[nodiscard]] Manifest loadManifest(const std::filesystem::path& probesPath,
                                    const std::filesystem::path& controlsPath);

}  // namespace inorm::io

#endif  // INORM_IO_TABLE_READER_H
