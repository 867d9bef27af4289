// =============================================================================
// infinium-norm - Delimited Table Reader Implementation
// =============================================================================

#include "inorm/io/table_reader.h"

#include <fmt/format.h>

#include <array>
#include <sstream>
#include <utility>

#include "inorm/common/error.h"
#include "inorm/common/logger.h"
#include "inorm/io/compressed_stream.h"

namespace inorm::io {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

constexpr std::array<std::string_view, 3> kBeadSuffixes{"_beads.csv", ".csv", ".tsv"};

/// @brief Append the data records following the header.
void readRows(DelimitedReader& reader, std::istream& input, Table& table) {
    while (auto row = reader.next()) {
        if (row->size() != table.header.size()) {
            throw SchemaError(fmt::format("row has {} fields, header has {}", row->size(),
                                          table.header.size()),
                              ErrorContext{table.source}.withRow(table.rows.size() + 1));
        }
        table.rows.push_back(std::move(*row));
    }
    if (input.bad()) {
        throw IOError("read failure", ErrorContext{table.source});
    }
}

}  // namespace

// =============================================================================
// DelimitedReader
// =============================================================================

std::optional<std::vector<std::string>> DelimitedReader::next() {
    std::string line;
    while (std::getline(input_, line)) {
        ++line_;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        recordLine_ = line_;
        std::vector<std::string> fields;
        std::string field;
        bool quoted = false;
        std::size_t i = 0;

        while (true) {
            if (i == line.size()) {
                if (!quoted) {
                    break;
                }
                // Quoted field continues on the next line
                std::string more;
                if (!std::getline(input_, more)) {
                    throw SchemaError("unterminated quoted field",
                                      ErrorContext{}.withRow(recordLine_));
                }
                ++line_;
                if (!more.empty() && more.back() == '\r') {
                    more.pop_back();
                }
                field.push_back('\n');
                line = std::move(more);
                i = 0;
                continue;
            }

            const char c = line[i++];
            if (quoted) {
                if (c == '"') {
                    if (i < line.size() && line[i] == '"') {
                        field.push_back('"');
                        ++i;
                    } else {
                        quoted = false;
                    }
                } else {
                    field.push_back(c);
                }
            } else if (c == '"' && field.empty()) {
                quoted = true;
            } else if (c == delimiter_) {
                fields.push_back(std::move(field));
                field.clear();
            } else {
                field.push_back(c);
            }
        }
        fields.push_back(std::move(field));
        return fields;
    }
    return std::nullopt;
}

char detectDelimiter(std::string_view headerLine) noexcept {
    return headerLine.find('\t') != std::string_view::npos ? '\t' : ',';
}

Table readDelimitedTable(std::istream& input, char delimiter, std::string source) {
    DelimitedReader reader(input, delimiter);
    Table table;
    table.source = std::move(source);

    auto header = reader.next();
    if (!header) {
        throw SchemaError("table has no header line", ErrorContext{table.source});
    }
    table.header = std::move(*header);
    readRows(reader, input, table);
    return table;
}

Table loadTable(const std::filesystem::path& path) {
    auto stream = openInputFile(path);

    // The header line decides the delimiter for the whole file.
    std::string headerLine;
    std::getline(*stream, headerLine);
    if (headerLine.starts_with(kUtf8Bom)) {
        headerLine.erase(0, kUtf8Bom.size());
    }
    const char delimiter = detectDelimiter(headerLine);

    std::istringstream headerStream(headerLine);
    DelimitedReader headerReader(headerStream, delimiter);
    auto header = headerReader.next();
    if (!header) {
        throw SchemaError("table has no header line", ErrorContext{path.string()});
    }

    Table table;
    table.source = path.string();
    table.header = std::move(*header);
    DelimitedReader reader(*stream, delimiter);
    readRows(reader, *stream, table);
    INORM_LOG_DEBUG("Loaded {}: {} columns, {} rows", path.string(), table.header.size(),
                    table.size());
    return table;
}

// =============================================================================
// Adapters
// =============================================================================

std::string sampleIdFromPath(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    if (name.ends_with(".gz")) {
        name.resize(name.size() - 3);
    }
    for (std::string_view suffix : kBeadSuffixes) {
        if (name.size() > suffix.size() && name.ends_with(suffix)) {
            name.resize(name.size() - suffix.size());
            break;
        }
    }
    return name;
}

BeadSummary loadBeadSummary(const std::filesystem::path& path, std::string sampleId) {
    if (sampleId.empty()) {
        sampleId = sampleIdFromPath(path);
    }
    BeadSummary summary = BeadSummary::fromTable(std::move(sampleId), loadTable(path));
    INORM_LOG_DEBUG("Sample {}: {} bead addresses", summary.sampleId(), summary.size());
    return summary;
}

std::vector<BeadSummary> loadBeadSummaries(std::span<const std::filesystem::path> paths) {
    std::vector<BeadSummary> samples;
    samples.reserve(paths.size());
    for (const auto& path : paths) {
        samples.push_back(loadBeadSummary(path));
    }
    return samples;
}

Manifest loadManifest(const std::filesystem::path& probesPath,
                      const std::filesystem::path& controlsPath) {
    Manifest manifest = Manifest::fromTables(loadTable(probesPath), loadTable(controlsPath));
    INORM_LOG_INFO("Loaded manifest: {} probes, {} control beads", manifest.probes().size(),
                   manifest.controls().size());
    return manifest;
}

}  // namespace inorm::io
