// =============================================================================
// infinium-norm - Bead Summary Implementation
// =============================================================================

#include "inorm/model/bead_summary.h"

#include <fmt/format.h>

#include <limits>

#include "inorm/common/error.h"
#include "inorm/common/string_utils.h"

namespace inorm {

namespace {

[[nodiscard]] BeadCount parseCount(const Table& table, std::size_t row, std::size_t col) {
    const std::string& cell = table.rows[row][col];
    auto value = str::parseUnsigned(cell);
    if (!value || *value > std::numeric_limits<BeadCount>::max()) {
        throw SchemaError(
            fmt::format("invalid bead count '{}' in column '{}'", cell, table.header[col]),
            ErrorContext{table.source}.withRow(row + 1));
    }
    return static_cast<BeadCount>(*value);
}

[[nodiscard]] double parseIntensity(const Table& table, std::size_t row, std::size_t col) {
    const std::string& cell = table.rows[row][col];
    auto value = str::parseDouble(cell);
    if (!value) {
        throw SchemaError(
            fmt::format("invalid intensity '{}' in column '{}'", cell, table.header[col]),
            ErrorContext{table.source}.withRow(row + 1));
    }
    return *value;
}

}  // namespace

BeadSummary BeadSummary::fromTable(std::string sampleId, const Table& table) {
    const std::size_t addressCol = table.requireKeyColumn({"address", "Address", "sample_id"});
    const std::size_t grnN = table.requireColumn({"grn_n"});
    const std::size_t grnMean = table.requireColumn({"grn_mean"});
    const std::size_t grnSd = table.requireColumn({"grn_sd"});
    const std::size_t redN = table.requireColumn({"red_n"});
    const std::size_t redMean = table.requireColumn({"red_mean"});
    const std::size_t redSd = table.requireColumn({"red_sd"});

    BeadSummary summary(std::move(sampleId));
    summary.records_.reserve(table.size());

    for (std::size_t row = 0; row < table.size(); ++row) {
        const std::string& addressCell = table.rows[row][addressCol];
        auto address = str::parseUnsigned(addressCell);
        if (!address) {
            throw SchemaError(fmt::format("invalid bead address '{}'", addressCell),
                              ErrorContext{table.source}.withRow(row + 1));
        }

        BeadRecord record;
        record.grnCount = parseCount(table, row, grnN);
        record.grnMean = parseIntensity(table, row, grnMean);
        record.grnSd = parseIntensity(table, row, grnSd);
        record.redCount = parseCount(table, row, redN);
        record.redMean = parseIntensity(table, row, redMean);
        record.redSd = parseIntensity(table, row, redSd);
        summary.add(*address, record);
    }
    return summary;
}

void BeadSummary::add(BeadAddress address, const BeadRecord& record) {
    if (!records_.emplace(address, record).second) {
        throw SchemaError(fmt::format("duplicate bead address {}", address),
                          ErrorContext{}.withSample(sampleId_).withAddress(address));
    }
}

const BeadRecord* BeadSummary::find(BeadAddress address) const noexcept {
    auto it = records_.find(address);
    return it == records_.end() ? nullptr : &it->second;
}

const BeadRecord& BeadSummary::at(BeadAddress address, std::string_view featureId) const {
    if (const BeadRecord* record = find(address)) {
        return *record;
    }
    throw MissingAddressError(address, sampleId_, std::string(featureId));
}

}  // namespace inorm
