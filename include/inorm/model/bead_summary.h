// =============================================================================
// infinium-norm - Bead Summary
// =============================================================================
// Per-sample table of bead-level intensity summaries, keyed by bead address.
//
// One BeadSummary is the decoded content of a sample's green and red .idat
// pair: for every bead address, the bead count and the mean / SD intensity
// in each channel.
// =============================================================================

#ifndef INORM_MODEL_BEAD_SUMMARY_H
#define INORM_MODEL_BEAD_SUMMARY_H

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "inorm/common/types.h"
#include "inorm/model/table.h"

namespace inorm {

/// @brief Summary of all beads carrying one address.
struct BeadRecord {
    BeadCount grnCount = 0;
    double grnMean = kMissing;
    double grnSd = kMissing;
    BeadCount redCount = 0;
    double redMean = kMissing;
    double redSd = kMissing;

    [[nodiscard]] BeadCount count(Channel channel) const noexcept {
        return channel == Channel::kGreen ? grnCount : redCount;
    }

    [[nodiscard]] double mean(Channel channel) const noexcept {
        return channel == Channel::kGreen ? grnMean : redMean;
    }
};

class BeadSummary {
public:
    BeadSummary() = default;

    explicit BeadSummary(std::string sampleId) : sampleId_(std::move(sampleId)) {}

    /// @brief Build from a parsed table.
    /// @note Required columns: address (or an unnamed / "sample_id" first
    ///       column), grn_n, grn_mean, grn_sd, red_n, red_mean, red_sd.
    /// @throws SchemaError on missing columns, unparsable cells or duplicate
    ///         addresses.
    [[nodiscard]] static BeadSummary fromTable(std::string sampleId, const Table& table);

    /// @brief Add the record for an address.
    /// @throws SchemaError if the address is already present.
    void add(BeadAddress address, const BeadRecord& record);

    /// @brief Find the record for an address, nullptr if absent.
    [[nodiscard]] const BeadRecord* find(BeadAddress address) const noexcept;

    /// @brief Record for an address referenced by a manifest feature.
    /// @throws MissingAddressError if the address is absent.
    [[nodiscard]] const BeadRecord& at(BeadAddress address, std::string_view featureId) const;

    [[nodiscard]] const std::string& sampleId() const noexcept { return sampleId_; }

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

private:
    std::string sampleId_;
    std::unordered_map<BeadAddress, BeadRecord> records_;
};

}  // namespace inorm

#endif  // INORM_MODEL_BEAD_SUMMARY_H
