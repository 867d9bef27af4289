// =============================================================================
// infinium-norm - Manifest Model Implementation
// =============================================================================

#include "inorm/model/manifest.h"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

#include "inorm/common/error.h"
#include "inorm/common/logger.h"
#include "inorm/common/string_utils.h"

namespace inorm {

namespace {

[[nodiscard]] BeadAddress parseAddress(const Table& table, std::size_t row, std::size_t col) {
    const std::string& cell = table.rows[row][col];
    auto value = str::parseUnsigned(cell);
    if (!value) {
        throw SchemaError(fmt::format("invalid bead address '{}' in column '{}'", cell,
                                      table.header[col]),
                          ErrorContext{table.source}.withRow(row + 1));
    }
    return *value;
}

[[nodiscard]] bool isGreenNorm(ControlType type) noexcept {
    return type == ControlType::kNormC || type == ControlType::kNormG;
}

[[nodiscard]] bool isRedNorm(ControlType type) noexcept {
    return type == ControlType::kNormA || type == ControlType::kNormT;
}

}  // namespace

// =============================================================================
// ProbeManifest
// =============================================================================

ProbeManifest::ProbeManifest(std::vector<Probe> probes) : probes_(std::move(probes)) {
    index_.reserve(probes_.size());
    for (std::size_t i = 0; i < probes_.size(); ++i) {
        const Probe& probe = probes_[i];
        if (probe.id.empty()) {
            throw SchemaError("probe with empty identifier", ErrorContext{}.withRow(i + 1));
        }
        if (probe.type != ProbeType::kInfII && !probe.addressB.has_value()) {
            throw SchemaError(fmt::format("Infinium I probe has no address B"),
                              ErrorContext{}.withFeature(probe.id));
        }
        if (!index_.emplace(probe.id, i).second) {
            throw SchemaError("duplicate probe identifier", ErrorContext{}.withFeature(probe.id));
        }
    }
}

ProbeManifest ProbeManifest::fromTable(const Table& table) {
    const std::size_t idCol = table.requireKeyColumn({"probe_id", "id", "IlmnID", "Name"});
    const std::size_t chrCol = table.requireColumn({"chr", "CHR"});
    const std::size_t posCol = table.requireColumn({"pos", "MAPINFO"});
    const std::size_t typeCol = table.requireColumn({"type"});
    const std::size_t addrACol = table.requireColumn({"address.a", "address_a", "AddressA_ID"});
    const std::size_t addrBCol = table.requireColumn({"address.b", "address_b", "AddressB_ID"});

    std::vector<Probe> probes;
    probes.reserve(table.size());

    for (std::size_t row = 0; row < table.size(); ++row) {
        const auto& cells = table.rows[row];
        Probe probe;
        probe.id = std::string(str::trim(cells[idCol]));

        auto type = probeTypeFromString(str::trim(cells[typeCol]));
        if (!type) {
            throw SchemaError(fmt::format("unknown probe type '{}'", cells[typeCol]),
                              ErrorContext{table.source}.withRow(row + 1).withFeature(probe.id));
        }
        probe.type = *type;
        probe.chr = std::string(str::trim(cells[chrCol]));

        if (!str::isMissingCell(cells[posCol])) {
            auto pos = str::parseDouble(cells[posCol]);
            if (!pos) {
                throw SchemaError(fmt::format("invalid position '{}'", cells[posCol]),
                                  ErrorContext{table.source}.withRow(row + 1).withFeature(probe.id));
            }
            probe.pos = static_cast<std::int64_t>(*pos);
        }

        if (str::isMissingCell(cells[addrACol])) {
            throw SchemaError("probe has no address A",
                              ErrorContext{table.source}.withRow(row + 1).withFeature(probe.id));
        }
        probe.addressA = parseAddress(table, row, addrACol);
        if (!str::isMissingCell(cells[addrBCol])) {
            probe.addressB = parseAddress(table, row, addrBCol);
        }
        probes.push_back(std::move(probe));
    }

    try {
        return ProbeManifest(std::move(probes));
    } catch (const SchemaError& e) {
        ErrorContext context = e.context().value_or(ErrorContext{});
        context.withFile(table.source);
        throw SchemaError(e.message(), std::move(context));
    }
}

std::optional<std::size_t> ProbeManifest::indexOf(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// =============================================================================
// ControlManifest
// =============================================================================

ControlManifest::ControlManifest(std::vector<ControlBead> controls)
    : controls_(std::move(controls)) {
    std::vector<BeadAddress> addresses;
    addresses.reserve(controls_.size());
    for (const auto& control : controls_) {
        addresses.push_back(control.address);
    }
    std::sort(addresses.begin(), addresses.end());
    auto dup = std::adjacent_find(addresses.begin(), addresses.end());
    if (dup != addresses.end()) {
        throw SchemaError("duplicate control address", ErrorContext{}.withAddress(*dup));
    }
}

ControlManifest ControlManifest::fromTable(const Table& table) {
    const std::size_t addressCol = table.requireKeyColumn({"address", "Address"});
    const std::size_t typeCol = table.requireColumn({"type"});
    const std::size_t descCol = table.requireColumn({"description"});
    const auto colorCol = table.findColumn({"color"});
    const auto commentCol = table.findColumn({"comment"});

    std::vector<ControlBead> controls;
    controls.reserve(table.size());

    for (std::size_t row = 0; row < table.size(); ++row) {
        const auto& cells = table.rows[row];
        ControlBead control;
        control.address = parseAddress(table, row, addressCol);
        control.typeName = std::string(str::trim(cells[typeCol]));
        control.type = controlTypeFromString(control.typeName);
        control.description = std::string(str::trim(cells[descCol]));
        if (colorCol) {
            control.color = cells[*colorCol];
        }
        if (commentCol) {
            control.comment = cells[*commentCol];
        }
        controls.push_back(std::move(control));
    }

    try {
        return ControlManifest(std::move(controls));
    } catch (const SchemaError& e) {
        ErrorContext context = e.context().value_or(ErrorContext{});
        context.withFile(table.source);
        throw SchemaError(e.message(), std::move(context));
    }
}

// =============================================================================
// Manifest
// =============================================================================

Manifest::Manifest(ProbeManifest probes, ControlManifest controls)
    : probes_(std::move(probes)), controls_(std::move(controls)) {
    buildProbeIndex();
    buildNormalizationPairs();
    INORM_LOG_DEBUG("Manifest: {} probes ({} SNP), {} controls, {} normalization pairs",
                    probes_.size(), snp_.size(), controls_.size(), normPairs_.size());
}

Manifest Manifest::fromTables(const Table& probeTable, const Table& controlTable) {
    return Manifest(ProbeManifest::fromTable(probeTable), ControlManifest::fromTable(controlTable));
}

void Manifest::buildProbeIndex() {
    const auto& all = probes_.probes();
    for (std::size_t i = 0; i < all.size(); ++i) {
        byType_[static_cast<std::size_t>(all[i].type)].push_back(i);
        if (isSnpId(all[i].id)) {
            snp_.push_back(i);
        } else {
            cpg_.push_back(i);
        }
    }
}

void Manifest::buildNormalizationPairs() {
    const auto& all = controls_.controls();

    std::unordered_map<std::string, std::size_t> redByDescription;
    for (std::size_t i = 0; i < all.size(); ++i) {
        if (isRedNorm(all[i].type)) {
            redByDescription.emplace(all[i].description, i);
        }
    }

    for (std::size_t i = 0; i < all.size(); ++i) {
        if (!isGreenNorm(all[i].type)) {
            continue;
        }
        const std::string target = str::translate(all[i].description, "CG", "TA");
        auto it = redByDescription.find(target);
        if (it == redByDescription.end()) {
            INORM_LOG_DEBUG("No red partner for normalization control '{}'",
                            all[i].description);
            continue;
        }
        normPairs_.push_back({i, it->second});
    }
}

std::vector<std::string> Manifest::probesOfType(ProbeType type) const {
    std::vector<std::string> ids;
    for (std::size_t index : probeIndicesOfType(type)) {
        ids.push_back(probe(index).id);
    }
    return ids;
}

BeadAddress Manifest::addressFor(const std::string& probeId, Role role) const {
    auto index = probes_.indexOf(probeId);
    if (!index) {
        throw SchemaError("unknown probe identifier", ErrorContext{}.withFeature(probeId));
    }
    return addressFor(probe(*index), role);
}

BeadAddress Manifest::addressFor(const Probe& probe, Role role) noexcept {
    switch (probe.type) {
        case ProbeType::kInfIGrn:
            return role == Role::kA ? probe.addressA : *probe.addressB;
        case ProbeType::kInfIRed:
            return *probe.addressB;
        case ProbeType::kInfII:
            return probe.addressA;
    }
    return probe.addressA;
}

Channel Manifest::channelFor(ProbeType type, Role role) noexcept {
    switch (type) {
        case ProbeType::kInfIGrn:
            return Channel::kGreen;
        case ProbeType::kInfIRed:
            return Channel::kRed;
        case ProbeType::kInfII:
            return role == Role::kA ? Channel::kGreen : Channel::kRed;
    }
    return Channel::kGreen;
}

std::vector<std::size_t> Manifest::cpgRowsOnChromosome(std::string_view chr) const {
    const std::string_view wanted = str::stripChrPrefix(chr);
    std::vector<std::size_t> rows;
    for (std::size_t row = 0; row < cpg_.size(); ++row) {
        if (str::stripChrPrefix(probe(cpg_[row]).chr) == wanted) {
            rows.push_back(row);
        }
    }
    return rows;
}

std::vector<std::string> Manifest::controlsOfType(ControlType type) const {
    std::vector<std::string> ids;
    for (std::size_t index : controlIndicesOfType(type)) {
        ids.push_back(control(index).id());
    }
    return ids;
}

std::vector<std::size_t> Manifest::controlIndicesOfType(ControlType type) const {
    std::vector<std::size_t> indices;
    const auto& all = controls_.controls();
    for (std::size_t i = 0; i < all.size(); ++i) {
        if (all[i].type == type) {
            indices.push_back(i);
        }
    }
    return indices;
}

std::vector<std::string> Manifest::controlsMatching(std::span<const std::string> patterns,
                                                    MatchMode mode) const {
    std::vector<std::string> ids;
    for (std::size_t index : controlIndicesMatching(patterns, mode)) {
        ids.push_back(control(index).id());
    }
    return ids;
}

std::vector<std::size_t> Manifest::controlIndicesMatching(std::span<const std::string> patterns,
                                                          MatchMode mode) const {
    std::vector<std::size_t> indices;
    const auto& all = controls_.controls();
    for (std::size_t i = 0; i < all.size(); ++i) {
        const std::string& description = all[i].description;
        const bool matched =
            std::any_of(patterns.begin(), patterns.end(), [&](const std::string& pattern) {
                return mode == MatchMode::kExact
                           ? description == pattern
                           : description.find(pattern) != std::string::npos;
            });
        if (matched) {
            indices.push_back(i);
        }
    }
    return indices;
}

}  // namespace inorm
