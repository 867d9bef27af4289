// =============================================================================
// infinium-norm - Manifest Model
// =============================================================================
// In-memory probe and control-bead reference tables.
//
// This module provides:
// - Probe / ControlBead: immutable manifest records
// - ProbeManifest / ControlManifest: validated record collections
// - Manifest: lookups used by the pipeline stages, with the derived index
//   sets (probes by type, SNP / CpG split, sex-chromosome rows,
//   normalization-control pairing) computed once at construction
//
// Usage:
//   auto manifest = Manifest::fromTables(probeTable, controlTable);
//   auto grn = manifest.probesOfType(ProbeType::kInfIGrn);
//   BeadAddress a = manifest.addressFor("cg00000029", Role::kA);
// =============================================================================

#ifndef INORM_MODEL_MANIFEST_H
#define INORM_MODEL_MANIFEST_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "inorm/common/types.h"
#include "inorm/model/table.h"

namespace inorm {

// =============================================================================
// Records
// =============================================================================

/// @brief One probe of the array.
struct Probe {
    /// @brief CpG or SNP identifier ("cg00050873", "rs10796216").
    std::string id;

    ProbeType type = ProbeType::kInfII;

    /// @brief Chromosome as written in the manifest.
    std::string chr;

    std::int64_t pos = 0;

    BeadAddress addressA = 0;

    /// @brief Second address; absent for Infinium II probes.
    std::optional<BeadAddress> addressB;
};

/// @brief One control bead of the array.
struct ControlBead {
    /// @brief Bead address; also serves as the control identifier.
    BeadAddress address = 0;

    ControlType type = ControlType::kOther;

    /// @brief Type string as written in the manifest.
    std::string typeName;

    std::string color;

    /// @brief Free text matched by the QC and dye-bias stages
    ///        ("Extension (A)", "GT Mismatch 1 (MM)", "Norm_C1").
    std::string description;

    std::string comment;

    [[nodiscard]] std::string id() const { return std::to_string(address); }
};

// =============================================================================
// Record Collections
// =============================================================================

class ProbeManifest {
public:
    ProbeManifest() = default;

    /// @brief Validate and index a list of probes.
    /// @throws SchemaError on duplicate ids or a Type-I probe without address B.
    explicit ProbeManifest(std::vector<Probe> probes);

    /// @brief Build from a parsed table.
    /// @note Columns: probe id (probe_id / id / unnamed first column), chr,
    ///       pos, type, address.a or address_a, address.b or address_b.
    [[nodiscard]] static ProbeManifest fromTable(const Table& table);

    [[nodiscard]] const std::vector<Probe>& probes() const noexcept { return probes_; }
    [[nodiscard]] std::size_t size() const noexcept { return probes_.size(); }
    [[nodiscard]] std::optional<std::size_t> indexOf(const std::string& id) const;

private:
    std::vector<Probe> probes_;
    std::unordered_map<std::string, std::size_t> index_;
};

class ControlManifest {
public:
    ControlManifest() = default;

    /// @throws SchemaError on duplicate addresses.
    explicit ControlManifest(std::vector<ControlBead> controls);

    /// @brief Build from a parsed table.
    /// @note Columns: address (or unnamed first column), type, description;
    ///       optional color, comment.
    [[nodiscard]] static ControlManifest fromTable(const Table& table);

    [[nodiscard]] const std::vector<ControlBead>& controls() const noexcept { return controls_; }
    [[nodiscard]] std::size_t size() const noexcept { return controls_.size(); }

private:
    std::vector<ControlBead> controls_;
};

// =============================================================================
// Manifest
// =============================================================================

/// @brief How controlsMatching compares patterns with descriptions.
enum class MatchMode : std::uint8_t {
    /// @brief Description equals one of the patterns.
    kExact = 0,

    /// @brief Description contains any of the patterns.
    kSubstring = 1
};

/// @brief A green normalization control and its red counterpart.
struct NormalizationPair {
    /// @brief Index of the NORM_C / NORM_G control.
    std::size_t green = 0;

    /// @brief Index of the NORM_T / NORM_A control.
    std::size_t red = 0;
};

class Manifest {
public:
    Manifest(ProbeManifest probes, ControlManifest controls);

    /// @brief Build both record collections from parsed tables.
    [[nodiscard]] static Manifest fromTables(const Table& probeTable, const Table& controlTable);

    [[nodiscard]] const std::vector<Probe>& probes() const noexcept { return probes_.probes(); }

    [[nodiscard]] const std::vector<ControlBead>& controls() const noexcept {
        return controls_.controls();
    }

    [[nodiscard]] const Probe& probe(std::size_t index) const noexcept {
        return probes_.probes()[index];
    }

    [[nodiscard]] const ControlBead& control(std::size_t index) const noexcept {
        return controls_.controls()[index];
    }

    // -------------------------------------------------------------------------
    // Probe lookups
    // -------------------------------------------------------------------------

    /// @brief Probe ids of one chemistry type, in manifest order.
    [[nodiscard]] std::vector<std::string> probesOfType(ProbeType type) const;

    /// @brief Probe indices of one chemistry type, in manifest order.
    [[nodiscard]] std::span<const std::size_t> probeIndicesOfType(ProbeType type) const noexcept {
        return byType_[static_cast<std::size_t>(type)];
    }

    /// @brief Bead address read for a role of a probe.
    /// @throws SchemaError for an unknown probe id.
    [[nodiscard]] BeadAddress addressFor(const std::string& probeId, Role role) const;

    /// @brief Bead address read for a role of a probe.
    /// @note I-Red reads address B for both roles, unlike I-Grn.
    [[nodiscard]] static BeadAddress addressFor(const Probe& probe, Role role) noexcept;

    /// @brief Colour channel a role is read in.
    [[nodiscard]] static Channel channelFor(ProbeType type, Role role) noexcept;

    /// @brief Indices of non-SNP probes (beta-value rows), in manifest order.
    [[nodiscard]] std::span<const std::size_t> cpgIndices() const noexcept { return cpg_; }

    /// @brief Indices of SNP probes (theta rows), in manifest order.
    [[nodiscard]] std::span<const std::size_t> snpIndices() const noexcept { return snp_; }

    /// @brief Positions within cpgIndices() of probes on the given chromosome
    ///        ("X", "Y"; a "chr" prefix is ignored).
    [[nodiscard]] std::vector<std::size_t> cpgRowsOnChromosome(std::string_view chr) const;

    // -------------------------------------------------------------------------
    // Control lookups
    // -------------------------------------------------------------------------

    /// @brief Control ids of one type, in manifest order.
    [[nodiscard]] std::vector<std::string> controlsOfType(ControlType type) const;

    [[nodiscard]] std::vector<std::size_t> controlIndicesOfType(ControlType type) const;

    /// @brief Control ids whose description matches any pattern.
    [[nodiscard]] std::vector<std::string> controlsMatching(std::span<const std::string> patterns,
                                                            MatchMode mode) const;

    [[nodiscard]] std::vector<std::size_t> controlIndicesMatching(
        std::span<const std::string> patterns, MatchMode mode) const;

    /// @brief Green/red normalization controls paired by the C->T, G->A
    ///        description transform.
    [[nodiscard]] std::span<const NormalizationPair> normalizationPairs() const noexcept {
        return normPairs_;
    }

private:
    void buildProbeIndex();
    void buildNormalizationPairs();

    ProbeManifest probes_;
    ControlManifest controls_;

    std::array<std::vector<std::size_t>, 3> byType_;
    std::vector<std::size_t> cpg_;
    std::vector<std::size_t> snp_;

    std::vector<NormalizationPair> normPairs_;
};

}  // namespace inorm

#endif  // INORM_MODEL_MANIFEST_H
