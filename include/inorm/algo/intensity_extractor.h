// =============================================================================
// infinium-norm - Intensity Extractor
// =============================================================================
// Splits a sample's bead summary into the A (unmethylated) and B (methylated)
// probe intensities and the per-channel control-bead intensities.
//
// Address / channel selection by probe chemistry:
// - I-Grn: A = green at address A, B = green at address B
// - I-Red: A = red at address B,   B = red at address B
// - II:    A = green at address A, B = red at address A
//
// A probe value whose channel bead count is below min_beads is missing.
// A control value is kept when its channel bead count is positive.
// =============================================================================

#ifndef INORM_ALGO_INTENSITY_EXTRACTOR_H
#define INORM_ALGO_INTENSITY_EXTRACTOR_H

#include <span>
#include <string>
#include <vector>

#include "inorm/model/bead_summary.h"
#include "inorm/model/manifest.h"
#include "inorm/model/matrix.h"

namespace inorm::algo {

// =============================================================================
// Per-Sample Intensities
// =============================================================================

/// @brief Intensities of one sample, indexed like the manifest.
struct SampleIntensities {
    std::string sampleId;

    /// @brief A-role intensity per probe.
    std::vector<double> a;

    /// @brief B-role intensity per probe.
    std::vector<double> b;

    /// @brief Green intensity per control bead.
    std::vector<double> controlGrn;

    /// @brief Red intensity per control bead.
    std::vector<double> controlRed;
};

/// @brief Probe x sample and control x sample intensity matrices.
struct IntensityMatrices {
    LabeledMatrix a;
    LabeledMatrix b;
    LabeledMatrix controlGrn;
    LabeledMatrix controlRed;
};

// =============================================================================
// IntensityExtractor
// =============================================================================

class IntensityExtractor {
public:
    /// @param manifest Reference tables; must outlive the extractor.
    /// @param minBeads Minimum bead count for a probe value to be kept.
    IntensityExtractor(const Manifest& manifest, int minBeads) noexcept
        : manifest_(manifest), minBeads_(minBeads) {}

    /// @brief Extract probe and control intensities of one sample.
    /// @throws MissingAddressError if a manifest address is absent.
    [[nodiscard]] SampleIntensities extract(const BeadSummary& beads) const;

    /// @brief Extract every sample into labeled matrices.
    [[nodiscard]] IntensityMatrices extractAll(std::span<const BeadSummary> samples) const;

    [[nodiscard]] int minBeads() const noexcept { return minBeads_; }

private:
    void extractProbes(const BeadSummary& beads, SampleIntensities& out) const;
    void extractControls(const BeadSummary& beads, SampleIntensities& out) const;

    const Manifest& manifest_;
    int minBeads_;
};

// =============================================================================
// Assembly
// =============================================================================

/// @brief Probe ids of the manifest, in manifest order.
[[nodiscard]] std::vector<std::string> probeIds(const Manifest& manifest);

/// @brief Control ids of the manifest, in manifest order.
[[nodiscard]] std::vector<std::string> controlIds(const Manifest& manifest);

/// @brief Lay per-sample intensities out as probe x sample and
///        control x sample matrices, one column per sample in input order.
[[nodiscard]] IntensityMatrices assembleIntensities(const Manifest& manifest,
                                                    std::span<const SampleIntensities> samples);

}  // namespace inorm::algo

#endif  // INORM_ALGO_INTENSITY_EXTRACTOR_H
