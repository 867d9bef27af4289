// =============================================================================
// infinium-norm - Dye-Bias Corrector
// =============================================================================
// Per-sample green/red scaling from the normalization control beads.
//
// Each NORM_C / NORM_G bead (green) is paired with the NORM_T / NORM_A bead
// (red) whose description is its own with C->T and G->A. For a pair (g, r):
//
//   pair_mean = (grn[g] + red[r]) / 2
//   corr_grn  = mean over pairs of pair_mean / grn[g]
//   corr_red  = mean over pairs of pair_mean / red[r]
//
// Only Infinium II intensities are rescaled: A *= corr_red, B *= corr_grn.
// =============================================================================

#ifndef INORM_ALGO_DYE_BIAS_H
#define INORM_ALGO_DYE_BIAS_H

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

#include "inorm/algo/intensity_extractor.h"
#include "inorm/model/manifest.h"
#include "inorm/model/matrix.h"

namespace inorm::algo {

/// @brief Multiplicative correction factors of one sample.
struct DyeBiasCorrection {
    double grn = 1.0;
    double red = 1.0;

    /// @brief Number of normalization pairs the factors were averaged over.
    std::size_t pairsUsed = 0;
};

class DyeBiasCorrector {
public:
    /// @throws DegenerateInputError if the manifest has no normalization pair.
    explicit DyeBiasCorrector(const Manifest& manifest);

    /// @brief Correction factors from one sample's control intensities.
    /// @note Pairs with a missing or zero intensity on either side are skipped.
    /// @throws DegenerateInputError if no pair is complete.
    [[nodiscard]] DyeBiasCorrection estimate(std::span<const double> controlGrn,
                                             std::span<const double> controlRed,
                                             std::string_view sampleId) const;

    [[nodiscard]] DyeBiasCorrection estimate(const SampleIntensities& sample) const {
        return estimate(sample.controlGrn, sample.controlRed, sample.sampleId);
    }

    /// @brief Rescale the Infinium II entries of one sample in place.
    void apply(const DyeBiasCorrection& correction, std::span<double> a,
               std::span<double> b) const;

    /// @brief Estimate from the control matrices and rescale every sample
    ///        (column) of A and B in place.
    /// @return The factors used, one per sample.
    std::vector<DyeBiasCorrection> applyAll(const IntensityMatrices& controls, LabeledMatrix& a,
                                            LabeledMatrix& b) const;

private:
    const Manifest& manifest_;
};

}  // namespace inorm::algo

#endif  // INORM_ALGO_DYE_BIAS_H
