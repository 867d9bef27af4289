// =============================================================================
// infinium-norm - Dye-Bias Corrector Implementation
// =============================================================================

#include "inorm/algo/dye_bias.h"

#include <fmt/format.h>

#include <string>

#include "inorm/common/error.h"
#include "inorm/common/types.h"

namespace inorm::algo {

DyeBiasCorrector::DyeBiasCorrector(const Manifest& manifest) : manifest_(manifest) {
    if (manifest_.normalizationPairs().empty()) {
        throw DegenerateInputError(
            "control manifest has no NORM_C/NORM_G bead with a matching NORM_T/NORM_A bead");
    }
}

DyeBiasCorrection DyeBiasCorrector::estimate(std::span<const double> controlGrn,
                                             std::span<const double> controlRed,
                                             std::string_view sampleId) const {
    double sumGrn = 0.0;
    double sumRed = 0.0;
    std::size_t used = 0;

    for (const auto& pair : manifest_.normalizationPairs()) {
        const double grn = controlGrn[pair.green];
        const double red = controlRed[pair.red];
        if (isMissing(grn) || isMissing(red) || grn == 0.0 || red == 0.0) {
            continue;
        }
        const double pairMean = (grn + red) / 2.0;
        sumGrn += pairMean / grn;
        sumRed += pairMean / red;
        ++used;
    }

    if (used == 0) {
        throw DegenerateInputError(
            fmt::format("none of {} normalization control pairs has both intensities",
                        manifest_.normalizationPairs().size()),
            ErrorContext{}.withSample(std::string(sampleId)));
    }

    DyeBiasCorrection correction;
    correction.grn = sumGrn / static_cast<double>(used);
    correction.red = sumRed / static_cast<double>(used);
    correction.pairsUsed = used;
    return correction;
}

void DyeBiasCorrector::apply(const DyeBiasCorrection& correction, std::span<double> a,
                             std::span<double> b) const {
    for (std::size_t i : manifest_.probeIndicesOfType(ProbeType::kInfII)) {
        a[i] *= correction.red;
        b[i] *= correction.grn;
    }
}

std::vector<DyeBiasCorrection> DyeBiasCorrector::applyAll(const IntensityMatrices& controls,
                                                          LabeledMatrix& a,
                                                          LabeledMatrix& b) const {
    std::vector<DyeBiasCorrection> corrections;
    corrections.reserve(a.cols());
    for (std::size_t col = 0; col < a.cols(); ++col) {
        corrections.push_back(estimate(controls.controlGrn.column(col),
                                       controls.controlRed.column(col), a.colIds()[col]));
        apply(corrections.back(), a.column(col), b.column(col));
    }
    return corrections;
}

}  // namespace inorm::algo
