// =============================================================================
// infinium-norm - Background Model Implementation
// =============================================================================

#include "inorm/algo/background_model.h"

#include <fmt/format.h>

#include <array>
#include <cmath>
#include <numbers>
#include <string>

#include "inorm/common/error.h"
#include "inorm/common/numeric.h"

namespace inorm::algo {

namespace {

/// @brief Negative-control values of one channel, requiring at least two.
[[nodiscard]] std::vector<double> negativeValues(std::span<const double> controls,
                                                 std::span<const std::size_t> negatives,
                                                 Channel channel, std::string_view sampleId) {
    auto values = numeric::gather(controls, negatives);
    const std::size_t present = numeric::countPresent(values);
    if (present < 2) {
        throw DegenerateInputError(
            fmt::format("{} of {} negative controls present in the {} channel; at least 2 "
                        "are needed for a background estimate",
                        present, negatives.size(), channelToString(channel)),
            ErrorContext{}.withSample(std::string(sampleId)));
    }
    return values;
}

}  // namespace

double detectionZ(double detection) noexcept {
    return numeric::inverseNormalCdf(1.0 - detection);
}

double channelThreshold(double negMean, double negSd, double z) noexcept {
    if (std::isinf(z) && z < 0) {
        return z;
    }
    return 2.0 * negMean + z * std::numbers::sqrt2 * negSd;
}

BackgroundModel::BackgroundModel(const Manifest& manifest, double detection)
    : negatives_(manifest.controlIndicesOfType(ControlType::kNegative)),
      z_(detectionZ(detection)) {}

Background BackgroundModel::estimate(std::span<const double> controlGrn,
                                     std::span<const double> controlRed,
                                     std::string_view sampleId) const {
    const auto grn = negativeValues(controlGrn, negatives_, Channel::kGreen, sampleId);
    const auto red = negativeValues(controlRed, negatives_, Channel::kRed, sampleId);

    Background bg;
    bg.negMeanGrn = numeric::nanMean(grn);
    bg.negSdGrn = numeric::nanSampleSd(grn);
    bg.negMeanRed = numeric::nanMean(red);
    bg.negSdRed = numeric::nanSampleSd(red);

    const std::array<double, 2> means{bg.negMeanGrn, bg.negMeanRed};
    const std::array<double, 2> sds{bg.negSdGrn, bg.negSdRed};
    bg.negMeanOverall = (means[0] + means[1]) / 2.0;
    bg.negSdOverall = numeric::populationSd(sds);

    bg.thresholdGrn = channelThreshold(bg.negMeanGrn, bg.negSdGrn, z_);
    bg.thresholdRed = channelThreshold(bg.negMeanRed, bg.negSdRed, z_);
    if (std::isinf(z_) && z_ < 0) {
        bg.thresholdII = z_;
    } else {
        bg.thresholdII =
            bg.negMeanOverall + z_ * std::sqrt(bg.negSdOverall * bg.negSdOverall * 2.0);
    }
    return bg;
}

std::vector<Background> BackgroundModel::estimateAll(const IntensityMatrices& matrices) const {
    std::vector<Background> out;
    out.reserve(matrices.controlGrn.cols());
    for (std::size_t col = 0; col < matrices.controlGrn.cols(); ++col) {
        out.push_back(estimate(matrices.controlGrn.column(col), matrices.controlRed.column(col),
                               matrices.controlGrn.colIds()[col]));
    }
    return out;
}

}  // namespace inorm::algo
