// =============================================================================
// infinium-norm - Background Model
// =============================================================================
// Negative-control background estimate and detection thresholds.
//
// Per sample and channel, the negative-control beads give a background mean
// and sample SD. With z the standard normal quantile at (1 - detection):
//
//   threshold_grn = 2 * mean_grn + z * sqrt(2) * sd_grn
//   threshold_red = 2 * mean_red + z * sqrt(2) * sd_red
//   threshold_II  = mean_overall + z * sqrt(2 * sd_overall^2)
//
// where mean_overall is the mean of the two channel means and sd_overall the
// population SD of the two channel SDs. A summed A + B intensity must exceed
// the threshold of its probe type to be considered detected.
// =============================================================================

#ifndef INORM_ALGO_BACKGROUND_MODEL_H
#define INORM_ALGO_BACKGROUND_MODEL_H

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

#include "inorm/algo/intensity_extractor.h"
#include "inorm/common/types.h"
#include "inorm/model/manifest.h"

namespace inorm::algo {

/// @brief Background estimate of one sample.
struct Background {
    double negMeanGrn = kMissing;
    double negSdGrn = kMissing;
    double negMeanRed = kMissing;
    double negSdRed = kMissing;

    /// @brief Mean of the two channel means.
    double negMeanOverall = kMissing;

    /// @brief Population SD of the two channel SDs.
    double negSdOverall = kMissing;

    double thresholdGrn = kMissing;
    double thresholdRed = kMissing;
    double thresholdII = kMissing;

    [[nodiscard]] double negMean(Channel channel) const noexcept {
        return channel == Channel::kGreen ? negMeanGrn : negMeanRed;
    }

    /// @brief Total-intensity threshold for a probe type.
    [[nodiscard]] double threshold(ProbeType type) const noexcept {
        switch (type) {
            case ProbeType::kInfIGrn:
                return thresholdGrn;
            case ProbeType::kInfIRed:
                return thresholdRed;
            case ProbeType::kInfII:
                return thresholdII;
        }
        return thresholdII;
    }
};

/// @brief Standard normal quantile at (1 - detection).
/// @note -inf for detection = 1.
[[nodiscard]] double detectionZ(double detection) noexcept;

/// @brief Single-channel threshold: 2 * mean + z * sqrt(2) * sd.
[[nodiscard]] double channelThreshold(double negMean, double negSd, double z) noexcept;

class BackgroundModel {
public:
    /// @param detection Detection p-value in (0, 1].
    BackgroundModel(const Manifest& manifest, double detection);

    /// @brief Estimate background and thresholds from one sample's controls.
    /// @throws DegenerateInputError if either channel has fewer than two
    ///         non-missing negative-control values.
    [[nodiscard]] Background estimate(std::span<const double> controlGrn,
                                      std::span<const double> controlRed,
                                      std::string_view sampleId) const;

    [[nodiscard]] Background estimate(const SampleIntensities& sample) const {
        return estimate(sample.controlGrn, sample.controlRed, sample.sampleId);
    }

    /// @brief Estimate every sample (column) of control matrices.
    [[nodiscard]] std::vector<Background> estimateAll(const IntensityMatrices& matrices) const;

    [[nodiscard]] double z() const noexcept { return z_; }

    [[nodiscard]] std::span<const std::size_t> negativeControls() const noexcept {
        return negatives_;
    }

private:
    std::vector<std::size_t> negatives_;
    double z_;
};

}  // namespace inorm::algo

#endif  // INORM_ALGO_BACKGROUND_MODEL_H
