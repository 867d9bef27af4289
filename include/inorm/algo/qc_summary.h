// =============================================================================
// infinium-norm - QC Summary Builder
// =============================================================================
// Per-sample quality-control metrics from control-bead intensities and
// beta-value missingness.
//
// The control subgroups behind each metric are resolved once per manifest
// into a QcPlan; computing a sample's metrics is then index arithmetic only.
// Signal subgroups are derived from their background subgroups by
// description transforms (U -> C for bisulfite conversion, "(MM)" -> "(PM)"
// for specificity).
// =============================================================================

#ifndef INORM_ALGO_QC_SUMMARY_H
#define INORM_ALGO_QC_SUMMARY_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "inorm/common/types.h"
#include "inorm/model/manifest.h"
#include "inorm/model/matrix.h"

namespace inorm::algo {

/// @brief Number of QC metrics per sample.
inline constexpr std::size_t kQcMetricCount = 23;

/// @brief Metric names, in output column order.
inline constexpr std::array<std::string_view, kQcMetricCount> kQcMetricNames{
    "bc1_grn", "bc1_red",   "bc2",       "ext_a",     "ext_c",       "ext_g",
    "ext_t",   "hyb_low",   "hyb_med",   "hyb_high",  "np_a",        "np_c",
    "np_g",    "np_t",      "spec1_grn", "spec1_red", "spec2",       "st_grn",
    "st_red",  "tr",        "missing",   "median_chrX", "missing_chrY"};

/// @brief How one control-derived metric is computed.
struct QcRule {
    enum class Kind : std::uint8_t {
        /// @brief Mean intensity of the signal beads in one channel.
        kValue,

        /// @brief Mean signal over mean background, one channel.
        kRatio,

        /// @brief Mean red over mean green of the signal beads.
        kCrossChannel,

        /// @brief Maximum intensity of the signal beads in one channel.
        kMax
    };

    Kind kind = Kind::kValue;
    Channel channel = Channel::kGreen;
    std::vector<std::size_t> signal;
    std::vector<std::size_t> background;

    /// @brief False when a subgroup was not found; the metric is then missing.
    bool available = false;
};

class QcPlan {
public:
    /// @brief Resolve every control subgroup against the manifest.
    /// @note Logs one warning per subgroup that matches no control bead.
    explicit QcPlan(const Manifest& manifest);

    /// @brief Metrics of one sample, in kQcMetricNames order.
    /// @param betas Beta-values of the sample, one per CpG probe.
    [[nodiscard]] std::array<double, kQcMetricCount> compute(std::span<const double> controlGrn,
                                                             std::span<const double> controlRed,
                                                             std::span<const double> betas) const;

    /// @brief Sample x metric summary table.
    /// @param betas CpG probe x sample beta matrix with the same columns as
    ///        the control matrices.
    [[nodiscard]] LabeledMatrix summarize(const LabeledMatrix& controlGrn,
                                          const LabeledMatrix& controlRed,
                                          const LabeledMatrix& betas) const;

    [[nodiscard]] std::span<const QcRule> rules() const noexcept { return rules_; }

    [[nodiscard]] static std::vector<std::string> metricNames();

private:
    std::vector<QcRule> rules_;
    std::vector<std::size_t> chrXRows_;
    std::vector<std::size_t> chrYRows_;
};

}  // namespace inorm::algo

#endif  // INORM_ALGO_QC_SUMMARY_H
