// =============================================================================
// infinium-norm - QC Summary Builder Implementation
// =============================================================================

#include "inorm/algo/qc_summary.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <utility>

#include "inorm/common/logger.h"
#include "inorm/common/numeric.h"
#include "inorm/common/string_utils.h"

namespace inorm::algo {

namespace {

using Kind = QcRule::Kind;

/// @brief Number of rules resolved from control beads; the remaining
///        metrics come from beta-values.
constexpr std::size_t kControlMetricCount = kQcMetricCount - 3;

[[nodiscard]] std::vector<std::string> numbered(std::string_view prefix, int first, int last,
                                                std::string_view suffix) {
    std::vector<std::string> out;
    for (int i = first; i <= last; ++i) {
        out.push_back(fmt::format("{}{}{}", prefix, i, suffix));
    }
    return out;
}

[[nodiscard]] std::vector<std::string> transformed(const std::vector<std::string>& patterns,
                                                   bool bisulfite) {
    std::vector<std::string> out;
    out.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        out.push_back(bisulfite ? str::translate(pattern, "U", "C")
                                : str::replaceAll(pattern, "(MM)", "(PM)"));
    }
    return out;
}

class PlanBuilder {
public:
    explicit PlanBuilder(const Manifest& manifest) : manifest_(manifest) {}

    std::vector<std::size_t> lookup(std::string_view metric,
                                    const std::vector<std::string>& patterns) {
        auto indices = manifest_.controlIndicesMatching(patterns, MatchMode::kExact);
        if (indices.empty()) {
            const std::string described = fmt::format("{}", fmt::join(patterns, " / "));
            INORM_LOG_WARNING("QC metric {}: no control bead described as {}", metric, described);
        }
        return indices;
    }

    std::vector<std::size_t> lookupType(std::string_view metric, ControlType type) {
        auto indices = manifest_.controlIndicesOfType(type);
        if (indices.empty()) {
            INORM_LOG_WARNING("QC metric {}: no control bead of type {}", metric,
                              controlTypeToString(type));
        }
        return indices;
    }

    QcRule value(std::string_view metric, Channel channel, std::string description) {
        QcRule rule{Kind::kValue, channel, lookup(metric, {std::move(description)}), {}};
        rule.available = !rule.signal.empty();
        return rule;
    }

    QcRule ratio(std::string_view metric, Channel channel, const std::vector<std::string>& signal,
                 const std::vector<std::string>& background) {
        QcRule rule{Kind::kRatio, channel, lookup(metric, signal), lookup(metric, background)};
        rule.available = !rule.signal.empty() && !rule.background.empty();
        return rule;
    }

    QcRule bisulfiteRatio(std::string_view metric, Channel channel, int first, int last) {
        const auto background = numbered("BS Conversion I-U", first, last, "");
        return ratio(metric, channel, transformed(background, true), background);
    }

    QcRule specificityRatio(std::string_view metric, Channel channel, int first, int last) {
        const auto background = numbered("GT Mismatch ", first, last, " (MM)");
        return ratio(metric, channel, transformed(background, false), background);
    }

    QcRule ofType(std::string_view metric, Kind kind, ControlType type) {
        QcRule rule{kind, Channel::kGreen, lookupType(metric, type), {}};
        rule.available = !rule.signal.empty();
        return rule;
    }

private:
    const Manifest& manifest_;
};

[[nodiscard]] double channelMean(std::span<const double> values,
                                 const std::vector<std::size_t>& indices) {
    return numeric::nanMean(numeric::gather(values, indices));
}

}  // namespace

QcPlan::QcPlan(const Manifest& manifest)
    : chrXRows_(manifest.cpgRowsOnChromosome("X")), chrYRows_(manifest.cpgRowsOnChromosome("Y")) {
    PlanBuilder b(manifest);
    constexpr Channel kGrn = Channel::kGreen;
    constexpr Channel kRed = Channel::kRed;

    rules_.reserve(kControlMetricCount);
    rules_.push_back(b.bisulfiteRatio("bc1_grn", kGrn, 1, 3));
    rules_.push_back(b.bisulfiteRatio("bc1_red", kRed, 4, 6));
    rules_.push_back(b.ofType("bc2", Kind::kCrossChannel, ControlType::kBisulfiteConversionII));
    rules_.push_back(b.value("ext_a", kRed, "Extension (A)"));
    rules_.push_back(b.value("ext_c", kGrn, "Extension (C)"));
    rules_.push_back(b.value("ext_g", kGrn, "Extension (G)"));
    rules_.push_back(b.value("ext_t", kRed, "Extension (T)"));
    rules_.push_back(b.value("hyb_low", kGrn, "Hyb (Low)"));
    rules_.push_back(b.value("hyb_med", kGrn, "Hyb (Medium)"));
    rules_.push_back(b.value("hyb_high", kGrn, "Hyb (High)"));
    rules_.push_back(b.value("np_a", kRed, "NP (A)"));
    rules_.push_back(b.value("np_c", kGrn, "NP (C)"));
    rules_.push_back(b.value("np_g", kGrn, "NP (G)"));
    rules_.push_back(b.value("np_t", kRed, "NP (T)"));
    rules_.push_back(b.specificityRatio("spec1_grn", kGrn, 1, 3));
    rules_.push_back(b.specificityRatio("spec1_red", kRed, 4, 6));
    rules_.push_back(b.ofType("spec2", Kind::kCrossChannel, ControlType::kSpecificityII));
    rules_.push_back(b.ratio("st_grn", kGrn, {"Biotin (High)"}, {"Biotin (Bkg)"}));
    rules_.push_back(b.ratio("st_red", kRed, {"DNP (High)"}, {"DNP (Bkg)"}));
    rules_.push_back(b.ofType("tr", Kind::kMax, ControlType::kTargetRemoval));

    if (chrYRows_.empty()) {
        INORM_LOG_DEBUG("QC metric missing_chrY: manifest has no chromosome Y CpG probe");
    }
}

std::array<double, kQcMetricCount> QcPlan::compute(std::span<const double> controlGrn,
                                                   std::span<const double> controlRed,
                                                   std::span<const double> betas) const {
    std::array<double, kQcMetricCount> out;
    out.fill(kMissing);

    for (std::size_t m = 0; m < rules_.size(); ++m) {
        const QcRule& rule = rules_[m];
        if (!rule.available) {
            continue;
        }
        const auto values = rule.channel == Channel::kGreen ? controlGrn : controlRed;
        switch (rule.kind) {
            case Kind::kValue:
                out[m] = channelMean(values, rule.signal);
                break;
            case Kind::kRatio:
                out[m] = channelMean(values, rule.signal) / channelMean(values, rule.background);
                break;
            case Kind::kCrossChannel:
                out[m] = channelMean(controlRed, rule.signal) / channelMean(controlGrn, rule.signal);
                break;
            case Kind::kMax:
                out[m] = numeric::nanMax(numeric::gather(values, rule.signal));
                break;
        }
    }

    out[kControlMetricCount] = numeric::missingFraction(betas);
    out[kControlMetricCount + 1] = numeric::nanMedian(numeric::gather(betas, chrXRows_));
    out[kControlMetricCount + 2] = numeric::missingFraction(numeric::gather(betas, chrYRows_));
    return out;
}

LabeledMatrix QcPlan::summarize(const LabeledMatrix& controlGrn, const LabeledMatrix& controlRed,
                                const LabeledMatrix& betas) const {
    LabeledMatrix summary(betas.colIds(), metricNames());
    for (std::size_t sample = 0; sample < betas.cols(); ++sample) {
        const auto metrics =
            compute(controlGrn.column(sample), controlRed.column(sample), betas.column(sample));
        for (std::size_t m = 0; m < kQcMetricCount; ++m) {
            summary.at(sample, m) = metrics[m];
        }
    }
    return summary;
}

std::vector<std::string> QcPlan::metricNames() {
    return {kQcMetricNames.begin(), kQcMetricNames.end()};
}

}  // namespace inorm::algo
