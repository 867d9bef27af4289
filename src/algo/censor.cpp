// =============================================================================
// infinium-norm - Censor & Background-Subtract Implementation
// =============================================================================

#include "inorm/algo/censor.h"

#include <cstddef>

#include "inorm/common/types.h"

namespace inorm::algo {

namespace {

/// @brief Channel whose negative-control mean a value is compared with.
/// @note Both Type-II roles are held against the red background.
[[nodiscard]] Channel backgroundChannel(ProbeType type, Role role) noexcept {
    if (type == ProbeType::kInfII) {
        return Channel::kRed;
    }
    return Manifest::channelFor(type, role);
}

}  // namespace

void Censor::apply(const Background& background, std::span<double> a,
                   std::span<double> b) const {
    const auto& probes = manifest_.probes();

    for (std::size_t i = 0; i < probes.size(); ++i) {
        const ProbeType type = probes[i].type;
        const double meanA = background.negMean(backgroundChannel(type, Role::kA));
        const double meanB = background.negMean(backgroundChannel(type, Role::kB));

        const double total = a[i] + b[i];
        const bool detected = total > background.threshold(type);

        const bool keepA = detected && a[i] > meanA;
        const bool keepB = detected && b[i] > meanB;

        a[i] = keepA ? (subtractBackground_ ? a[i] - meanA : a[i]) : kMissing;
        b[i] = keepB ? (subtractBackground_ ? b[i] - meanB : b[i]) : kMissing;
    }
}

void Censor::applyAll(std::span<const Background> backgrounds, LabeledMatrix& a,
                      LabeledMatrix& b) const {
    for (std::size_t col = 0; col < backgrounds.size(); ++col) {
        apply(backgrounds[col], a.column(col), b.column(col));
    }
}

}  // namespace inorm::algo
