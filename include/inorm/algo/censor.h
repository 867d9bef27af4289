// =============================================================================
// infinium-norm - Censor & Background-Subtract
// =============================================================================
// Marks probe intensities that fail detection as missing.
//
// A value is kept only if
//   (a) it exceeds the negative-control mean of the channel it is read in
//       (the red mean for both Type-II roles), and
//   (b) the probe's total A + B exceeds the threshold of its probe type.
// Test (b) uses the uncensored total; a missing A or B fails it for both.
// Background subtraction uses the same mean as test (a).
// =============================================================================

#ifndef INORM_ALGO_CENSOR_H
#define INORM_ALGO_CENSOR_H

#include <span>

#include "inorm/algo/background_model.h"
#include "inorm/model/manifest.h"
#include "inorm/model/matrix.h"

namespace inorm::algo {

class Censor {
public:
    /// @param subtractBackground Subtract the channel negative-control mean
    ///        from retained values.
    Censor(const Manifest& manifest, bool subtractBackground) noexcept
        : manifest_(manifest), subtractBackground_(subtractBackground) {}

    /// @brief Censor one sample's A and B intensities in place.
    /// @pre a.size() == b.size() == number of manifest probes.
    void apply(const Background& background, std::span<double> a, std::span<double> b) const;

    /// @brief Censor every sample (column) of A and B matrices in place.
    /// @pre backgrounds.size() == a.cols() == b.cols().
    void applyAll(std::span<const Background> backgrounds, LabeledMatrix& a,
                  LabeledMatrix& b) const;

    [[nodiscard]] bool subtractsBackground() const noexcept { return subtractBackground_; }

private:
    const Manifest& manifest_;
    bool subtractBackground_;
};

}  // namespace inorm::algo

#endif  // INORM_ALGO_CENSOR_H
