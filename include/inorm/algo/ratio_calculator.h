// =============================================================================
// infinium-norm - Ratio & SNP Calculator
// =============================================================================
// Beta-values for CpG probes and polar coordinates for SNP probes.
//
//   beta  = B / (A + B)                  CpG probes
//   theta = atan2(B, A) / (pi / 2)       SNP probes, in [0, 1] for A, B >= 0
//   r     = sqrt(A^2 + B^2)              SNP probes
//
// A missing input gives a missing output, as does A = B = 0 for beta and
// theta.
// =============================================================================

#ifndef INORM_ALGO_RATIO_CALCULATOR_H
#define INORM_ALGO_RATIO_CALCULATOR_H

#include <span>
#include <string>
#include <vector>

#include "inorm/model/manifest.h"
#include "inorm/model/matrix.h"

namespace inorm::algo {

[[nodiscard]] double betaValue(double a, double b) noexcept;

[[nodiscard]] double thetaValue(double a, double b) noexcept;

[[nodiscard]] double radiusValue(double a, double b) noexcept;

class RatioCalculator {
public:
    explicit RatioCalculator(const Manifest& manifest) noexcept : manifest_(manifest) {}

    /// @brief Beta-values of one sample, one per CpG probe (manifest order).
    [[nodiscard]] std::vector<double> betas(std::span<const double> a,
                                            std::span<const double> b) const;

    /// @brief Theta of one sample, one per SNP probe (manifest order).
    [[nodiscard]] std::vector<double> theta(std::span<const double> a,
                                            std::span<const double> b) const;

    /// @brief Radius of one sample, one per SNP probe (manifest order).
    [[nodiscard]] std::vector<double> radius(std::span<const double> a,
                                             std::span<const double> b) const;

    /// @brief CpG probe x sample beta matrix.
    [[nodiscard]] LabeledMatrix betaMatrix(const LabeledMatrix& a, const LabeledMatrix& b) const;

    /// @brief SNP probe x sample theta matrix.
    [[nodiscard]] LabeledMatrix thetaMatrix(const LabeledMatrix& a,
                                            const LabeledMatrix& b) const;

    /// @brief SNP probe x sample radius matrix.
    [[nodiscard]] LabeledMatrix radiusMatrix(const LabeledMatrix& a,
                                             const LabeledMatrix& b) const;

    /// @brief Row ids of beta matrices.
    [[nodiscard]] std::vector<std::string> cpgIds() const;

    /// @brief Row ids of theta and radius matrices.
    [[nodiscard]] std::vector<std::string> snpIds() const;

private:
    const Manifest& manifest_;
};

}  // namespace inorm::algo

#endif  // INORM_ALGO_RATIO_CALCULATOR_H
