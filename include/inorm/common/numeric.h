// =============================================================================
// infinium-norm - Numeric Helpers
// =============================================================================
// Missing-aware summary statistics and the inverse standard normal CDF.
//
// All nan* reductions skip missing values and return kMissing when nothing
// is left to reduce.
// =============================================================================

#ifndef INORM_COMMON_NUMERIC_H
#define INORM_COMMON_NUMERIC_H

#include <cstddef>
#include <span>
#include <vector>

namespace inorm::numeric {

/// @brief Collect column[rows[i]] for every index in rows.
[[nodiscard]] std::vector<double> gather(std::span<const double> column,
                                         std::span<const std::size_t> rows);

/// @brief Number of non-missing values.
[[nodiscard]] std::size_t countPresent(std::span<const double> values) noexcept;

[[nodiscard]] double nanMean(std::span<const double> values) noexcept;

/// @brief Sample standard deviation (n - 1 denominator).
/// @return kMissing when fewer than two values are present.
[[nodiscard]] double nanSampleSd(std::span<const double> values) noexcept;

/// @brief Population standard deviation (n denominator) of all values.
/// @note Missing values propagate.
[[nodiscard]] double populationSd(std::span<const double> values) noexcept;

[[nodiscard]] double nanMedian(std::span<const double> values);

[[nodiscard]] double nanMax(std::span<const double> values) noexcept;

/// @brief Fraction of values that are missing.
/// @return kMissing for an empty span.
[[nodiscard]] double missingFraction(std::span<const double> values) noexcept;

/// @brief Inverse of the standard normal CDF.
/// @param p Probability in [0, 1].
/// @return Quantile; -inf at 0, +inf at 1, kMissing outside [0, 1].
/// @note Wichura (1988), Algorithm AS 241, accurate to about 1e-16.
[[nodiscard]] double inverseNormalCdf(double p) noexcept;

}  // namespace inorm::numeric

#endif  // INORM_COMMON_NUMERIC_H
