// =============================================================================
// infinium-norm - Numeric Helpers Implementation
// =============================================================================

#include "inorm/common/numeric.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

#include "inorm/common/types.h"

namespace inorm::numeric {

namespace {

/// @brief Evaluate the rational function num(x) / den(x), coefficients in
///        ascending powers.
[[nodiscard]] double rational(const std::array<double, 8>& num, const std::array<double, 8>& den,
                              double x) noexcept {
    double u = num[7];
    double v = den[7];
    for (std::size_t i = 7; i > 0; --i) {
        u = u * x + num[i - 1];
        v = v * x + den[i - 1];
    }
    return u / v;
}

// AS 241 (PPND16) coefficients.
constexpr std::array<double, 8> kCentralNum{
    3.3871328727963666080e0, 1.3314166789178437745e+2, 1.9715909503065514427e+3,
    1.3731693765509461125e+4, 4.5921953931549871457e+4, 6.7265770927008700853e+4,
    3.3430575583588128105e+4, 2.5090809287301226727e+3};
constexpr std::array<double, 8> kCentralDen{
    1.0, 4.2313330701600911252e+1, 6.8718700749205790830e+2, 5.3941960214247511077e+3,
    2.1213794301586595867e+4, 3.9307895800092710610e+4, 2.8729085735721942674e+4,
    5.2264952788528545610e+3};

constexpr std::array<double, 8> kNearNum{
    1.42343711074968357734e0, 4.63033784615654529590e0, 5.76949722146069140550e0,
    3.64784832476320460504e0, 1.27045825245236838258e0, 2.41780725177450611770e-1,
    2.27238449892691845833e-2, 7.74545014278341407640e-4};
constexpr std::array<double, 8> kNearDen{
    1.0, 2.05319162663775882187e0, 1.67638483018380384940e0, 6.89767334985100004550e-1,
    1.48103976427480074590e-1, 1.51986665636164571966e-2, 5.47593808499534494600e-4,
    1.05075007164441684324e-9};

constexpr std::array<double, 8> kTailNum{
    6.65790464350110377720e0, 5.46378491116411436990e0, 1.78482653991729133580e0,
    2.96560571828504891230e-1, 2.65321895265761230930e-2, 1.24266094738807843860e-3,
    2.71155556874348757815e-5, 2.01033439929228813265e-7};
constexpr std::array<double, 8> kTailDen{
    1.0, 5.99832206555887937690e-1, 1.36929880922735805310e-1, 1.48753612908506148525e-2,
    7.86869131145613259100e-4, 1.84631831751005468180e-5, 1.42151175831644588870e-7,
    2.04426310338993978564e-15};

constexpr double kCentralSplit = 0.425;
constexpr double kTailSplit = 5.0;

}  // namespace

std::vector<double> gather(std::span<const double> column, std::span<const std::size_t> rows) {
    std::vector<double> out;
    out.reserve(rows.size());
    for (std::size_t row : rows) {
        out.push_back(column[row]);
    }
    return out;
}

std::size_t countPresent(std::span<const double> values) noexcept {
    return static_cast<std::size_t>(
        std::count_if(values.begin(), values.end(), [](double v) { return !isMissing(v); }));
}

double nanMean(std::span<const double> values) noexcept {
    double sum = 0.0;
    std::size_t n = 0;
    for (double v : values) {
        if (!isMissing(v)) {
            sum += v;
            ++n;
        }
    }
    return n > 0 ? sum / static_cast<double>(n) : kMissing;
}

double nanSampleSd(std::span<const double> values) noexcept {
    const std::size_t n = countPresent(values);
    if (n < 2) {
        return kMissing;
    }
    const double mean = nanMean(values);
    double ss = 0.0;
    for (double v : values) {
        if (!isMissing(v)) {
            ss += (v - mean) * (v - mean);
        }
    }
    return std::sqrt(ss / static_cast<double>(n - 1));
}

double populationSd(std::span<const double> values) noexcept {
    if (values.empty()) {
        return kMissing;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    const double mean = sum / static_cast<double>(values.size());
    double ss = 0.0;
    for (double v : values) {
        ss += (v - mean) * (v - mean);
    }
    return std::sqrt(ss / static_cast<double>(values.size()));
}

double nanMedian(std::span<const double> values) {
    std::vector<double> present;
    present.reserve(values.size());
    for (double v : values) {
        if (!isMissing(v)) {
            present.push_back(v);
        }
    }
    if (present.empty()) {
        return kMissing;
    }
    const std::size_t mid = present.size() / 2;
    std::nth_element(present.begin(), present.begin() + static_cast<std::ptrdiff_t>(mid),
                     present.end());
    const double upper = present[mid];
    if (present.size() % 2 == 1) {
        return upper;
    }
    const double lower =
        *std::max_element(present.begin(), present.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lower + upper);
}

double nanMax(std::span<const double> values) noexcept {
    double best = kMissing;
    for (double v : values) {
        if (!isMissing(v) && (isMissing(best) || v > best)) {
            best = v;
        }
    }
    return best;
}

double missingFraction(std::span<const double> values) noexcept {
    if (values.empty()) {
        return kMissing;
    }
    const std::size_t missing = values.size() - countPresent(values);
    return static_cast<double>(missing) / static_cast<double>(values.size());
}

double inverseNormalCdf(double p) noexcept {
    if (isMissing(p) || p < 0.0 || p > 1.0) {
        return kMissing;
    }
    if (p == 0.0) {
        return -std::numeric_limits<double>::infinity();
    }
    if (p == 1.0) {
        return std::numeric_limits<double>::infinity();
    }

    const double q = p - 0.5;
    if (std::fabs(q) <= kCentralSplit) {
        return q * rational(kCentralNum, kCentralDen, 0.180625 - q * q);
    }

    const double r = std::sqrt(-std::log(q < 0.0 ? p : 1.0 - p));
    const double x = r <= kTailSplit ? rational(kNearNum, kNearDen, r - 1.6)
                                     : rational(kTailNum, kTailDen, r - kTailSplit);
    return q < 0.0 ? -x : x;
}

}  // namespace inorm::numeric
