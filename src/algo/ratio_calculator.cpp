// =============================================================================
// infinium-norm - Ratio & SNP Calculator Implementation
// =============================================================================

#include "inorm/algo/ratio_calculator.h"

#include <cmath>
#include <cstddef>
#include <numbers>
#include <string>
#include <utility>

#include "inorm/common/types.h"

namespace inorm::algo {

namespace {

template <typename F>
[[nodiscard]] std::vector<double> mapRows(std::span<const std::size_t> rows,
                                          std::span<const double> a, std::span<const double> b,
                                          F&& f) {
    std::vector<double> out;
    out.reserve(rows.size());
    for (std::size_t row : rows) {
        out.push_back(f(a[row], b[row]));
    }
    return out;
}

template <typename F>
[[nodiscard]] LabeledMatrix mapMatrix(std::vector<std::string> rowIds, const LabeledMatrix& a,
                                      const LabeledMatrix& b, F&& perSample) {
    LabeledMatrix out(std::move(rowIds), a.colIds());
    for (std::size_t col = 0; col < a.cols(); ++col) {
        out.setColumn(col, perSample(a.column(col), b.column(col)));
    }
    return out;
}

}  // namespace

double betaValue(double a, double b) noexcept {
    const double total = a + b;
    if (isMissing(total) || total == 0.0) {
        return kMissing;
    }
    return b / total;
}

double thetaValue(double a, double b) noexcept {
    if (isMissing(a) || isMissing(b) || (a == 0.0 && b == 0.0)) {
        return kMissing;
    }
    return std::atan2(b, a) / (std::numbers::pi / 2.0);
}

double radiusValue(double a, double b) noexcept {
    return std::sqrt(a * a + b * b);
}

std::vector<double> RatioCalculator::betas(std::span<const double> a,
                                           std::span<const double> b) const {
    return mapRows(manifest_.cpgIndices(), a, b, betaValue);
}

std::vector<double> RatioCalculator::theta(std::span<const double> a,
                                           std::span<const double> b) const {
    return mapRows(manifest_.snpIndices(), a, b, thetaValue);
}

std::vector<double> RatioCalculator::radius(std::span<const double> a,
                                            std::span<const double> b) const {
    return mapRows(manifest_.snpIndices(), a, b, radiusValue);
}

LabeledMatrix RatioCalculator::betaMatrix(const LabeledMatrix& a, const LabeledMatrix& b) const {
    return mapMatrix(cpgIds(), a, b, [this](auto colA, auto colB) { return betas(colA, colB); });
}

LabeledMatrix RatioCalculator::thetaMatrix(const LabeledMatrix& a, const LabeledMatrix& b) const {
    return mapMatrix(snpIds(), a, b, [this](auto colA, auto colB) { return theta(colA, colB); });
}

LabeledMatrix RatioCalculator::radiusMatrix(const LabeledMatrix& a,
                                            const LabeledMatrix& b) const {
    return mapMatrix(snpIds(), a, b, [this](auto colA, auto colB) { return radius(colA, colB); });
}

std::vector<std::string> RatioCalculator::cpgIds() const {
    std::vector<std::string> ids;
    ids.reserve(manifest_.cpgIndices().size());
    for (std::size_t index : manifest_.cpgIndices()) {
        ids.push_back(manifest_.probe(index).id);
    }
    return ids;
}

std::vector<std::string> RatioCalculator::snpIds() const {
    std::vector<std::string> ids;
    ids.reserve(manifest_.snpIndices().size());
    for (std::size_t index : manifest_.snpIndices()) {
        ids.push_back(manifest_.probe(index).id);
    }
    return ids;
}

}  // namespace inorm::algo
