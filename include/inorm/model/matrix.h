// =============================================================================
// infinium-norm - Labeled Matrix
// =============================================================================
// Row-id x column-id matrix of doubles, the value type threaded between the
// pipeline stages (probe x sample intensities, control x sample intensities,
// sample x metric summaries).
//
// Storage is column-major so one sample column is a contiguous span.
// Missing entries are kMissing (NaN).
// =============================================================================

#ifndef INORM_MODEL_MATRIX_H
#define INORM_MODEL_MATRIX_H

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "inorm/common/types.h"

namespace inorm {

class LabeledMatrix {
public:
    LabeledMatrix() = default;

    /// @brief Construct with the given labels, every entry set to fill.
    LabeledMatrix(std::vector<std::string> rowIds, std::vector<std::string> colIds,
                  double fill = kMissing);

    [[nodiscard]] std::size_t rows() const noexcept { return rowIds_.size(); }
    [[nodiscard]] std::size_t cols() const noexcept { return colIds_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    [[nodiscard]] const std::vector<std::string>& rowIds() const noexcept { return rowIds_; }
    [[nodiscard]] const std::vector<std::string>& colIds() const noexcept { return colIds_; }

    [[nodiscard]] double& at(std::size_t row, std::size_t col) noexcept {
        return data_[col * rowIds_.size() + row];
    }
    [[nodiscard]] double at(std::size_t row, std::size_t col) const noexcept {
        return data_[col * rowIds_.size() + row];
    }

    [[nodiscard]] std::span<double> column(std::size_t col) noexcept {
        return {data_.data() + col * rowIds_.size(), rowIds_.size()};
    }
    [[nodiscard]] std::span<const double> column(std::size_t col) const noexcept {
        return {data_.data() + col * rowIds_.size(), rowIds_.size()};
    }

    /// @brief Copy values into a column; values.size() must equal rows().
    void setColumn(std::size_t col, std::span<const double> values);

    [[nodiscard]] std::optional<std::size_t> rowIndex(const std::string& id) const;
    [[nodiscard]] std::optional<std::size_t> colIndex(const std::string& id) const;

    /// @brief Look up an entry by labels.
    /// @throws std::out_of_range if either label is unknown.
    [[nodiscard]] double value(const std::string& rowId, const std::string& colId) const;

    /// @brief Raw column-major storage.
    [[nodiscard]] std::span<const double> data() const noexcept { return data_; }

private:
    void buildIndex();

    std::vector<std::string> rowIds_;
    std::vector<std::string> colIds_;
    std::unordered_map<std::string, std::size_t> rowIndex_;
    std::unordered_map<std::string, std::size_t> colIndex_;
    std::vector<double> data_;
};

}  // namespace inorm

#endif  // INORM_MODEL_MATRIX_H
