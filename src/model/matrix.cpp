// =============================================================================
// infinium-norm - Labeled Matrix Implementation
// =============================================================================

#include "inorm/model/matrix.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace inorm {

LabeledMatrix::LabeledMatrix(std::vector<std::string> rowIds, std::vector<std::string> colIds,
                             double fill)
    : rowIds_(std::move(rowIds)),
      colIds_(std::move(colIds)),
      data_(rowIds_.size() * colIds_.size(), fill) {
    buildIndex();
}

void LabeledMatrix::buildIndex() {
    rowIndex_.reserve(rowIds_.size());
    for (std::size_t i = 0; i < rowIds_.size(); ++i) {
        rowIndex_.emplace(rowIds_[i], i);
    }
    colIndex_.reserve(colIds_.size());
    for (std::size_t j = 0; j < colIds_.size(); ++j) {
        colIndex_.emplace(colIds_[j], j);
    }
}

void LabeledMatrix::setColumn(std::size_t col, std::span<const double> values) {
    if (values.size() != rows()) {
        throw std::invalid_argument("column length does not match matrix rows");
    }
    std::copy(values.begin(), values.end(), column(col).begin());
}

std::optional<std::size_t> LabeledMatrix::rowIndex(const std::string& id) const {
    auto it = rowIndex_.find(id);
    if (it == rowIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::size_t> LabeledMatrix::colIndex(const std::string& id) const {
    auto it = colIndex_.find(id);
    if (it == colIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

double LabeledMatrix::value(const std::string& rowId, const std::string& colId) const {
    auto row = rowIndex(rowId);
    auto col = colIndex(colId);
    if (!row || !col) {
        throw std::out_of_range("unknown matrix label: " + (row ? colId : rowId));
    }
    return at(*row, *col);
}

}  // namespace inorm
