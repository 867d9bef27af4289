// =============================================================================
// infinium-norm - Parsed Table
// =============================================================================
// A header plus string rows, as produced by the delimited-text reader or by
// any other loader. Manifests and bead summaries are built from Tables.
// =============================================================================

#ifndef INORM_MODEL_TABLE_H
#define INORM_MODEL_TABLE_H

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inorm {

struct Table {
    /// @brief Column names.
    std::vector<std::string> header;

    /// @brief Data rows; each row has header.size() cells.
    std::vector<std::vector<std::string>> rows;

    /// @brief Optional source name used in error messages.
    std::string source;

    [[nodiscard]] std::size_t size() const noexcept { return rows.size(); }

    /// @brief Index of the first column whose name equals one of names.
    [[nodiscard]] std::optional<std::size_t> findColumn(
        std::initializer_list<std::string_view> names) const;

    /// @brief Like findColumn, but a missing column is a SchemaError.
    [[nodiscard]] std::size_t requireColumn(std::initializer_list<std::string_view> names) const;

    /// @brief Locate the row-key column.
    /// @note Accepts one of names, or an unnamed first column ("" or
    ///       "Unnamed: 0") as written by R and pandas row names.
    [[nodiscard]] std::size_t requireKeyColumn(std::initializer_list<std::string_view> names) const;
};

}  // namespace inorm

#endif  // INORM_MODEL_TABLE_H
