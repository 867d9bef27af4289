// =============================================================================
// infinium-norm - Result Writer
// =============================================================================
// Tab-separated export of labeled matrices and pipeline results.
//
// Each file has a header line (row-key name, then the column ids) and one
// line per row. Values are written in shortest round-trip form; missing
// values are written as "NA".
// =============================================================================

#ifndef INORM_IO_TABLE_WRITER_H
#define INORM_IO_TABLE_WRITER_H

#include <filesystem>
#include <ostream>
#include <string_view>
#include <vector>

#include "inorm/model/matrix.h"
#include "inorm/pipeline/pipeline.h"

namespace inorm::io {

/// @brief Text written for a missing value.
inline constexpr std::string_view kMissingText = "NA";

/// @brief Write a matrix as TSV.
/// @param keyName Header of the row-key column.
void writeMatrix(std::ostream& out, const LabeledMatrix& matrix, std::string_view keyName);

/// @brief Write a matrix to a TSV file.
/// @throws IOError if the file cannot be written.
void writeMatrixFile(const std::filesystem::path& path, const LabeledMatrix& matrix,
                     std::string_view keyName);

/// @brief Write every matrix present in a result into a directory.
/// @note File names: samples.tsv, betas.tsv, snps_theta.tsv, snps_r.tsv,
///       intensities_a.tsv, intensities_b.tsv, controls_grn.tsv,
///       controls_red.tsv. The directory is created if needed.
/// @return Paths written, in the order above.
/// @throws IOError on any filesystem failure.
std::vector<std::filesystem::path> writeResult(const std::filesystem::path& directory,
                                               const pipeline::PreprocessResult& result);

}  // namespace inorm::io

#endif  // INORM_IO_TABLE_WRITER_H
