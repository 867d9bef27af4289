// =============================================================================
// infinium-norm - Result Writer Implementation
// =============================================================================

#include "inorm/io/table_writer.h"

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>

#include "inorm/common/error.h"
#include "inorm/common/logger.h"

namespace inorm::io {

void writeMatrix(std::ostream& out, const LabeledMatrix& matrix, std::string_view keyName) {
    fmt::memory_buffer line;

    auto append = [&](std::string_view text) {
        line.append(text.data(), text.data() + text.size());
    };

    auto flush = [&] {
        line.push_back('\n');
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
        line.clear();
    };

    append(keyName);
    for (const auto& col : matrix.colIds()) {
        line.push_back('\t');
        append(col);
    }
    flush();

    for (std::size_t row = 0; row < matrix.rows(); ++row) {
        append(matrix.rowIds()[row]);
        for (std::size_t col = 0; col < matrix.cols(); ++col) {
            line.push_back('\t');
            const double value = matrix.at(row, col);
            if (isMissing(value)) {
                append(kMissingText);
            } else {
                fmt::format_to(std::back_inserter(line), "{}", value);
            }
        }
        flush();
    }
}

void writeMatrixFile(const std::filesystem::path& path, const LabeledMatrix& matrix,
                     std::string_view keyName) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IOError("Failed to open output file", ErrorContext{path.string()});
    }
    writeMatrix(out, matrix, keyName);
    out.flush();
    if (!out) {
        throw IOError("Failed to write output file", ErrorContext{path.string()});
    }
    INORM_LOG_DEBUG("Wrote {} ({} x {})", path.string(), matrix.rows(), matrix.cols());
}

std::vector<std::filesystem::path> writeResult(const std::filesystem::path& directory,
                                               const pipeline::PreprocessResult& result) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw IOError(fmt::format("Failed to create output directory {}", directory.string()),
                      ec);
    }

    struct Output {
        const std::optional<LabeledMatrix>* matrix;
        std::string_view fileName;
        std::string_view keyName;
    };
    const Output outputs[] = {
        {&result.summary, "samples.tsv", "sample_id"},
        {&result.betas, "betas.tsv", "probe_id"},
        {&result.snpTheta, "snps_theta.tsv", "probe_id"},
        {&result.snpR, "snps_r.tsv", "probe_id"},
        {&result.intensitiesA, "intensities_a.tsv", "probe_id"},
        {&result.intensitiesB, "intensities_b.tsv", "probe_id"},
        {&result.controlGrn, "controls_grn.tsv", "address"},
        {&result.controlRed, "controls_red.tsv", "address"},
    };

    std::vector<std::filesystem::path> written;
    for (const auto& output : outputs) {
        if (!output.matrix->has_value()) {
            continue;
        }
        auto path = directory / output.fileName;
        writeMatrixFile(path, **output.matrix, output.keyName);
        written.push_back(std::move(path));
    }
    return written;
}

}  // namespace inorm::io
