// =============================================================================
// infinium-norm - Preprocessing Pipeline
// =============================================================================
// Chains the normalization stages over a batch of samples:
//
//   bead summary -> intensity extraction -> background / thresholds
//                -> censoring -> dye-bias correction -> ratios + QC
//
// Samples are independent. Each one is processed into its own
// SampleResult slot by a tbb::parallel_for inside a task_arena sized by the
// configured thread count; the slots are then assembled, in input order,
// into the output matrices. Output is therefore identical for any thread
// count.
//
// Any error aborts the whole batch.
// =============================================================================

#ifndef INORM_PIPELINE_PIPELINE_H
#define INORM_PIPELINE_PIPELINE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "inorm/algo/background_model.h"
#include "inorm/algo/dye_bias.h"
#include "inorm/algo/qc_summary.h"
#include "inorm/common/error.h"
#include "inorm/common/types.h"
#include "inorm/model/bead_summary.h"
#include "inorm/model/manifest.h"
#include "inorm/model/matrix.h"

namespace inorm::pipeline {

// =============================================================================
// Forward Declarations
// =============================================================================

class PreprocessPipelineImpl;

// =============================================================================
// Configuration
// =============================================================================

struct PreprocessConfig {
    /// @brief Minimum bead count for a probe intensity to be kept.
    int minBeads = kDefaultMinBeads;

    /// @brief Detection p-value, in (0, 1].
    double detection = kDefaultDetection;

    /// @brief Also return A, B and the control-bead intensity matrices.
    bool returnIntensities = false;

    /// @brief Return only the SNP radius matrix (ignored when
    ///        returnIntensities is set).
    bool returnSnpsR = false;

    /// @brief Subtract the channel negative-control mean from retained
    ///        intensities.
    bool subtractBackground = false;

    /// @brief Worker threads (0 = TBB default).
    std::size_t numThreads = 0;

    /// @brief Validate configuration.
    /// @return ConfigurationError for min_beads <= 0 or detection outside (0, 1].
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Results
// =============================================================================

/// @brief Everything computed for one sample.
struct SampleResult {
    std::string sampleId;

    /// @brief Censored, dye-corrected A / B intensities, one per probe.
    std::vector<double> a;
    std::vector<double> b;

    /// @brief Raw control-bead intensities, one per control.
    std::vector<double> controlGrn;
    std::vector<double> controlRed;

    /// @brief One per CpG probe.
    std::vector<double> betas;

    /// @brief One per SNP probe.
    std::vector<double> theta;
    std::vector<double> radius;

    std::array<double, algo::kQcMetricCount> qc{};

    algo::Background background;
    algo::DyeBiasCorrection dyeBias;
};

/// @brief Statistics of one pipeline run.
struct PipelineStats {
    std::size_t samples = 0;
    std::size_t probes = 0;
    std::size_t controls = 0;

    /// @brief Missing beta-values over all samples.
    std::size_t missingBetas = 0;

    std::uint64_t processingTimeMs = 0;
    std::size_t threadsUsed = 0;
};

/// @brief Pipeline output. Which matrices are present depends on the
///        returnIntensities / returnSnpsR configuration.
struct PreprocessResult {
    /// @brief Sample x metric QC table.
    std::optional<LabeledMatrix> summary;

    /// @brief CpG probe x sample beta-values.
    std::optional<LabeledMatrix> betas;

    /// @brief SNP probe x sample theta.
    std::optional<LabeledMatrix> snpTheta;

    /// @brief SNP probe x sample radius.
    std::optional<LabeledMatrix> snpR;

    std::optional<LabeledMatrix> intensitiesA;
    std::optional<LabeledMatrix> intensitiesB;
    std::optional<LabeledMatrix> controlGrn;
    std::optional<LabeledMatrix> controlRed;

    PipelineStats stats;

    /// @brief XXH64 over the labels and values of every present matrix.
    [[nodiscard]] std::uint64_t digest() const;
};

// =============================================================================
// PreprocessPipeline
// =============================================================================

/// @brief Normalizes batches of samples against one manifest.
///
/// Usage:
/// @code
/// PreprocessPipeline pipeline(manifest, config);
/// auto result = pipeline.run(samples);
/// if (!result) {
///     return result.error().exitCode();
/// }
/// @endcode
class PreprocessPipeline {
public:
    /// @param manifest Reference tables; must outlive the pipeline.
    /// @throws ConfigurationError if config does not validate.
    /// @throws DegenerateInputError if the manifest has no normalization
    ///         control pair.
    PreprocessPipeline(const Manifest& manifest, PreprocessConfig config);

    ~PreprocessPipeline();

    PreprocessPipeline(const PreprocessPipeline&) = delete;
    PreprocessPipeline& operator=(const PreprocessPipeline&) = delete;
    PreprocessPipeline(PreprocessPipeline&&) noexcept;
    PreprocessPipeline& operator=(PreprocessPipeline&&) noexcept;

    /// @brief Normalize a batch; columns follow the order of samples.
    /// @note Sample ids must be unique; a repeated id is a SchemaError.
    [[nodiscard]] Result<PreprocessResult> run(std::span<const BeadSummary> samples);

    /// @brief Process a single sample.
    /// @throws MissingAddressError, DegenerateInputError
    [[nodiscard]] SampleResult processSample(const BeadSummary& beads) const;

    [[nodiscard]] const PipelineStats& stats() const noexcept;

    [[nodiscard]] const PreprocessConfig& config() const noexcept;

private:
    std::unique_ptr<PreprocessPipelineImpl> impl_;
};

/// @brief Validate the configuration, build a pipeline and run it.
[[nodiscard]] Result<PreprocessResult> preprocess(const Manifest& manifest,
                                                  std::span<const BeadSummary> samples,
                                                  const PreprocessConfig& config);

}  // namespace inorm::pipeline

#endif  // INORM_PIPELINE_PIPELINE_H
