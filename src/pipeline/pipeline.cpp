// =============================================================================
// infinium-norm - Preprocessing Pipeline Implementation
// =============================================================================

#include "inorm/pipeline/pipeline.h"

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <xxhash.h>

#include <chrono>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "inorm/algo/censor.h"
#include "inorm/algo/intensity_extractor.h"
#include "inorm/algo/ratio_calculator.h"
#include "inorm/common/logger.h"
#include "inorm/common/numeric.h"

namespace inorm::pipeline {

namespace {

/// @brief Throw ConfigurationError unless the configuration validates.
[[nodiscard]] PreprocessConfig checked(PreprocessConfig config) {
    if (auto result = config.validate(); !result) {
        throw ConfigurationError(result.error().message());
    }
    return config;
}

void hashMatrix(XXH64_state_t* state, std::uint8_t tag, const LabeledMatrix& matrix) {
    const std::uint64_t dims[2] = {matrix.rows(), matrix.cols()};
    XXH64_update(state, &tag, sizeof(tag));
    XXH64_update(state, dims, sizeof(dims));
    for (const auto* ids : {&matrix.rowIds(), &matrix.colIds()}) {
        for (const auto& id : *ids) {
            XXH64_update(state, id.data(), id.size());
            const char sep = '\0';
            XXH64_update(state, &sep, 1);
        }
    }
    for (double value : matrix.data()) {
        // All NaN payloads hash as the canonical missing value.
        const double canonical = isMissing(value) ? kMissing : value;
        XXH64_update(state, &canonical, sizeof(canonical));
    }
}

/// @brief First sample id that occurs more than once, if any.
[[nodiscard]] std::optional<std::string> duplicateSampleId(std::span<const BeadSummary> samples) {
    std::unordered_set<std::string_view> seen;
    for (const auto& sample : samples) {
        if (!seen.insert(sample.sampleId()).second) {
            return sample.sampleId();
        }
    }
    return std::nullopt;
}

}  // namespace

// =============================================================================
// PreprocessConfig
// =============================================================================

VoidResult PreprocessConfig::validate() const {
    if (minBeads <= 0) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             fmt::format("min_beads must be a positive integer, got {}", minBeads));
    }
    if (!(detection > 0.0 && detection <= 1.0)) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             fmt::format("detection must be in (0, 1], got {}", detection));
    }
    return makeVoidSuccess();
}

// =============================================================================
// PreprocessResult
// =============================================================================

std::uint64_t PreprocessResult::digest() const {
    XXH64_state_t* state = XXH64_createState();
    XXH64_reset(state, 0);

    const std::optional<LabeledMatrix>* matrices[] = {&summary,      &betas,        &snpTheta,
                                                      &snpR,         &intensitiesA, &intensitiesB,
                                                      &controlGrn,   &controlRed};
    std::uint8_t tag = 0;
    for (const auto* matrix : matrices) {
        if (matrix->has_value()) {
            hashMatrix(state, tag, **matrix);
        }
        ++tag;
    }

    const std::uint64_t hash = XXH64_digest(state);
    XXH64_freeState(state);
    return hash;
}

// =============================================================================
// PreprocessPipelineImpl
// =============================================================================

class PreprocessPipelineImpl {
public:
    PreprocessPipelineImpl(const Manifest& manifest, PreprocessConfig config)
        : config_(checked(std::move(config))),
          manifest_(manifest),
          extractor_(manifest, config_.minBeads),
          background_(manifest, config_.detection),
          censor_(manifest, config_.subtractBackground),
          dyeBias_(manifest),
          ratios_(manifest),
          qc_(manifest) {}

    SampleResult processSample(const BeadSummary& beads) const {
        algo::SampleIntensities intensities = extractor_.extract(beads);

        SampleResult out;
        out.sampleId = beads.sampleId();
        out.background = background_.estimate(intensities);
        censor_.apply(out.background, intensities.a, intensities.b);
        out.dyeBias = dyeBias_.estimate(intensities);
        dyeBias_.apply(out.dyeBias, intensities.a, intensities.b);

        out.betas = ratios_.betas(intensities.a, intensities.b);
        out.theta = ratios_.theta(intensities.a, intensities.b);
        out.radius = ratios_.radius(intensities.a, intensities.b);
        out.qc = qc_.compute(intensities.controlGrn, intensities.controlRed, out.betas);

        INORM_LOG_DEBUG(
            "Sample {}: threshold grn={:.2f} red={:.2f} II={:.2f}, dye bias grn={:.4f} "
            "red={:.4f} ({} pairs)",
            out.sampleId, out.background.thresholdGrn, out.background.thresholdRed,
            out.background.thresholdII, out.dyeBias.grn, out.dyeBias.red, out.dyeBias.pairsUsed);

        out.a = std::move(intensities.a);
        out.b = std::move(intensities.b);
        out.controlGrn = std::move(intensities.controlGrn);
        out.controlRed = std::move(intensities.controlRed);
        return out;
    }

    Result<PreprocessResult> run(std::span<const BeadSummary> samples) {
        const auto start = std::chrono::steady_clock::now();

        // Output columns are keyed by sample id
        if (auto duplicate = duplicateSampleId(samples)) {
            const SchemaError error(fmt::format("duplicate sample id '{}'", *duplicate),
                                    ErrorContext{}.withSample(*duplicate));
            INORM_LOG_ERROR("Preprocessing aborted: {}", error.what());
            return std::unexpected(Error{error});
        }

        const int concurrency = config_.numThreads > 0 ? static_cast<int>(config_.numThreads)
                                                       : tbb::task_arena::automatic;
        tbb::task_arena arena(concurrency);

        INORM_LOG_INFO("Preprocessing {} samples against {} probes and {} controls ({} threads)",
                       samples.size(), manifest_.probes().size(), manifest_.controls().size(),
                       arena.max_concurrency());

        std::vector<SampleResult> slots(samples.size());
        auto processed = tryExecute([&] {
            arena.execute([&] {
                tbb::parallel_for(tbb::blocked_range<std::size_t>(0, samples.size()),
                                  [&](const tbb::blocked_range<std::size_t>& range) {
                                      for (std::size_t i = range.begin(); i != range.end(); ++i) {
                                          slots[i] = processSample(samples[i]);
                                      }
                                  });
            });
        });
        if (!processed) {
            INORM_LOG_ERROR("Preprocessing aborted: {}", processed.error().describe());
            return std::unexpected(processed.error());
        }

        PreprocessResult result = assemble(slots);

        stats_ = PipelineStats{};
        stats_.samples = samples.size();
        stats_.probes = manifest_.probes().size();
        stats_.controls = manifest_.controls().size();
        stats_.threadsUsed = static_cast<std::size_t>(arena.max_concurrency());
        for (const auto& slot : slots) {
            stats_.missingBetas += slot.betas.size() - numeric::countPresent(slot.betas);
        }
        stats_.processingTimeMs = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start)
                .count());
        result.stats = stats_;

        INORM_LOG_INFO("Preprocessed {} samples in {} ms ({} missing beta-values)",
                       stats_.samples, stats_.processingTimeMs, stats_.missingBetas);
        return result;
    }

    [[nodiscard]] const PipelineStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const PreprocessConfig& config() const noexcept { return config_; }

private:
    /// @brief Lay the per-sample slots out as output matrices.
    PreprocessResult assemble(std::span<const SampleResult> slots) const {
        std::vector<std::string> sampleIds;
        sampleIds.reserve(slots.size());
        for (const auto& slot : slots) {
            sampleIds.push_back(slot.sampleId);
        }

        auto fill = [&](std::vector<std::string> rowIds, auto member) {
            LabeledMatrix matrix(std::move(rowIds), sampleIds);
            for (std::size_t col = 0; col < slots.size(); ++col) {
                matrix.setColumn(col, slots[col].*member);
            }
            return matrix;
        };

        PreprocessResult result;
        const bool snpsROnly = config_.returnSnpsR && !config_.returnIntensities;

        if (snpsROnly) {
            result.snpR = fill(ratios_.snpIds(), &SampleResult::radius);
            return result;
        }

        LabeledMatrix summary(sampleIds, algo::QcPlan::metricNames());
        for (std::size_t row = 0; row < slots.size(); ++row) {
            for (std::size_t m = 0; m < algo::kQcMetricCount; ++m) {
                summary.at(row, m) = slots[row].qc[m];
            }
        }
        result.summary = std::move(summary);
        result.betas = fill(ratios_.cpgIds(), &SampleResult::betas);
        result.snpTheta = fill(ratios_.snpIds(), &SampleResult::theta);

        if (config_.returnIntensities) {
            result.intensitiesA = fill(algo::probeIds(manifest_), &SampleResult::a);
            result.intensitiesB = fill(algo::probeIds(manifest_), &SampleResult::b);
            result.controlGrn = fill(algo::controlIds(manifest_), &SampleResult::controlGrn);
            result.controlRed = fill(algo::controlIds(manifest_), &SampleResult::controlRed);
        }
        return result;
    }

    PreprocessConfig config_;
    const Manifest& manifest_;
    algo::IntensityExtractor extractor_;
    algo::BackgroundModel background_;
    algo::Censor censor_;
    algo::DyeBiasCorrector dyeBias_;
    algo::RatioCalculator ratios_;
    algo::QcPlan qc_;
    PipelineStats stats_;
};

// =============================================================================
// PreprocessPipeline
// =============================================================================

PreprocessPipeline::PreprocessPipeline(const Manifest& manifest, PreprocessConfig config)
    : impl_(std::make_unique<PreprocessPipelineImpl>(manifest, std::move(config))) {}

PreprocessPipeline::~PreprocessPipeline() = default;

PreprocessPipeline::PreprocessPipeline(PreprocessPipeline&&) noexcept = default;

PreprocessPipeline& PreprocessPipeline::operator=(PreprocessPipeline&&) noexcept = default;

Result<PreprocessResult> PreprocessPipeline::run(std::span<const BeadSummary> samples) {
    return impl_->run(samples);
}

SampleResult PreprocessPipeline::processSample(const BeadSummary& beads) const {
    return impl_->processSample(beads);
}

const PipelineStats& PreprocessPipeline::stats() const noexcept {
    return impl_->stats();
}

const PreprocessConfig& PreprocessPipeline::config() const noexcept {
    return impl_->config();
}

Result<PreprocessResult> preprocess(const Manifest& manifest,
                                    std::span<const BeadSummary> samples,
                                    const PreprocessConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    auto pipeline = tryExecute([&] { return PreprocessPipeline(manifest, config); });
    if (!pipeline) {
        return std::unexpected(pipeline.error());
    }
    return pipeline->run(samples);
}

}  // namespace inorm::pipeline
