// =============================================================================
// infinium-norm - Preprocess Command Implementation
// =============================================================================

#include "preprocess_command.h"

#include <system_error>
#include <utility>

#include "inorm/common/error.h"
#include "inorm/common/logger.h"
#include "inorm/io/table_reader.h"
#include "inorm/io/table_writer.h"

namespace inorm::commands {

namespace {

constexpr const char* kResultFiles[] = {"samples.tsv",       "betas.tsv",
                                        "snps_theta.tsv",    "snps_r.tsv",
                                        "intensities_a.tsv", "intensities_b.tsv",
                                        "controls_grn.tsv",  "controls_red.tsv"};

}  // namespace

PreprocessCommand::PreprocessCommand(PreprocessOptions options) : options_(std::move(options)) {}

PreprocessCommand::~PreprocessCommand() = default;

PreprocessCommand::PreprocessCommand(PreprocessCommand&&) noexcept = default;
PreprocessCommand& PreprocessCommand::operator=(PreprocessCommand&&) noexcept = default;

int PreprocessCommand::execute() {
    try {
        // Configuration errors must surface before any file is read
        unwrapOrThrow(options_.config.validate());
        if (options_.beadPaths.empty()) {
            throw ConfigurationError("no bead-summary files given");
        }
        checkOutputDir();

        const Manifest manifest = io::loadManifest(options_.probesPath, options_.controlsPath);
        const std::vector<BeadSummary> samples = io::loadBeadSummaries(options_.beadPaths);

        pipeline::PreprocessPipeline pipeline(manifest, options_.config);
        pipeline::PreprocessResult result = unwrapOrThrow(pipeline.run(samples));

        const auto written = io::writeResult(options_.outputDir, result);
        printSummary(result, written);
        return toExitCode(ErrorCode::kSuccess);

    } catch (const InormException& e) {
        INORM_LOG_ERROR("Preprocess failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        INORM_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void PreprocessCommand::checkOutputDir() const {
    if (options_.force) {
        return;
    }
    for (const char* name : kResultFiles) {
        const auto path = options_.outputDir / name;
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            throw IOError("Output file already exists (use --force to overwrite)",
                          ErrorContext{path.string()});
        }
    }
}

void PreprocessCommand::printSummary(const pipeline::PreprocessResult& result,
                                     const std::vector<std::filesystem::path>& written) const {
    const auto& stats = result.stats;
    INORM_LOG_INFO("{} samples, {} probes, {} controls in {} ms", stats.samples, stats.probes,
                   stats.controls, stats.processingTimeMs);
    for (const auto& path : written) {
        INORM_LOG_INFO("Wrote {}", path.string());
    }
    INORM_LOG_DEBUG("Result digest: {:016x}", result.digest());
}

}  // namespace inorm::commands
