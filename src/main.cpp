// =============================================================================
// infinium-norm - Infinium Methylation Array Normalization
// =============================================================================
// Main entry point for the inorm command-line tool.
//
// The CLI is built on CLI11:
// - Subcommand: preprocess
// - Global options: threads, verbosity, log file
// - Exit codes follow inorm::ErrorCode
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "inorm/common/error.h"
#include "inorm/common/logger.h"
#include "inorm/common/types.h"

#include "commands/preprocess_command.h"

namespace inorm::commands {
int runPreprocess(CLI::App* app);
}  // namespace inorm::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "infinium-norm: preprocessing and normalization of Illumina Infinium\n"
    "methylation bead-array intensities (background censoring, dye-bias\n"
    "correction, beta values, SNP genotype signals and QC summaries).";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::size_t threads = 0;  // 0 = TBB default
    int verbosity = 0;        // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Preprocess Command Options
// =============================================================================

struct CliPreprocessOptions {
    std::string probes;
    std::string controls;
    std::string output;
    std::vector<std::string> beads;
    int minBeads = inorm::kDefaultMinBeads;
    double detection = inorm::kDefaultDetection;
    bool returnIntensities = false;
    bool snpsR = false;
    bool subtractBackground = false;
    bool force = false;
};

CliPreprocessOptions gPreprocessOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupPreprocessCommand(CLI::App& app) {
    auto* preprocess =
        app.add_subcommand("preprocess", "Normalize bead summaries into beta values and QC tables");
    preprocess->alias("p");
    preprocess->fallthrough();

    preprocess->add_option("--probes", gPreprocessOpts.probes, "Probe manifest table (CSV/TSV)")
        ->required()
        ->check(CLI::ExistingFile);

    preprocess->add_option("--controls", gPreprocessOpts.controls,
                           "Control-bead manifest table (CSV/TSV)")
        ->required()
        ->check(CLI::ExistingFile);

    preprocess->add_option("-o,--output", gPreprocessOpts.output, "Output directory")
        ->required();

    preprocess->add_option("beads", gPreprocessOpts.beads,
                           "Bead-summary tables, one per sample (.csv, .tsv, optionally .gz)")
        ->required()
        ->check(CLI::ExistingFile);

    // Range checks are left to PreprocessConfig::validate so that bad values
    // are reported as configuration errors.
    preprocess->add_option("--min-beads", gPreprocessOpts.minBeads,
                           "Minimum bead count for an intensity to be kept")
        ->default_val(inorm::kDefaultMinBeads);

    preprocess->add_option("--detection", gPreprocessOpts.detection,
                           "Detection p-value for the background threshold, in (0, 1]")
        ->default_val(inorm::kDefaultDetection);

    preprocess->add_flag("--return-intensities", gPreprocessOpts.returnIntensities,
                         "Also write A, B and control-bead intensity matrices");

    preprocess->add_flag("--snps-r", gPreprocessOpts.snpsR,
                         "Write only the SNP radius matrix (ignored with --return-intensities)");

    preprocess->add_flag("--subtract-background", gPreprocessOpts.subtractBackground,
                         "Subtract the negative-control mean from retained intensities");

    preprocess->add_flag("-f,--force", gPreprocessOpts.force,
                         "Overwrite existing result tables");
}

[[nodiscard]] inorm::log::Level logLevelFromOptions() noexcept {
    if (gOptions.quiet) {
        return inorm::log::Level::kError;
    }
    if (gOptions.verbosity >= 2) {
        return inorm::log::Level::kTrace;
    }
    if (gOptions.verbosity >= 1) {
        return inorm::log::Level::kDebug;
    }
    return inorm::log::Level::kInfo;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-t,--threads", gOptions.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write the log to this file");

    setupPreprocessCommand(app);

    app.require_subcommand(1);

    // Usage errors map to the configuration exit code; --help and --version
    // still exit with 0.
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        return rc == 0 ? EXIT_SUCCESS : inorm::toExitCode(inorm::ErrorCode::kConfigurationError);
    }

    try {
        inorm::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = logLevelFromOptions();
        inorm::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return inorm::toExitCode(inorm::ErrorCode::kIOError);
    }

    int rc = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("preprocess")) {
            rc = inorm::commands::runPreprocess(app.get_subcommand("preprocess"));
        }
    } catch (const inorm::InormException& ex) {
        INORM_LOG_ERROR("Error: {}", ex.what());
        rc = ex.exitCode();
    } catch (const std::exception& ex) {
        INORM_LOG_ERROR("Unexpected error: {}", ex.what());
        rc = inorm::toExitCode(inorm::ErrorCode::kIOError);
    }

    inorm::log::shutdown();
    return rc;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace inorm::commands {

int runPreprocess([[maybe_unused]] CLI::App* app) {
    PreprocessOptions opts;
    opts.probesPath = gPreprocessOpts.probes;
    opts.controlsPath = gPreprocessOpts.controls;
    opts.outputDir = gPreprocessOpts.output;
    opts.beadPaths.assign(gPreprocessOpts.beads.begin(), gPreprocessOpts.beads.end());
    opts.force = gPreprocessOpts.force;

    opts.config.minBeads = gPreprocessOpts.minBeads;
    opts.config.detection = gPreprocessOpts.detection;
    opts.config.returnIntensities = gPreprocessOpts.returnIntensities;
    opts.config.returnSnpsR = gPreprocessOpts.snpsR;
    opts.config.subtractBackground = gPreprocessOpts.subtractBackground;
    opts.config.numThreads = gOptions.threads;

    if (opts.config.returnIntensities && opts.config.returnSnpsR) {
        INORM_LOG_WARNING("--snps-r has no effect together with --return-intensities");
    }

    PreprocessCommand command(std::move(opts));
    return command.execute();
}

}  // namespace inorm::commands
