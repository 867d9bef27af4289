// =============================================================================
// infinium-norm - Preprocess Command
// =============================================================================
// Command handler for `inorm preprocess`: load the manifests and bead
// summaries, run the normalization pipeline and write the result tables.
// =============================================================================

#ifndef INORM_COMMANDS_PREPROCESS_COMMAND_H
#define INORM_COMMANDS_PREPROCESS_COMMAND_H

#include <filesystem>
#include <vector>

#include "inorm/pipeline/pipeline.h"

namespace inorm::commands {

// =============================================================================
// Preprocess Options
// =============================================================================

/// @brief Configuration options for the preprocess command.
struct PreprocessOptions {
    /// @brief Probe manifest table.
    std::filesystem::path probesPath;

    /// @brief Control-bead manifest table.
    std::filesystem::path controlsPath;

    /// @brief One bead-summary table per sample; output columns follow this order.
    std::vector<std::filesystem::path> beadPaths;

    /// @brief Directory receiving the result tables.
    std::filesystem::path outputDir;

    pipeline::PreprocessConfig config;

    /// @brief Refuse to overwrite existing result tables unless set.
    bool force = false;
};

// =============================================================================
// PreprocessCommand Class
// =============================================================================

class PreprocessCommand {
public:
    explicit PreprocessCommand(PreprocessOptions options);

    ~PreprocessCommand();

    PreprocessCommand(const PreprocessCommand&) = delete;
    PreprocessCommand& operator=(const PreprocessCommand&) = delete;
    PreprocessCommand(PreprocessCommand&&) noexcept;
    PreprocessCommand& operator=(PreprocessCommand&&) noexcept;

    /// @brief Execute the command.
    /// @return Exit code (0 = success, otherwise the ErrorCode value).
    [[nodiscard]] int execute();

    [[nodiscard]] const PreprocessOptions& options() const noexcept { return options_; }

private:
    /// @brief Fail before loading anything if the output would clobber files.
    void checkOutputDir() const;

    void printSummary(const pipeline::PreprocessResult& result,
                      const std::vector<std::filesystem::path>& written) const;

    PreprocessOptions options_;
};

}  // namespace inorm::commands

#endif  // INORM_COMMANDS_PREPROCESS_COMMAND_H
