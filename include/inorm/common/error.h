// =============================================================================
// infinium-norm - Error Handling Framework
// =============================================================================
// Error handling for the infinium-norm library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - InormException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (sample, probe, bead address, table row)
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage or configuration error (min_beads, detection, CLI arguments)
// - 2: I/O error (file not found, read/write failure)
// - 3: Schema error (missing columns or identifiers in an input table)
// - 4: Missing bead address in a sample's bead summary
// - 5: Degenerate input (empty control subgroup)
// =============================================================================

#ifndef INORM_COMMON_ERROR_H
#define INORM_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace inorm {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Invalid configuration or command-line usage.
    kConfigurationError = 1,

    /// @brief File not found, read/write failure, permission denied.
    kIOError = 2,

    /// @brief Input table lacks a required column or identifier.
    kSchemaError = 3,

    /// @brief A manifest address has no record in a sample's bead summary.
    kMissingAddress = 4,

    /// @brief A required control-bead subgroup is empty.
    kDegenerateInput = 5
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kConfigurationError:
            return "configuration error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kSchemaError:
            return "schema error";
        case ErrorCode::kMissingAddress:
            return "missing address";
        case ErrorCode::kDegenerateInput:
            return "degenerate input";
    }
    return "unknown error";
}

[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Provides detailed information about where and why an error occurred.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Sample the error occurred in (if applicable).
    std::string sampleId;

    /// @brief Probe or control-bead identifier (if applicable).
    std::string featureId;

    /// @brief Bead address (if applicable).
    std::optional<std::uint64_t> address;

    /// @brief 1-based data row in an input table (if applicable).
    std::optional<std::uint64_t> row;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    ErrorContext& withSample(std::string id) {
        sampleId = std::move(id);
        return *this;
    }

    ErrorContext& withFeature(std::string id) {
        featureId = std::move(id);
        return *this;
    }

    ErrorContext& withAddress(std::uint64_t value) {
        address = value;
        return *this;
    }

    ErrorContext& withRow(std::uint64_t value) {
        row = value;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all infinium-norm errors.
/// @note Provides error code, message, and optional context.
class InormException : public std::exception {
public:
    InormException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    InormException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~InormException() override = default;

    InormException(const InormException&) = default;
    InormException(InormException&&) noexcept = default;
    InormException& operator=(const InormException&) = default;
    InormException& operator=(InormException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Invalid configuration or usage (exit code 1).
/// @note Thrown before any computation for min_beads <= 0 or detection
///       outside (0, 1], and for invalid command-line arguments.
class ConfigurationError : public InormException {
public:
    explicit ConfigurationError(std::string message)
        : InormException(ErrorCode::kConfigurationError, std::move(message)) {}

    ConfigurationError(std::string message, ErrorContext context)
        : InormException(ErrorCode::kConfigurationError, std::move(message),
                         std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
class IOError : public InormException {
public:
    explicit IOError(std::string message)
        : InormException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : InormException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : InormException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Input table lacks a required column or identifier (exit code 3).
/// @note Thrown by manifest construction and by the table adapters for
///       bead summaries.
class SchemaError : public InormException {
public:
    explicit SchemaError(std::string message)
        : InormException(ErrorCode::kSchemaError, std::move(message)) {}

    SchemaError(std::string message, ErrorContext context)
        : InormException(ErrorCode::kSchemaError, std::move(message), std::move(context)) {}
};

/// @brief A manifest address has no bead-summary record (exit code 4).
class MissingAddressError : public InormException {
public:
    explicit MissingAddressError(std::string message)
        : InormException(ErrorCode::kMissingAddress, std::move(message)) {}

    MissingAddressError(std::string message, ErrorContext context)
        : InormException(ErrorCode::kMissingAddress, std::move(message), std::move(context)) {}

    /// @brief Construct for a specific sample and address.
    MissingAddressError(std::uint64_t address, std::string sampleId, std::string featureId)
        : InormException(ErrorCode::kMissingAddress,
                         formatMissingAddress(address),
                         ErrorContext{}
                             .withSample(std::move(sampleId))
                             .withFeature(std::move(featureId))
                             .withAddress(address)),
          address_(address) {}

    [[nodiscard]] std::optional<std::uint64_t> address() const noexcept { return address_; }

private:
    static std::string formatMissingAddress(std::uint64_t address);

    std::optional<std::uint64_t> address_;
};

/// @brief A required control-bead subgroup is empty (exit code 5).
/// @note Background and dye-bias estimates are undefined without their
///       control beads; producing values anyway would be invalid.
class DegenerateInputError : public InormException {
public:
    explicit DegenerateInputError(std::string message)
        : InormException(ErrorCode::kDegenerateInput, std::move(message)) {}

    DegenerateInputError(std::string message, ErrorContext context)
        : InormException(ErrorCode::kDegenerateInput, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Construct from an InormException, keeping its formatted text.
    explicit Error(const InormException& ex) : code_(ex.code()), message_(ex.message()) {
        if (ex.hasContext()) {
            context_ = ex.context();
        }
    }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Message followed by the formatted context, if any.
    [[nodiscard]] std::string describe() const;

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Return the value of a Result or throw the matching exception.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
/// @note Standard library exceptions other than InormException are reported
///       as I/O errors; they only arise from the collaborators.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const InormException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace inorm

#endif  // INORM_COMMON_ERROR_H
