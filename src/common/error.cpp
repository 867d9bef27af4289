// =============================================================================
// infinium-norm - Error Handling Framework Implementation
// =============================================================================

#include "inorm/common/error.h"

#include <fmt/format.h>

#include <sstream>

namespace inorm {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto separate = [&]() {
        if (hasContent) {
            oss << ", ";
        }
        hasContent = true;
    };

    if (!filePath.empty()) {
        separate();
        oss << "file: " << filePath;
    }

    if (!sampleId.empty()) {
        separate();
        oss << "sample: " << sampleId;
    }

    if (!featureId.empty()) {
        separate();
        oss << "id: " << featureId;
    }

    if (address.has_value()) {
        separate();
        oss << "address: " << *address;
    }

    if (row.has_value()) {
        separate();
        oss << "row: " << *row;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// InormException Implementation
// =============================================================================

void InormException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string MissingAddressError::formatMissingAddress(std::uint64_t address) {
    return fmt::format("bead address {} not found in bead summary", address);
}

// =============================================================================
// Error Implementation
// =============================================================================

std::string Error::describe() const {
    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            return fmt::format("{} ({})", message_, contextStr);
        }
    }
    return message_;
}

[[noreturn]] void Error::throwException() const {
    ErrorContext context = context_.value_or(ErrorContext{});
    switch (code_) {
        case ErrorCode::kConfigurationError:
            throw ConfigurationError(message_, std::move(context));
        case ErrorCode::kIOError:
            throw IOError(message_, std::move(context));
        case ErrorCode::kSchemaError:
            throw SchemaError(message_, std::move(context));
        case ErrorCode::kMissingAddress:
            throw MissingAddressError(message_, std::move(context));
        case ErrorCode::kDegenerateInput:
            throw DegenerateInputError(message_, std::move(context));
        case ErrorCode::kSuccess:
            throw InormException(ErrorCode::kSuccess, message_);
    }
    throw InormException(code_, message_);
}

}  // namespace inorm
