// =============================================================================
// infinium-norm - Common Type Definitions
// =============================================================================
// Core type definitions for the infinium-norm library.
//
// This module defines:
// - BeadAddress: Type alias for array bead addresses
// - Missing-value representation (quiet NaN) and predicates
// - ProbeType: Infinium probe chemistry (I-Grn, I-Red, II)
// - Channel: Scanner colour channel (green, red)
// - Role: Intensity role (A = unmethylated, B = methylated)
// - ControlType: Control-bead category from the control manifest
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef INORM_COMMON_TYPES_H
#define INORM_COMMON_TYPES_H

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace inorm {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Bead address (Illumina "AddressA_ID" / "AddressB_ID").
using BeadAddress = std::uint64_t;

/// @brief Bead count as reported per address and channel.
using BeadCount = std::uint32_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Representation of a missing intensity, ratio or metric.
/// @note NaN propagates through arithmetic and fails every comparison, so a
///       missing input can never turn into a spurious numeric output.
inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

/// @brief Default minimum bead count for an intensity to be kept.
inline constexpr int kDefaultMinBeads = 3;

/// @brief Default detection p-value.
inline constexpr double kDefaultDetection = 0.05;

/// @brief Substring marking a SNP probe identifier.
inline constexpr std::string_view kSnpIdMarker = "rs";

/// @brief Check whether a value represents missing data.
[[nodiscard]] inline bool isMissing(double value) noexcept {
    return std::isnan(value);
}

/// @brief Check whether an identifier names a SNP probe.
[[nodiscard]] constexpr bool isSnpId(std::string_view id) noexcept {
    return id.find(kSnpIdMarker) != std::string_view::npos;
}

// =============================================================================
// Probe Type Enumeration
// =============================================================================

/// @brief Infinium probe chemistry.
enum class ProbeType : std::uint8_t {
    /// @brief Infinium I, both alleles read in the green channel.
    kInfIGrn = 0,

    /// @brief Infinium I, both alleles read in the red channel.
    kInfIRed = 1,

    /// @brief Infinium II, one address read in both channels.
    kInfII = 2
};

[[nodiscard]] constexpr std::string_view probeTypeToString(ProbeType type) noexcept {
    switch (type) {
        case ProbeType::kInfIGrn:
            return "I-Grn";
        case ProbeType::kInfIRed:
            return "I-Red";
        case ProbeType::kInfII:
            return "II";
    }
    return "unknown";
}

/// @brief Parse a manifest type string ("I-Grn", "I-Red", "II").
[[nodiscard]] std::optional<ProbeType> probeTypeFromString(std::string_view text) noexcept;

// =============================================================================
// Channel / Role Enumerations
// =============================================================================

/// @brief Scanner colour channel.
enum class Channel : std::uint8_t {
    kGreen = 0,
    kRed = 1
};

[[nodiscard]] constexpr std::string_view channelToString(Channel channel) noexcept {
    return channel == Channel::kGreen ? "grn" : "red";
}

/// @brief Intensity role of a probe read-out.
enum class Role : std::uint8_t {
    /// @brief Unmethylated signal.
    kA = 0,

    /// @brief Methylated signal.
    kB = 1
};

// =============================================================================
// Control Type Enumeration
// =============================================================================

/// @brief Control-bead categories of the Illumina control manifest.
enum class ControlType : std::uint8_t {
    kStaining = 0,
    kExtension,
    kHybridization,
    kTargetRemoval,
    kBisulfiteConversionI,
    kBisulfiteConversionII,
    kSpecificityI,
    kSpecificityII,
    kNonPolymorphic,
    kNegative,
    kRestoration,
    kNormA,
    kNormC,
    kNormG,
    kNormT,
    /// @brief Any type string not listed above; kept verbatim by the manifest.
    kOther
};

/// @brief Manifest spelling of a control type ("NEGATIVE", "NORM_C", ...).
[[nodiscard]] std::string_view controlTypeToString(ControlType type) noexcept;

/// @brief Parse a manifest control type; unknown strings map to kOther.
[[nodiscard]] ControlType controlTypeFromString(std::string_view text) noexcept;

}  // namespace inorm

#endif  // INORM_COMMON_TYPES_H
