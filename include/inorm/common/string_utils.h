// =============================================================================
// infinium-norm - String Utilities
// =============================================================================
// Cell parsing and the description transforms used to pair control beads.
// =============================================================================

#ifndef INORM_COMMON_STRING_UTILS_H
#define INORM_COMMON_STRING_UTILS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace inorm::str {

/// @brief Strip leading and trailing whitespace.
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

/// @brief True for empty cells and the usual missing markers (NA, NaN, null).
[[nodiscard]] bool isMissingCell(std::string_view cell) noexcept;

/// @brief Parse a non-negative integer, accepting a trailing ".0" as written
///        by tools that store integer columns as floats.
[[nodiscard]] std::optional<std::uint64_t> parseUnsigned(std::string_view cell) noexcept;

/// @brief Parse a floating-point cell; missing markers give kMissing.
[[nodiscard]] std::optional<double> parseDouble(std::string_view cell) noexcept;

/// @brief Replace each character found in from by the character at the
///        same position in to (tr-style mapping).
[[nodiscard]] std::string translate(std::string_view text, std::string_view from,
                                    std::string_view to);

/// @brief Replace every occurrence of a substring.
[[nodiscard]] std::string replaceAll(std::string_view text, std::string_view from,
                                     std::string_view to);

/// @brief Chromosome name without a leading "chr" ("chrX" -> "X").
[[nodiscard]] std::string_view stripChrPrefix(std::string_view chr) noexcept;

}  // namespace inorm::str

#endif  // INORM_COMMON_STRING_UTILS_H
