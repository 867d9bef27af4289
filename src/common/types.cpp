// =============================================================================
// infinium-norm - Common Type Definitions Implementation
// =============================================================================

#include "inorm/common/types.h"

#include <array>
#include <utility>

namespace inorm {

namespace {

constexpr std::array<std::pair<ControlType, std::string_view>, 15> kControlTypeNames{{
    {ControlType::kStaining, "STAINING"},
    {ControlType::kExtension, "EXTENSION"},
    {ControlType::kHybridization, "HYBRIDIZATION"},
    {ControlType::kTargetRemoval, "TARGET REMOVAL"},
    {ControlType::kBisulfiteConversionI, "BISULFITE CONVERSION I"},
    {ControlType::kBisulfiteConversionII, "BISULFITE CONVERSION II"},
    {ControlType::kSpecificityI, "SPECIFICITY I"},
    {ControlType::kSpecificityII, "SPECIFICITY II"},
    {ControlType::kNonPolymorphic, "NON-POLYMORPHIC"},
    {ControlType::kNegative, "NEGATIVE"},
    {ControlType::kRestoration, "RESTORATION"},
    {ControlType::kNormA, "NORM_A"},
    {ControlType::kNormC, "NORM_C"},
    {ControlType::kNormG, "NORM_G"},
    {ControlType::kNormT, "NORM_T"},
}};

}  // namespace

std::optional<ProbeType> probeTypeFromString(std::string_view text) noexcept {
    if (text == "I-Grn") {
        return ProbeType::kInfIGrn;
    }
    if (text == "I-Red") {
        return ProbeType::kInfIRed;
    }
    if (text == "II") {
        return ProbeType::kInfII;
    }
    return std::nullopt;
}

std::string_view controlTypeToString(ControlType type) noexcept {
    for (const auto& [value, name] : kControlTypeNames) {
        if (value == type) {
            return name;
        }
    }
    return "OTHER";
}

ControlType controlTypeFromString(std::string_view text) noexcept {
    for (const auto& [value, name] : kControlTypeNames) {
        if (name == text) {
            return value;
        }
    }
    return ControlType::kOther;
}

}  // namespace inorm
