// =============================================================================
// infinium-norm - Parsed Table Implementation
// =============================================================================

#include "inorm/model/table.h"

#include <fmt/format.h>

#include "inorm/common/error.h"

namespace inorm {

namespace {

[[nodiscard]] std::string joinNames(std::initializer_list<std::string_view> names) {
    std::string out;
    for (std::string_view name : names) {
        if (!out.empty()) {
            out += " / ";
        }
        out += name;
    }
    return out;
}

}  // namespace

std::optional<std::size_t> Table::findColumn(std::initializer_list<std::string_view> names) const {
    for (std::string_view name : names) {
        for (std::size_t i = 0; i < header.size(); ++i) {
            if (header[i] == name) {
                return i;
            }
        }
    }
    return std::nullopt;
}

std::size_t Table::requireColumn(std::initializer_list<std::string_view> names) const {
    if (auto index = findColumn(names)) {
        return *index;
    }
    throw SchemaError(fmt::format("required column '{}' is absent", joinNames(names)),
                      ErrorContext{source});
}

std::size_t Table::requireKeyColumn(std::initializer_list<std::string_view> names) const {
    if (auto index = findColumn(names)) {
        return *index;
    }
    if (!header.empty() && (header.front().empty() || header.front().starts_with("Unnamed"))) {
        return 0;
    }
    throw SchemaError(fmt::format("required key column '{}' is absent", joinNames(names)),
                      ErrorContext{source});
}

}  // namespace inorm
