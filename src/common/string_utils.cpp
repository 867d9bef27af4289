// =============================================================================
// infinium-norm - String Utilities Implementation
// =============================================================================

#include "inorm/common/string_utils.h"

#include <cctype>
#include <charconv>

#include "inorm/common/types.h"

namespace inorm::str {

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool isMissingCell(std::string_view cell) noexcept {
    cell = trim(cell);
    return cell.empty() || cell == "NA" || cell == "NaN" || cell == "nan" || cell == "null" ||
           cell == "NULL";
}

std::optional<std::uint64_t> parseUnsigned(std::string_view cell) noexcept {
    cell = trim(cell);
    if (cell.ends_with(".0")) {
        cell.remove_suffix(2);
    }
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
    if (ec != std::errc{} || ptr != cell.data() + cell.size() || cell.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parseDouble(std::string_view cell) noexcept {
    if (isMissingCell(cell)) {
        return kMissing;
    }
    cell = trim(cell);
    if (cell.front() == '+') {
        cell.remove_prefix(1);
    }
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
    if (ec != std::errc{} || ptr != cell.data() + cell.size()) {
        return std::nullopt;
    }
    return value;
}

std::string translate(std::string_view text, std::string_view from, std::string_view to) {
    std::string out(text);
    for (char& c : out) {
        const auto pos = from.find(c);
        if (pos != std::string_view::npos && pos < to.size()) {
            c = to[pos];
        }
    }
    return out;
}

std::string replaceAll(std::string_view text, std::string_view from, std::string_view to) {
    std::string out;
    if (from.empty()) {
        return std::string(text);
    }
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(from, start);
        if (pos == std::string_view::npos) {
            out.append(text.substr(start));
            break;
        }
        out.append(text.substr(start, pos - start));
        out.append(to);
        start = pos + from.size();
    }
    return out;
}

std::string_view stripChrPrefix(std::string_view chr) noexcept {
    chr = trim(chr);
    if (chr.size() > 3 && (chr.starts_with("chr") || chr.starts_with("Chr"))) {
        chr.remove_prefix(3);
    }
    return chr;
}

}  // namespace inorm::str
