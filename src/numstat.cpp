#include "gitadd/numstat.hpp"

#include "gitadd/string_utils.hpp"

#include <charconv>
#include <optional>

namespace gitadd {
namespace {

constexpr std::string_view kBinarySentinel = "-";
constexpr std::string_view kRenameArrow = " => ";

std::optional<std::uint64_t> parse_count(std::string_view field) {
    std::uint64_t value = 0;
    const auto* first = field.data();
    const auto* last = field.data() + field.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (field.empty() || ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::string resolve_rename_target(std::string_view field) {
    const auto open = field.find('{');
    const auto close = open == std::string_view::npos ? std::string_view::npos : field.find('}', open);
    if (close != std::string_view::npos) {
        const auto inner = field.substr(open + 1, close - open - 1);
        const auto arrow = inner.find(kRenameArrow);
        if (arrow != std::string_view::npos) {
            std::string prefix{field.substr(0, open)};
            std::string target{inner.substr(arrow + kRenameArrow.size())};
            std::string suffix{field.substr(close + 1)};
            if (target.empty() && !prefix.empty() && prefix.back() == '/' && !suffix.empty()
                && suffix.front() == '/') {
                suffix.erase(0, 1);
            }
            return prefix + target + suffix;
        }
    }

    if (const auto arrow = field.rfind(kRenameArrow); arrow != std::string_view::npos) {
        return std::string{field.substr(arrow + kRenameArrow.size())};
    }
    return std::string{field};
}

void accumulate_numstat(std::string_view report, NumstatTotals& totals) {
    if (string_utils::trim(report).empty()) {
        return;
    }

    for (auto line : string_utils::split_lines(report)) {
        const auto fields = string_utils::split(line, '\t');
        if (fields.size() < 3) {
            continue;
        }

        const auto added_field = fields[0];
        const auto deleted_field = fields[1];
        // The rightmost field is the destination when a rename spans two fields.
        auto path = string_utils::unquote_path(resolve_rename_target(fields.back()));
        if (path.empty()) {
            continue;
        }

        if (added_field == kBinarySentinel || deleted_field == kBinarySentinel) {
            totals.binary[path] = true;
        }
        if (auto added = parse_count(added_field)) {
            totals.added[path] += *added;
        }
        if (auto deleted = parse_count(deleted_field)) {
            totals.deleted[path] += *deleted;
        }
    }
}

NumstatTotals aggregate_numstat(std::string_view staged_report, std::string_view unstaged_report) {
    NumstatTotals totals;
    accumulate_numstat(staged_report, totals);
    accumulate_numstat(unstaged_report, totals);
    return totals;
}

} // namespace gitadd
