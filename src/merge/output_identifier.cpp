#include "merge/output_identifier.hpp"

#include <ctime>
#include <regex>

namespace takeout {

namespace {

std::string EscapeRegex(std::string_view s) {
    static constexpr std::string_view kSpecial = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s) {
        if (kSpecial.find(c) != std::string_view::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace

std::optional<std::string> ExtractTakeoutDate(std::string_view file_name, std::string_view prefix) {
    const std::string name(file_name);
    const std::string escaped = EscapeRegex(prefix);

    const std::regex compact(escaped + "([0-9]{4})([0-9]{2})([0-9]{2})");
    std::smatch m;
    if (std::regex_search(name, m, compact)) {
        return m[1].str() + "-" + m[2].str() + "-" + m[3].str();
    }

    const std::regex dashed(escaped + "([0-9]{4}-[0-9]{2}-[0-9]{2})");
    if (std::regex_search(name, m, dashed)) {
        return m[1].str();
    }
    return std::nullopt;
}

std::string FormatLocalDate(std::chrono::system_clock::time_point now) {
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    if (localtime_r(&t, &tm) == nullptr) {
        gmtime_r(&t, &tm);
    }
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

std::expected<OutputIdentifier, std::string>
DeriveOutputIdentifier(std::string_view first_file_name,
                       std::string_view label,
                       std::string_view prefix,
                       DateFallback fallback,
                       std::chrono::system_clock::time_point now) {
    if (!IsValidOutputLabel(label)) {
        return std::unexpected("invalid output label: '" + std::string(label) + "'");
    }

    OutputIdentifier id;
    id.label = std::string(label);

    if (auto date = ExtractTakeoutDate(first_file_name, prefix)) {
        id.date = std::move(*date);
        return id;
    }

    if (fallback == DateFallback::Fail) {
        return std::unexpected("Could not extract date from filename: " + std::string(first_file_name));
    }
    id.date = FormatLocalDate(now);
    id.from_fallback = true;
    return id;
}

bool IsValidOutputLabel(std::string_view label) {
    if (label.empty() || label == "." || label == "..") return false;
    return label.find('/') == std::string_view::npos && label.find('\0') == std::string_view::npos;
}

} // namespace takeout
