#pragma once

#include "util/merger_config.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace takeout {

struct OutputIdentifier {
    std::string label;
    std::string date;            // YYYY-MM-DD
    bool from_fallback = false;  // date came from the clock, not the file name

    std::string Name() const { return label + "-" + date; }
};

// Looks for `<prefix>YYYYMMDD` first, then `<prefix>YYYY-MM-DD`, anywhere in
// `file_name`. Returns the date as YYYY-MM-DD.
std::optional<std::string> ExtractTakeoutDate(std::string_view file_name, std::string_view prefix);

// Local calendar date of `now` as YYYY-MM-DD.
std::string FormatLocalDate(std::chrono::system_clock::time_point now);

// Pure given its arguments. With DateFallback::Fail an undated name is an error.
std::expected<OutputIdentifier, std::string>
DeriveOutputIdentifier(std::string_view first_file_name,
                       std::string_view label,
                       std::string_view prefix,
                       DateFallback fallback,
                       std::chrono::system_clock::time_point now);

// Labels end up in a file name: non-empty, no '/', not "." or "..".
bool IsValidOutputLabel(std::string_view label);

} // namespace takeout
