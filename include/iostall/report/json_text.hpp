#pragma once

#include <string>
#include <string_view>

namespace iostall::report {

// Appends `text` as a quoted JSON string literal. Control characters without
// a short escape are written as \u00XX.
void append_json_string(std::string& out, std::string_view text);

}  // namespace iostall::report
