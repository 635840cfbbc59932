#include "iostall/report/json_text.hpp"

namespace iostall::report {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

[[nodiscard]] const char* short_escape(unsigned char ch) noexcept
{
    switch (ch) {
    case '"':
        return "\\\"";
    case '\\':
        return "\\\\";
    case '\b':
        return "\\b";
    case '\f':
        return "\\f";
    case '\n':
        return "\\n";
    case '\r':
        return "\\r";
    case '\t':
        return "\\t";
    default:
        return nullptr;
    }
}

}  // namespace

void append_json_string(std::string& out, std::string_view text)
{
    out.reserve(out.size() + text.size() + 2U);
    out.push_back('"');
    for (const char raw : text) {
        const auto ch = static_cast<unsigned char>(raw);
        if (const char* escape = short_escape(ch); escape != nullptr) {
            out.append(escape);
        } else if (ch < 0x20U) {
            out.append("\\u00");
            out.push_back(kHexDigits[ch >> 4U]);
            out.push_back(kHexDigits[ch & 0x0FU]);
        } else {
            out.push_back(raw);
        }
    }
    out.push_back('"');
}

}  // namespace iostall::report
