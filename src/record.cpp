#include "arincdelta/record.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>

namespace arincdelta {

namespace {

const std::regex g_header_re(R"(^\s*(HDR|EOF)\d)", std::regex::icase);

// Raw (section+subsection) codes remapped to a canonical type code
const std::map<std::string, std::string> g_type_aliases = {
    {"D ", "DV"},
};

const std::map<std::string, std::string, std::less<>> g_application_labels = {
    {"A", "Notes or formatted data continuation"},
    {"C", "Call sign or controlling agency continuation"},
    {"E", "Primary record extension"},
    {"L", "VHF navaid limitation continuation"},
    {"N", "Sector narrative continuation"},
    {"T", "Time of operations continuation (formatted data)"},
    {"U", "Time of operations continuation (narrative data)"},
    {"V", "Time of operations continuation (alternate narrative)"},
    {"P", "Flight planning application continuation"},
    {"Q", "Flight planning primary data continuation"},
    {"S", "Simulation application continuation"},
};

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view strip_terminator(std::string_view raw) {
    while (!raw.empty() && (raw.back() == '\n' || raw.back() == '\r')) {
        raw.remove_suffix(1);
    }
    return raw;
}

} // anonymous namespace

std::string trim(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return std::string(s.substr(begin, end - begin));
}

std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

namespace record {

Line normalize(std::string_view raw) {
    Line line(strip_terminator(raw));
    line.resize(RECORD_WIDTH, ' ');
    return line;
}

bool is_record(std::string_view raw) {
    return strip_terminator(raw).size() >= MIN_RECORD_LENGTH;
}

bool is_header_or_footer(std::string_view raw) {
    std::string trimmed = trim(raw);
    return std::regex_search(trimmed, g_header_re);
}

std::string slice(std::string_view line, int first, int last) {
    if (first < 1 || last < first) return {};
    size_t start = static_cast<size_t>(first - 1);
    if (start >= line.size()) return {};
    return std::string(line.substr(start, static_cast<size_t>(last - first + 1)));
}

std::string slice_trimmed(std::string_view line, int first, int last) {
    return trim(slice(line, first, last));
}

std::string payload(std::string_view line) {
    return std::string(line.substr(0, std::min(line.size(), PAYLOAD_LENGTH)));
}

TypeTuple type_tuple(std::string_view line) {
    return {slice(line, 5, 5), slice(line, 13, 13)};
}

std::string type_code(std::string_view line) {
    auto [section, subsection] = type_tuple(line);
    std::string raw = section + subsection;
    auto it = g_type_aliases.find(raw);
    return it != g_type_aliases.end() ? it->second : raw;
}

std::string continuation_number(std::string_view line, int column) {
    std::string c = slice(line, column, column);
    if (c.empty() || c == "0" || c == "1" || c == " ") {
        return {};
    }
    return c;
}

std::string application_type(std::string_view line, std::optional<int> column) {
    if (!column) return {};
    return to_upper(slice_trimmed(line, *column, *column));
}

std::string application_type_label(std::string_view code) {
    if (code.empty()) return {};
    auto it = g_application_labels.find(to_upper(code));
    return it != g_application_labels.end() ? it->second : "Unknown";
}

std::string icao(std::string_view line) {
    return to_upper(slice_trimmed(line, 7, 10));
}

std::string area_code(std::string_view line) {
    return to_upper(slice_trimmed(line, 2, 4));
}

bool passes_filters(std::string_view line, const FilterSet& icao_filter, const FilterSet& area_filter) {
    if (!icao_filter && !area_filter) return true;
    bool ok_icao = !icao_filter || icao_filter->count(icao(line)) > 0;
    bool ok_area = !area_filter || area_filter->count(area_code(line)) > 0;
    return ok_icao && ok_area;
}

} // namespace record

} // namespace arincdelta
