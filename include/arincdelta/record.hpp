#pragma once

#include "types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace arincdelta {

// Line access - fixed-width slicing and classification
namespace record {

// Strip the line terminator, then pad with spaces or truncate to RECORD_WIDTH
Line normalize(std::string_view raw);

// True if the raw line (without terminator) is long enough to be a record
bool is_record(std::string_view raw);

// True for HDRn / EOFn marker lines (case-insensitive)
bool is_header_or_footer(std::string_view raw);

// Characters first..last (1-indexed, inclusive); clipped to the line
std::string slice(std::string_view line, int first, int last);

// Same as slice() with surrounding whitespace removed
std::string slice_trimmed(std::string_view line, int first, int last);

// Columns 1..123
std::string payload(std::string_view line);

// (column 5, column 13)
TypeTuple type_tuple(std::string_view line);

// Two-character type code with aliases applied ("D " -> "DV")
std::string type_code(std::string_view line);

// Empty for a primary line, otherwise the continuation identifier
std::string continuation_number(std::string_view line, int column = DEFAULT_CONTINUATION_COLUMN);

// Uppercased application type at the given column; empty if no column
std::string application_type(std::string_view line, std::optional<int> column);

// Human-readable label for an application type code
std::string application_type_label(std::string_view code);

// Airport ICAO (columns 7..10) and area code (columns 2..4), trimmed and uppercased
std::string icao(std::string_view line);
std::string area_code(std::string_view line);

// ICAO/area filter; an unset filter accepts every line
bool passes_filters(std::string_view line, const FilterSet& icao_filter, const FilterSet& area_filter);

} // namespace record

// String helpers shared by the pipeline
std::string trim(std::string_view s);
std::string to_upper(std::string_view s);

} // namespace arincdelta
