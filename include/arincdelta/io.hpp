#pragma once

#include "report.hpp"
#include "types.hpp"

#include <iosfwd>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace arincdelta {

struct RunContext;

// Read a snapshot, keeping normalized record lines that pass the run's
// type, ICAO and area filters. Returns false if the file cannot be read.
bool read_lines(const std::string& path, const RunContext& context,
                std::vector<Line>& lines, std::string& error);

// Same filtering over an already-open stream
std::vector<Line> read_lines(std::istream& in, const RunContext& context);

// Latin-1 input bytes to UTF-8
std::string latin1_to_utf8(std::string_view s);

// Quote a CSV field if it contains a separator, quote or line break
std::string csv_escape(std::string_view field);

// Header row then one row per entry, CRLF-terminated, UTF-8
void write_csv(std::ostream& out, const Header& header, const std::vector<Row>& rows);
bool write_csv(const std::string& path, const Header& header,
               const std::vector<Row>& rows, std::string& error);

// Write a report's tables into `dir` and delete its stale outputs
bool write_report(const std::string& dir, const TypeReport& report, std::string& error);

// Sorted ICAOs, one per line
bool write_discarded(const std::string& path, const std::set<std::string>& icaos, std::string& error);

// type,current,added,removed,modified
bool write_summary(const std::string& path, const std::vector<TypeReport>& reports, std::string& error);

} // namespace arincdelta
