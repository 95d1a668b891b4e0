#include "arincdelta/io.hpp"
#include "arincdelta/config.hpp"
#include "arincdelta/record.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <system_error>

namespace arincdelta {

namespace fs = std::filesystem;

namespace {

void write_csv_row(std::ostream& out, const Header& header, const Row& row) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (i > 0) out << ',';
        auto it = row.find(header[i]);
        if (it != row.end()) {
            out << csv_escape(latin1_to_utf8(it->second));
        }
    }
    out << "\r\n";
}

bool open_for_write(const std::string& path, std::ofstream& out, std::string& error) {
    fs::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            error = fmt::format("cannot create directory '{}': {}", p.parent_path().string(), ec.message());
            return false;
        }
    }

    out.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        error = fmt::format("cannot open output file '{}': {}", path, std::strerror(errno));
        return false;
    }
    return true;
}

bool finish_write(const std::string& path, std::ofstream& out, std::string& error) {
    out.flush();
    if (!out) {
        error = fmt::format("write failed for '{}'", path);
        return false;
    }
    return true;
}

} // anonymous namespace

std::vector<Line> read_lines(std::istream& in, const RunContext& context) {
    std::vector<Line> lines;
    std::string raw;
    while (std::getline(in, raw)) {
        if (record::is_header_or_footer(raw) || !record::is_record(raw)) continue;

        Line line = record::normalize(raw);
        if (context.selected_types.count(record::type_tuple(line)) == 0) continue;
        if (!record::passes_filters(line, context.icao_filter, context.area_filter)) continue;

        lines.push_back(std::move(line));
    }
    return lines;
}

bool read_lines(const std::string& path, const RunContext& context,
                std::vector<Line>& lines, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = fmt::format("cannot open '{}': {}", path, std::strerror(errno));
        return false;
    }

    lines = read_lines(in, context);

    if (in.bad()) {
        error = fmt::format("read failed for '{}'", path);
        return false;
    }
    return true;
}

std::string latin1_to_utf8(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out += ch;
        } else {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }

    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void write_csv(std::ostream& out, const Header& header, const std::vector<Row>& rows) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (i > 0) out << ',';
        out << csv_escape(header[i]);
    }
    out << "\r\n";

    for (const auto& row : rows) {
        write_csv_row(out, header, row);
    }
}

bool write_csv(const std::string& path, const Header& header,
               const std::vector<Row>& rows, std::string& error) {
    std::ofstream out;
    if (!open_for_write(path, out, error)) return false;
    write_csv(out, header, rows);
    return finish_write(path, out, error);
}

bool write_report(const std::string& dir, const TypeReport& report, std::string& error) {
    for (const auto& table : report.tables) {
        std::string path = (fs::path(dir) / (table.name + ".csv")).string();
        if (!write_csv(path, table.header, table.rows, error)) {
            return false;
        }
    }

    for (const auto& name : report.stale_tables) {
        fs::path path = fs::path(dir) / (name + ".csv");
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            error = fmt::format("cannot remove stale output '{}': {}", path.string(), ec.message());
            return false;
        }
    }
    return true;
}

bool write_discarded(const std::string& path, const std::set<std::string>& icaos, std::string& error) {
    std::ofstream out;
    if (!open_for_write(path, out, error)) return false;

    bool first = true;
    for (const auto& icao : icaos) {
        if (!first) out << '\n';
        out << latin1_to_utf8(icao);
        first = false;
    }
    return finish_write(path, out, error);
}

bool write_summary(const std::string& path, const std::vector<TypeReport>& reports, std::string& error) {
    Header header = {"type", "current", "added", "removed", "modified"};
    std::vector<Row> rows;
    rows.reserve(reports.size());
    for (const auto& report : reports) {
        rows.push_back({
            {"type", report.type_code},
            {"current", std::to_string(report.counts.current)},
            {"added", std::to_string(report.counts.added)},
            {"removed", std::to_string(report.counts.removed)},
            {"modified", std::to_string(report.counts.modified)},
        });
    }
    return write_csv(path, header, rows, error);
}

} // namespace arincdelta
