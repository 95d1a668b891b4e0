#include "arincdelta/schemas.hpp"
#include "arincdelta/config.hpp"
#include "arincdelta/projection.hpp"
#include "arincdelta/record.hpp"
#include "arincdelta/report.hpp"

#include <cctype>
#include <functional>

namespace arincdelta::schemas {

namespace {

constexpr size_t ILS_DME_FLAG_OFFSET = 28;  // 0-based offset into the 1..123 payload

bool is_ils_dme(const Row& row) {
    auto it = row.find(std::string(PRIMARY_PAYLOAD_FIELD));
    if (it == row.end() || it->second.size() <= ILS_DME_FLAG_OFFSET) return false;
    return std::toupper(static_cast<unsigned char>(it->second[ILS_DME_FLAG_OFFSET])) == 'I';
}

bool is_vor(const Row& row) {
    auto it = row.find("navaid_class");
    return it != row.end() && !it->second.empty() &&
           std::toupper(static_cast<unsigned char>(it->second.front())) == 'V';
}

std::vector<Row> keep_rows(const std::vector<Row>& rows, const std::function<bool(const Row&)>& pred) {
    std::vector<Row> out;
    for (const auto& row : rows) {
        if (pred(row)) out.push_back(row);
    }
    return out;
}

// Rename a field in every row, including mentions in the changed-field list
std::vector<Row> rename_field(std::vector<Row> rows, const std::string& from, const std::string& to) {
    for (auto& row : rows) {
        auto node = row.extract(from);
        if (!node.empty()) {
            node.key() = to;
            row.insert(std::move(node));
        }

        auto changed = row.find(std::string(CHANGED_FIELDS));
        if (changed == row.end() || changed->second.empty()) continue;

        std::string rewritten;
        size_t start = 0;
        const std::string& list = changed->second;
        while (start <= list.size()) {
            size_t comma = list.find(',', start);
            if (comma == std::string::npos) comma = list.size();
            std::string name = list.substr(start, comma - start);
            if (!name.empty()) {
                if (!rewritten.empty()) rewritten += ',';
                rewritten += (name == from) ? to : name;
            }
            start = comma + 1;
        }
        changed->second = std::move(rewritten);
    }
    return rows;
}

Header rename_header(Header header, const std::string& from, const std::string& to) {
    for (auto& field : header) {
        if (field == from) field = to;
    }
    return header;
}

class VhfNavaidSchema : public RecordSchema {
public:
    VhfNavaidSchema()
        : RecordSchema(SchemaDescriptor{
              "DV",
              {"D", " "},
              22,
              23,
              {
                  {"area_code", ColumnRange{2, 4}},
                  {"subsection_code", ColumnRange{6, 6}},
                  {"airport_icao", ColumnRange{7, 10}},
                  {"icao_code", ColumnRange{11, 12}},
                  {"ils_ident", ColumnRange{14, 17}},
                  {"navaid_icao_code", ColumnRange{20, 21}},
                  {"vor_frequency", ColumnRange{23, 27}},
                  {"navaid_class", ColumnRange{28, 32}},
                  {"vor_latitude", ColumnRange{33, 41}},
                  {"vor_longitude", ColumnRange{42, 51}},
                  {"dme_ident", ColumnRange{52, 55}},
                  {"dme_latitude", ColumnRange{56, 64}},
                  {"dme_longitude", ColumnRange{65, 74}},
                  {"station_declination", ColumnRange{75, 79}},
                  {"dme_elevation", ColumnRange{80, 84}},
                  {"figure_of_merit", ColumnRange{85, 85}},
                  {"ils_dme_bias", ColumnRange{86, 87}},
                  {"frequency_protection", ColumnRange{88, 90}},
                  {"datum_code", ColumnRange{91, 93}},
                  {"vor_name", ColumnRange{94, 123}},
                  {"primary_1_123", std::nullopt},
              }}) {}

    void postprocess(Row& row) const override {
        trim_field(row, "ils_ident");
        trim_field(row, "vor_name");
        trim_field(row, "airport_icao");
    }

    // Replaces the default DV tables with an ILS/DME subset and, for
    // region-filtered runs, a VOR subset keyed by vor_ident.
    void extra_views(const ExtraViewInput& in, TypeReport& report) const override {
        std::string code = std::string(type_code());
        std::string lower = to_lower(code);

        for (auto prefix : SLICE_PREFIXES) {
            report.supersede(table_name(prefix, code));
        }

        std::string ils_suffix = lower + "_ils_dme";
        report.tables.push_back({table_name("current", ils_suffix), in.base_header, keep_rows(in.current, is_ils_dme)});
        report.tables.push_back({table_name("added", ils_suffix), in.base_header, keep_rows(in.added, is_ils_dme)});
        report.tables.push_back({table_name("removed", ils_suffix), in.base_header, keep_rows(in.removed, is_ils_dme)});
        report.tables.push_back({table_name("modified", ils_suffix), in.modified_header, keep_rows(in.modified, is_ils_dme)});

        std::string vor_suffix = lower + "_vor";
        if (!in.context.region_requested) {
            for (auto prefix : SLICE_PREFIXES) {
                report.supersede(table_name(prefix, vor_suffix));
            }
            return;
        }

        const std::string from = "ils_ident";
        const std::string to = "vor_ident";
        Header vor_base = rename_header(in.base_header, from, to);
        Header vor_mod = rename_header(in.modified_header, from, to);

        report.tables.push_back({table_name("current", vor_suffix), vor_base,
                                 rename_field(keep_rows(in.current, is_vor), from, to)});
        report.tables.push_back({table_name("added", vor_suffix), vor_base,
                                 rename_field(keep_rows(in.added, is_vor), from, to)});
        report.tables.push_back({table_name("removed", vor_suffix), vor_base,
                                 rename_field(keep_rows(in.removed, is_vor), from, to)});
        report.tables.push_back({table_name("modified", vor_suffix), vor_mod,
                                 rename_field(keep_rows(in.modified, is_vor), from, to)});
    }

private:
    static std::string to_lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }
};

} // anonymous namespace

std::unique_ptr<RecordSchema> make_vhf_navaid_schema() {
    return std::make_unique<VhfNavaidSchema>();
}

} // namespace arincdelta::schemas
