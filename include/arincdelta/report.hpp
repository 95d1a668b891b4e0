#pragma once

#include "group.hpp"
#include "types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace arincdelta {

class RecordSchema;
struct RunContext;

// One tabular output, written as <name>.csv
struct Table {
    std::string name;
    Header header;
    std::vector<Row> rows;
};

struct DeltaCounts {
    size_t current = 0;
    size_t added = 0;
    size_t removed = 0;
    size_t modified = 0;
};

// Everything produced for one record type
struct TypeReport {
    std::string type_code;
    DeltaCounts counts;
    std::vector<Table> tables;
    std::vector<std::string> stale_tables;  // outputs to remove if present

    Table* find_table(std::string_view name);
    const Table* find_table(std::string_view name) const;

    // Drop a table from the report and mark its output stale
    void supersede(std::string_view name);
};

// Output slices, in the order they are written
constexpr std::string_view SLICE_PREFIXES[] = {"current", "added", "removed", "modified"};

// "<prefix>_<suffix>", e.g. "added_PG"
std::string table_name(std::string_view prefix, std::string_view suffix);

// Project one type's entities from both snapshots into its output tables
TypeReport build_type_report(const RecordSchema& schema,
                             const EntityMap& old_entities,
                             const EntityMap& new_entities,
                             const RunContext& context);

} // namespace arincdelta
