#include "arincdelta/report.hpp"
#include "arincdelta/delta.hpp"
#include "arincdelta/projection.hpp"
#include "arincdelta/registry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace arincdelta {

Table* TypeReport::find_table(std::string_view name) {
    for (auto& table : tables) {
        if (table.name == name) return &table;
    }
    return nullptr;
}

const Table* TypeReport::find_table(std::string_view name) const {
    for (const auto& table : tables) {
        if (table.name == name) return &table;
    }
    return nullptr;
}

void TypeReport::supersede(std::string_view name) {
    tables.erase(std::remove_if(tables.begin(), tables.end(),
                                [&](const Table& t) { return t.name == name; }),
                 tables.end());
    if (std::find(stale_tables.begin(), stale_tables.end(), name) == stale_tables.end()) {
        stale_tables.emplace_back(name);
    }
}

std::string table_name(std::string_view prefix, std::string_view suffix) {
    return fmt::format("{}_{}", prefix, suffix);
}

TypeReport build_type_report(const RecordSchema& schema,
                             const EntityMap& old_entities,
                             const EntityMap& new_entities,
                             const RunContext& context) {
    TypeReport report;
    report.type_code = std::string(schema.type_code());

    ContinuationSet conts = old_entities.continuation_numbers();
    ContinuationSet new_conts = new_entities.continuation_numbers();
    conts.insert(new_conts.begin(), new_conts.end());

    Header base_header = build_header(schema.fields(), conts);
    Header mod_header = modified_header(base_header);

    std::vector<Row> current_rows;
    current_rows.reserve(new_entities.size());
    for (const auto& entity : new_entities) {
        current_rows.push_back(build_row(entity, schema, base_header));
    }

    DeltaResult delta = compute_delta(old_entities, new_entities);

    std::vector<Row> added_rows;
    for (const auto& key : delta.added) {
        added_rows.push_back(build_row(*new_entities.find(key), schema, base_header));
    }

    std::vector<Row> removed_rows;
    for (const auto& key : delta.removed) {
        removed_rows.push_back(build_row(*old_entities.find(key), schema, base_header));
    }

    // Raw payload copies are not compared field-by-field
    Header compared = base_header;
    for (const auto& field : schema.fields()) {
        if (!field.range) {
            compared.erase(std::remove(compared.begin(), compared.end(), field.name), compared.end());
        }
    }

    std::vector<Row> modified_rows;
    for (const auto& key : delta.modified) {
        Row new_row = build_row(*new_entities.find(key), schema, base_header);
        Row old_row = build_row(*old_entities.find(key), schema, base_header);
        std::vector<std::string> changed = changed_fields(old_row, new_row, compared);

        new_row[std::string(CHANGED_FIELD_COUNT)] = std::to_string(changed.size());
        new_row[std::string(CHANGED_FIELDS)] = fmt::format("{}", fmt::join(changed, ","));
        modified_rows.push_back(std::move(new_row));
    }

    report.counts = {current_rows.size(), added_rows.size(), removed_rows.size(), modified_rows.size()};

    const std::string& code = report.type_code;
    report.tables.push_back({table_name("current", code), base_header, current_rows});
    report.tables.push_back({table_name("added", code), base_header, added_rows});
    report.tables.push_back({table_name("removed", code), base_header, removed_rows});
    report.tables.push_back({table_name("modified", code), mod_header, modified_rows});

    ExtraViewInput input{base_header, mod_header, current_rows, added_rows,
                         removed_rows, modified_rows, context};
    schema.extra_views(input, report);

    return report;
}

} // namespace arincdelta
