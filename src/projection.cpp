#include "arincdelta/projection.hpp"
#include "arincdelta/record.hpp"
#include "arincdelta/registry.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace arincdelta {

std::string continuation_code_field(const std::string& cno) {
    return fmt::format("cont#{}_appl_code", cno);
}

std::string continuation_label_field(const std::string& cno) {
    return fmt::format("cont#{}_appl_label", cno);
}

std::string continuation_payload_field(const std::string& cno) {
    return fmt::format("cont#{}_1_123", cno);
}

Header build_header(const std::vector<FieldColumn>& fields, const ContinuationSet& continuation_numbers) {
    Header header;
    header.reserve(fields.size() + continuation_numbers.size() * 3);
    for (const auto& field : fields) {
        header.emplace_back(field.name);
    }
    for (const auto& cno : continuation_numbers) {
        header.push_back(continuation_code_field(cno));
        header.push_back(continuation_label_field(cno));
        header.push_back(continuation_payload_field(cno));
    }
    return header;
}

Header modified_header(const Header& base) {
    Header header = base;
    header.emplace_back(CHANGED_FIELD_COUNT);
    header.emplace_back(CHANGED_FIELDS);
    return header;
}

Row build_row(const Entity& entity, const RecordSchema& schema, const Header& header) {
    Row row;

    const Line* ref = nullptr;
    if (entity.primary) {
        ref = &*entity.primary;
    } else if (!entity.continuations.empty()) {
        ref = &entity.continuations.begin()->second.line;
    }

    if (ref) {
        for (const auto& field : schema.fields()) {
            row[std::string(field.name)] = field.range
                ? record::slice_trimmed(*ref, field.range->first, field.range->last)
                : record::payload(*ref);
        }
        // The primary's payload is privileged over a continuation's
        if (entity.primary) {
            row[std::string(PRIMARY_PAYLOAD_FIELD)] = record::payload(*entity.primary);
        }
    }

    for (const auto& [cno, cont] : entity.continuations) {
        std::string code_key = continuation_code_field(cno);
        std::string label_key = continuation_label_field(cno);
        std::string payload_key = continuation_payload_field(cno);

        // Only continuation numbers declared in the header are projected
        if (std::find(header.begin(), header.end(), code_key) == header.end()) continue;

        row[code_key] = cont.application_type;
        row[label_key] = record::application_type_label(cont.application_type);
        row[payload_key] = record::payload(cont.line);
    }

    schema.postprocess(row);

    for (const auto& field : header) {
        row.try_emplace(field);
    }
    return row;
}

} // namespace arincdelta
