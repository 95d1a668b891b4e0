#pragma once

#include "group.hpp"
#include "types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace arincdelta {

class RecordSchema;

// Synthetic field names
constexpr std::string_view PRIMARY_PAYLOAD_FIELD = "primary_1_123";
constexpr std::string_view CHANGED_FIELD_COUNT = "changed_field_count";
constexpr std::string_view CHANGED_FIELDS = "changed_fields";

// "cont#<n>_appl_code", "cont#<n>_appl_label", "cont#<n>_1_123"
std::string continuation_code_field(const std::string& cno);
std::string continuation_label_field(const std::string& cno);
std::string continuation_payload_field(const std::string& cno);

// Schema field names in declared order, then three fields per continuation number
Header build_header(const std::vector<FieldColumn>& fields, const ContinuationSet& continuation_numbers);

// Base header followed by the changed-field annotations
Header modified_header(const Header& base);

// Flatten an entity into a row over `header`. The reference line is the
// primary, else the first continuation; schema fields are sliced from it.
// The schema's postprocess hook runs last, then unset fields become "".
Row build_row(const Entity& entity, const RecordSchema& schema, const Header& header);

} // namespace arincdelta
