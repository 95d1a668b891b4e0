#pragma once

#include <compare>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace arincdelta {

// Fixed record geometry
constexpr size_t RECORD_WIDTH = 132;
constexpr size_t MIN_RECORD_LENGTH = 70;
constexpr size_t PAYLOAD_LENGTH = 123;     // Columns 1..123; FRN and cycle excluded
constexpr size_t IDENT_LENGTH = 21;        // Columns 1..21 identify an entity
constexpr int DEFAULT_CONTINUATION_COLUMN = 22;

// A normalized record line, always RECORD_WIDTH characters
using Line = std::string;

// (section, subsection) as found in columns 5 and 13
using TypeTuple = std::pair<std::string, std::string>;

// Optional allow-set; std::nullopt means "accept all"
using FilterSet = std::optional<std::set<std::string>>;

// 1-indexed inclusive column range
struct ColumnRange {
    int first;
    int last;
};

// Schema field: a null range holds the whole 1..123 payload
struct FieldColumn {
    std::string_view name;
    std::optional<ColumnRange> range;
};

// Orders continuation numbers by (length, value) so "2" < "3" < "10"
struct ContinuationOrder {
    bool operator()(const std::string& a, const std::string& b) const {
        if (a.size() != b.size()) return a.size() < b.size();
        return a < b;
    }
};

// Identity of an entity: type code plus columns 1..21
struct EntityKey {
    std::string type_code;
    std::string ident;

    auto operator<=>(const EntityKey&) const = default;
};

// A flattened output row: field name -> value
using Row = std::map<std::string, std::string>;
using Header = std::vector<std::string>;

} // namespace arincdelta
