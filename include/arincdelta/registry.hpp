#pragma once

#include "types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arincdelta {

struct RunContext;
struct TypeReport;

// Column layout and continuation rules for one record type
struct SchemaDescriptor {
    std::string_view type_code;
    TypeTuple selected_type;
    int continuation_column = DEFAULT_CONTINUATION_COLUMN;
    std::optional<int> application_column;
    std::vector<FieldColumn> fields;
};

// Input to a type's extra view step
struct ExtraViewInput {
    const Header& base_header;
    const Header& modified_header;
    const std::vector<Row>& current;
    const std::vector<Row>& added;
    const std::vector<Row>& removed;
    const std::vector<Row>& modified;
    const RunContext& context;
};

// One record type: layout data plus type-specific row hooks
class RecordSchema {
public:
    explicit RecordSchema(SchemaDescriptor desc) : desc_(std::move(desc)) {}
    virtual ~RecordSchema() = default;

    const SchemaDescriptor& descriptor() const { return desc_; }
    std::string_view type_code() const { return desc_.type_code; }
    const std::vector<FieldColumn>& fields() const { return desc_.fields; }

    // Type-specific cleanup applied to every built row
    virtual void postprocess(Row&) const {}

    // Derived output tables; may supersede the default ones in the report
    virtual void extra_views(const ExtraViewInput&, TypeReport&) const {}

private:
    SchemaDescriptor desc_;
};

// Schema registry - the single place record types are looked up by type code
class SchemaRegistry {
public:
    SchemaRegistry() = default;

    SchemaRegistry(const SchemaRegistry&) = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;
    SchemaRegistry(SchemaRegistry&&) = default;
    SchemaRegistry& operator=(SchemaRegistry&&) = default;

    // Register a schema; returns false if the type code is already taken
    bool register_schema(std::unique_ptr<RecordSchema> schema);

    // Get schema by type code, nullptr if unknown
    const RecordSchema* get(std::string_view type_code) const;

    bool contains(std::string_view type_code) const { return get(type_code) != nullptr; }

    // Registered type codes in registration order
    std::vector<std::string> type_codes() const;

    // Continuation column for a type code (default column if unknown)
    int continuation_column(std::string_view type_code) const;

    // Application type column for a type code, if configured
    std::optional<int> application_column(std::string_view type_code) const;

    size_t size() const { return schemas_.size(); }

    // Clear registry (for testing)
    void clear() { schemas_.clear(); }

private:
    std::vector<std::unique_ptr<RecordSchema>> schemas_;
};

// Registry holding the built-in PG, PI, PV and DV schemas
SchemaRegistry make_default_registry();

} // namespace arincdelta
