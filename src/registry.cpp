#include "arincdelta/registry.hpp"
#include "arincdelta/schemas.hpp"

namespace arincdelta {

bool SchemaRegistry::register_schema(std::unique_ptr<RecordSchema> schema) {
    if (!schema) return false;

    // Check if already registered
    if (contains(schema->type_code())) {
        return false;
    }

    schemas_.push_back(std::move(schema));
    return true;
}

const RecordSchema* SchemaRegistry::get(std::string_view type_code) const {
    for (const auto& schema : schemas_) {
        if (schema->type_code() == type_code) {
            return schema.get();
        }
    }
    return nullptr;
}

std::vector<std::string> SchemaRegistry::type_codes() const {
    std::vector<std::string> codes;
    codes.reserve(schemas_.size());
    for (const auto& schema : schemas_) {
        codes.emplace_back(schema->type_code());
    }
    return codes;
}

int SchemaRegistry::continuation_column(std::string_view type_code) const {
    const RecordSchema* schema = get(type_code);
    return schema ? schema->descriptor().continuation_column : DEFAULT_CONTINUATION_COLUMN;
}

std::optional<int> SchemaRegistry::application_column(std::string_view type_code) const {
    const RecordSchema* schema = get(type_code);
    if (!schema) return std::nullopt;
    return schema->descriptor().application_column;
}

SchemaRegistry make_default_registry() {
    SchemaRegistry registry;
    registry.register_schema(schemas::make_runway_schema());
    registry.register_schema(schemas::make_localizer_schema());
    registry.register_schema(schemas::make_airport_comm_schema());
    registry.register_schema(schemas::make_vhf_navaid_schema());
    return registry;
}

} // namespace arincdelta
