#include "arincdelta/delta.hpp"
#include "arincdelta/record.hpp"

#include <fmt/format.h>

namespace arincdelta {

namespace {

const std::string& value_or_empty(const Row& row, const std::string& field) {
    static const std::string empty;
    auto it = row.find(field);
    return it != row.end() ? it->second : empty;
}

} // anonymous namespace

std::string canonical_payload(const Entity& entity) {
    std::string out;
    bool first = true;

    auto append = [&](std::string_view part) {
        if (!first) out += '|';
        out += part;
        first = false;
    };

    if (entity.primary) {
        append(record::payload(*entity.primary));
    }
    for (const auto& [cno, cont] : entity.continuations) {
        std::string appl = cont.application_type.empty() ? "_" : cont.application_type;
        append(fmt::format("[C{}:{}]{}", cno, appl, record::payload(cont.line)));
    }
    return out;
}

bool structurally_equal(const Entity& a, const Entity& b) {
    return canonical_payload(a) == canonical_payload(b);
}

DeltaResult compute_delta(const EntityMap& old_entities, const EntityMap& new_entities) {
    DeltaResult delta;

    for (const auto& key : new_entities.keys()) {
        if (!old_entities.contains(key)) {
            delta.added.push_back(key);
        }
    }

    for (const auto& key : old_entities.keys()) {
        const Entity* new_entity = new_entities.find(key);
        if (!new_entity) {
            delta.removed.push_back(key);
        } else if (!structurally_equal(*old_entities.find(key), *new_entity)) {
            delta.modified.push_back(key);
        }
    }

    return delta;
}

std::vector<std::string> changed_fields(const Row& old_row, const Row& new_row, const Header& header) {
    std::vector<std::string> changed;
    for (const auto& field : header) {
        if (value_or_empty(old_row, field) != value_or_empty(new_row, field)) {
            changed.push_back(field);
        }
    }
    return changed;
}

} // namespace arincdelta
