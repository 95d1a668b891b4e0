#include "arincdelta/group.hpp"
#include "arincdelta/record.hpp"
#include "arincdelta/registry.hpp"

namespace arincdelta {

Entity& EntityMap::fetch_or_create(const EntityKey& key, const Line& sample) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        return entities_[it->second];
    }

    Entity entity;
    entity.key = key;
    entity.type = record::type_tuple(sample);
    entity.sample = sample;

    index_.emplace(key, entities_.size());
    entities_.push_back(std::move(entity));
    return entities_.back();
}

const Entity* EntityMap::find(const EntityKey& key) const {
    auto it = index_.find(key);
    return it != index_.end() ? &entities_[it->second] : nullptr;
}

std::vector<EntityKey> EntityMap::keys() const {
    std::vector<EntityKey> keys;
    keys.reserve(index_.size());
    for (const auto& [key, _] : index_) {
        keys.push_back(key);
    }
    return keys;
}

ContinuationSet EntityMap::continuation_numbers() const {
    ContinuationSet numbers;
    for (const auto& entity : entities_) {
        for (const auto& [cno, _] : entity.continuations) {
            numbers.insert(cno);
        }
    }
    return numbers;
}

EntityKey entity_key(const Line& line) {
    return {record::type_code(line), record::slice(line, 1, static_cast<int>(IDENT_LENGTH))};
}

EntityMap combine(const std::vector<Line>& lines, const SchemaRegistry& registry) {
    EntityMap entities;

    for (const auto& line : lines) {
        EntityKey key = entity_key(line);
        Entity& entity = entities.fetch_or_create(key, line);

        std::string cno = record::continuation_number(line, registry.continuation_column(key.type_code));
        if (cno.empty()) {
            if (!entity.primary) {
                entity.primary = line;
            }
            continue;
        }

        entity.continuations[cno] = Continuation{
            line, record::application_type(line, registry.application_column(key.type_code))};
    }

    return entities;
}

std::set<std::string> find_orphan_icaos(const std::vector<Line>& lines, const SchemaRegistry& registry) {
    EntityMap entities = combine(lines, registry);

    std::map<std::string, size_t> primary_count;
    std::map<std::string, size_t> continuation_count;

    for (const auto& entity : entities) {
        std::string icao = record::icao(entity.reference_line());
        if (icao.empty()) continue;

        // Touch both counters so every ICAO seen is evaluated
        size_t& primaries = primary_count[icao];
        size_t& continuations = continuation_count[icao];
        if (entity.has_primary()) ++primaries;
        if (!entity.continuations.empty()) ++continuations;
    }

    std::set<std::string> orphans;
    for (const auto& [icao, primaries] : primary_count) {
        if (primaries == 0 && continuation_count[icao] > 0) {
            orphans.insert(icao);
        }
    }
    return orphans;
}

std::vector<Line> discard_icaos(const std::vector<Line>& lines, const std::set<std::string>& icaos) {
    if (icaos.empty()) return lines;

    std::vector<Line> kept;
    kept.reserve(lines.size());
    for (const auto& line : lines) {
        if (icaos.count(record::icao(line)) == 0) {
            kept.push_back(line);
        }
    }
    return kept;
}

} // namespace arincdelta
