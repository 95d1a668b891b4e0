#pragma once

#include "types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace arincdelta {

class SchemaRegistry;

// A continuation line and its application type
struct Continuation {
    Line line;
    std::string application_type;
};

using ContinuationMap = std::map<std::string, Continuation, ContinuationOrder>;
using ContinuationSet = std::set<std::string, ContinuationOrder>;

// Logical record: one primary line plus its continuations under one key
struct Entity {
    EntityKey key;
    TypeTuple type;
    std::optional<Line> primary;
    ContinuationMap continuations;  // iterates in (length, value) order
    Line sample;                    // first line seen for this key

    bool has_primary() const { return primary.has_value(); }

    // Primary if present, otherwise the first line seen
    const Line& reference_line() const { return primary ? *primary : sample; }
};

// Entities of one snapshot, keyed by identity, in first-seen order
class EntityMap {
public:
    // Fetch the entity for `key`, creating it from `sample` if new
    Entity& fetch_or_create(const EntityKey& key, const Line& sample);

    const Entity* find(const EntityKey& key) const;
    bool contains(const EntityKey& key) const { return index_.count(key) > 0; }

    // Keys in sorted order
    std::vector<EntityKey> keys() const;

    // Continuation numbers present on any entity
    ContinuationSet continuation_numbers() const;

    size_t size() const { return entities_.size(); }
    bool empty() const { return entities_.empty(); }

    std::vector<Entity>::const_iterator begin() const { return entities_.begin(); }
    std::vector<Entity>::const_iterator end() const { return entities_.end(); }

private:
    std::vector<Entity> entities_;
    std::map<EntityKey, size_t> index_;
};

// Identity of the entity a line belongs to: (type code, columns 1..21)
EntityKey entity_key(const Line& line);

// Combine primary and continuation lines into entities (single pass).
// First primary for a key wins; a repeated continuation number overwrites.
EntityMap combine(const std::vector<Line>& lines, const SchemaRegistry& registry);

// ICAOs that carry continuation-bearing entities but no primary-bearing entity
std::set<std::string> find_orphan_icaos(const std::vector<Line>& lines, const SchemaRegistry& registry);

// Drop every line whose ICAO is in `icaos`
std::vector<Line> discard_icaos(const std::vector<Line>& lines, const std::set<std::string>& icaos);

} // namespace arincdelta
