#pragma once

#include "group.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace arincdelta {

// Keys classified between an old and a new snapshot, each in sorted order
struct DeltaResult {
    std::vector<EntityKey> added;
    std::vector<EntityKey> removed;
    std::vector<EntityKey> modified;

    bool empty() const {
        return added.empty() && removed.empty() && modified.empty();
    }
};

// Equality form of an entity: primary 1..123, then "[C<n>:<appl>]" + 1..123
// per continuation in (length, value) order, joined by '|'
std::string canonical_payload(const Entity& entity);

// Two entities are structurally equal iff their canonical payloads match
bool structurally_equal(const Entity& a, const Entity& b);

DeltaResult compute_delta(const EntityMap& old_entities, const EntityMap& new_entities);

// Fields of `header` whose values differ between the two rows, in header order.
// A missing field compares as the empty string.
std::vector<std::string> changed_fields(const Row& old_row, const Row& new_row, const Header& header);

} // namespace arincdelta
