#pragma once

#include "report.hpp"
#include "types.hpp"

#include <set>
#include <string>
#include <vector>

namespace arincdelta {

class SchemaRegistry;
struct RunContext;

// Result of comparing two snapshots
struct RunResult {
    std::set<std::string> discarded_icaos;
    std::vector<TypeReport> reports;        // one per requested type, in request order
    size_t old_line_count = 0;              // after filtering and discard
    size_t new_line_count = 0;
};

// Compare two filtered snapshots. ICAOs orphaned in either snapshot are
// removed from both before grouping.
RunResult compare_snapshots(const std::vector<Line>& old_lines,
                            const std::vector<Line>& new_lines,
                            const RunContext& context,
                            const SchemaRegistry& registry);

// Read both snapshots named by the context and compare them
bool run_delta(const RunContext& context, const SchemaRegistry& registry,
               RunResult& result, std::string& error);

// Write every output of a run into the context's output directory
bool write_outputs(const RunContext& context, const RunResult& result, std::string& error);

} // namespace arincdelta
