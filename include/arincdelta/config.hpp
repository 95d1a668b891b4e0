#pragma once

#include "types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace arincdelta {

class SchemaRegistry;

// Defaults
constexpr std::string_view DEFAULT_OUTPUT_DIR = "delta_pg_pi_pv_out";
constexpr std::string_view DEFAULT_REGIONS = "EUR,EEU,MES";
constexpr std::string_view DEFAULT_TYPES = "PG,PI,PV,DV";

// Raw run request, as given on the command line
struct RunOptions {
    std::string old_path;
    std::string new_path;
    std::string output_dir = std::string(DEFAULT_OUTPUT_DIR);
    std::string airports;                          // comma-separated ICAO codes
    std::string areas;                             // comma-separated area codes
    std::string regions = std::string(DEFAULT_REGIONS);
    std::string types = std::string(DEFAULT_TYPES);
};

// Validated, immutable description of one run
struct RunContext {
    std::string old_path;
    std::string new_path;
    std::string output_dir;
    std::vector<std::string> types;                // requested type codes, in request order
    std::set<TypeTuple> selected_types;
    FilterSet icao_filter;
    FilterSet area_filter;
    bool region_requested = false;
    bool airport_requested = false;
};

// Region preset table: alias -> area codes
const std::map<std::string, std::set<std::string>>& region_presets();

// Split on ',', trim, uppercase; nullopt if no tokens remain
FilterSet parse_filter_list(std::string_view list);

// Expand region aliases into area codes. Returns false and names the
// offending token in `error` if a token is not a known preset.
bool expand_regions(const std::set<std::string>& regions, std::set<std::string>& areas, std::string& error);

// Validate options against the registry and build the run context
std::optional<RunContext> build_context(const RunOptions& options,
                                        const SchemaRegistry& registry,
                                        std::string& error);

} // namespace arincdelta
