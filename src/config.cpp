#include "arincdelta/config.hpp"
#include "arincdelta/record.hpp"
#include "arincdelta/registry.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace arincdelta {

namespace {

std::vector<std::string> split_list(std::string_view list) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string_view::npos) comma = list.size();
        std::string token = to_upper(trim(list.substr(start, comma - start)));
        if (!token.empty()) {
            tokens.push_back(std::move(token));
        }
        start = comma + 1;
    }
    return tokens;
}

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // anonymous namespace

const std::map<std::string, std::set<std::string>>& region_presets() {
    static const std::map<std::string, std::set<std::string>> presets = {
        {"EU", {"EUR", "EEU"}},
        {"ME", {"MES"}},
        // ARINC 424 area codes stand for themselves
        {"AFR", {"AFR"}},
        {"CAN", {"CAN"}},
        {"EEU", {"EEU"}},
        {"EUR", {"EUR"}},
        {"LAM", {"LAM"}},
        {"MES", {"MES"}},
        {"PAC", {"PAC"}},
        {"SAM", {"SAM"}},
        {"SPA", {"SPA"}},
        {"USA", {"USA"}},
    };
    return presets;
}

FilterSet parse_filter_list(std::string_view list) {
    std::vector<std::string> tokens = split_list(list);
    if (tokens.empty()) return std::nullopt;
    return std::set<std::string>(tokens.begin(), tokens.end());
}

bool expand_regions(const std::set<std::string>& regions, std::set<std::string>& areas, std::string& error) {
    const auto& presets = region_presets();
    for (const auto& region : regions) {
        auto it = presets.find(region);
        if (it == presets.end()) {
            error = fmt::format("unknown region '{}'", region);
            return false;
        }
        areas.insert(it->second.begin(), it->second.end());
    }
    return true;
}

std::optional<RunContext> build_context(const RunOptions& options,
                                        const SchemaRegistry& registry,
                                        std::string& error) {
    RunContext ctx;
    ctx.old_path = options.old_path;
    ctx.new_path = options.new_path;
    ctx.output_dir = options.output_dir;

    for (auto& type : split_list(options.types)) {
        const RecordSchema* schema = registry.get(type);
        if (!schema) {
            error = fmt::format("unknown type '{}'. Allowed: {}", type, join(registry.type_codes(), ", "));
            return std::nullopt;
        }
        if (std::find(ctx.types.begin(), ctx.types.end(), type) == ctx.types.end()) {
            ctx.selected_types.insert(schema->descriptor().selected_type);
            ctx.types.push_back(std::move(type));
        }
    }

    ctx.icao_filter = parse_filter_list(options.airports);

    FilterSet explicit_areas = parse_filter_list(options.areas);
    FilterSet regions = parse_filter_list(options.regions);
    FilterSet region_areas;
    if (regions) {
        region_areas.emplace();
        if (!expand_regions(*regions, *region_areas, error)) {
            return std::nullopt;
        }
    }

    // An explicit area list overrides the region presets
    ctx.area_filter = explicit_areas ? explicit_areas : region_areas;
    ctx.region_requested = regions.has_value();
    ctx.airport_requested = ctx.icao_filter.has_value();

    return ctx;
}

} // namespace arincdelta
