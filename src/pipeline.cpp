#include "arincdelta/pipeline.hpp"
#include "arincdelta/config.hpp"
#include "arincdelta/group.hpp"
#include "arincdelta/io.hpp"
#include "arincdelta/record.hpp"
#include "arincdelta/registry.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <map>
#include <system_error>

namespace arincdelta {

namespace {

std::map<std::string, std::vector<Line>> bucket_by_type(const std::vector<Line>& lines) {
    std::map<std::string, std::vector<Line>> buckets;
    for (const auto& line : lines) {
        buckets[record::type_code(line)].push_back(line);
    }
    return buckets;
}

} // anonymous namespace

RunResult compare_snapshots(const std::vector<Line>& old_lines,
                            const std::vector<Line>& new_lines,
                            const RunContext& context,
                            const SchemaRegistry& registry) {
    RunResult result;

    // Same exclusion set for both sides keeps the comparison symmetric
    result.discarded_icaos = find_orphan_icaos(old_lines, registry);
    std::set<std::string> new_orphans = find_orphan_icaos(new_lines, registry);
    result.discarded_icaos.insert(new_orphans.begin(), new_orphans.end());

    std::vector<Line> old_kept = discard_icaos(old_lines, result.discarded_icaos);
    std::vector<Line> new_kept = discard_icaos(new_lines, result.discarded_icaos);
    result.old_line_count = old_kept.size();
    result.new_line_count = new_kept.size();

    auto old_buckets = bucket_by_type(old_kept);
    auto new_buckets = bucket_by_type(new_kept);
    const std::vector<Line> none;

    for (const auto& type : context.types) {
        const RecordSchema* schema = registry.get(type);
        if (!schema) continue;

        auto old_it = old_buckets.find(type);
        auto new_it = new_buckets.find(type);
        EntityMap old_entities = combine(old_it != old_buckets.end() ? old_it->second : none, registry);
        EntityMap new_entities = combine(new_it != new_buckets.end() ? new_it->second : none, registry);

        result.reports.push_back(build_type_report(*schema, old_entities, new_entities, context));
    }

    return result;
}

bool run_delta(const RunContext& context, const SchemaRegistry& registry,
               RunResult& result, std::string& error) {
    std::vector<Line> old_lines;
    std::vector<Line> new_lines;
    if (!read_lines(context.old_path, context, old_lines, error)) return false;
    if (!read_lines(context.new_path, context, new_lines, error)) return false;

    result = compare_snapshots(old_lines, new_lines, context, registry);
    return true;
}

bool write_outputs(const RunContext& context, const RunResult& result, std::string& error) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::create_directories(context.output_dir, ec);
    if (ec) {
        error = fmt::format("cannot create output directory '{}': {}", context.output_dir, ec.message());
        return false;
    }

    fs::path dir(context.output_dir);

    if (!result.discarded_icaos.empty()) {
        if (!write_discarded((dir / "discarded_airports.txt").string(), result.discarded_icaos, error)) {
            return false;
        }
    }

    for (const auto& report : result.reports) {
        if (!write_report(context.output_dir, report, error)) {
            return false;
        }
    }

    return write_summary((dir / "summary.csv").string(), result.reports, error);
}

} // namespace arincdelta
