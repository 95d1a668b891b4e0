#include <gtest/gtest.h>
#include <arincdelta/config.hpp>
#include <arincdelta/projection.hpp>
#include <arincdelta/registry.hpp>
#include <arincdelta/report.hpp>
#include "line_builder.hpp"

#include <algorithm>

using namespace arincdelta;

class ProjectionTest : public ::testing::Test {
protected:
    const RecordSchema& schema(std::string_view code) { return *registry.get(code); }

    SchemaRegistry registry = make_default_registry();
};

TEST_F(ProjectionTest, HeaderAddsContinuationTriplets) {
    std::vector<FieldColumn> fields = {{"a", ColumnRange{1, 2}}, {"raw", std::nullopt}};
    ContinuationSet conts = {"10", "2"};

    Header header = build_header(fields, conts);
    EXPECT_EQ(header, (Header{
        "a", "raw",
        "cont#2_appl_code", "cont#2_appl_label", "cont#2_1_123",
        "cont#10_appl_code", "cont#10_appl_label", "cont#10_1_123",
    }));

    Header mod = modified_header(header);
    ASSERT_EQ(mod.size(), header.size() + 2);
    EXPECT_EQ(mod[mod.size() - 2], "changed_field_count");
    EXPECT_EQ(mod.back(), "changed_fields");
}

TEST_F(ProjectionTest, RowFromPrimaryAndContinuation) {
    Line primary = runway_line("LTAC", "RW03R", "09000");
    Line cont = runway_continuation("LTAC", "RW03R", "2", "A");
    EntityMap entities = combine({primary, cont}, registry);

    const RecordSchema& pg = schema("PG");
    Header header = build_header(pg.fields(), entities.continuation_numbers());
    Row row = build_row(*entities.begin(), pg, header);

    EXPECT_EQ(row["icao"], "LTAC");
    EXPECT_EQ(row["runway_id"], "RW03R");
    EXPECT_EQ(row["rwy_length_ft"], "09000");
    EXPECT_EQ(row["area_code"], "EUR");
    EXPECT_EQ(row["primary_1_123"], primary.substr(0, 123));
    EXPECT_EQ(row["cont#2_appl_code"], "A");
    EXPECT_EQ(row["cont#2_appl_label"], "Notes or formatted data continuation");
    EXPECT_EQ(row["cont#2_1_123"], cont.substr(0, 123));
    EXPECT_EQ(row.size(), header.size());
}

TEST_F(ProjectionTest, ContinuationOnlyUsesFirstContinuationAsReference) {
    Line cont3 = runway_continuation("LTAC", "RW03R", "3", "T");
    Line cont2 = runway_continuation("LTAC", "RW03R", "2", "A");
    EntityMap entities = combine({cont3, cont2}, registry);

    const RecordSchema& pg = schema("PG");
    Header header = build_header(pg.fields(), entities.continuation_numbers());
    Row row = build_row(*entities.begin(), pg, header);

    // Schema fields come from continuation "2", including the raw payload field
    EXPECT_EQ(row["rwy_length_ft"], "A");
    EXPECT_EQ(row["primary_1_123"], cont2.substr(0, 123));
    EXPECT_EQ(row["cont#3_appl_code"], "T");
}

TEST_F(ProjectionTest, MissingContinuationDefaultsToEmpty) {
    EntityMap entities = combine({runway_line("LTAC", "RW03R")}, registry);
    const RecordSchema& pg = schema("PG");
    Header header = build_header(pg.fields(), {"2"});
    Row row = build_row(*entities.begin(), pg, header);

    EXPECT_EQ(row.at("cont#2_appl_code"), "");
    EXPECT_EQ(row.at("cont#2_1_123"), "");
}

TEST_F(ProjectionTest, EmptyEntityProjectsEmptyRow) {
    Entity entity;
    const RecordSchema& pg = schema("PG");
    Header header = build_header(pg.fields(), {});
    Row row = build_row(entity, pg, header);

    ASSERT_EQ(row.size(), header.size());
    for (const auto& [name, value] : row) {
        EXPECT_EQ(value, "") << name;
    }
}

TEST_F(ProjectionTest, PostprocessRunsAfterExtraction) {
    Line primary = runway_line("LTAC", "RW03R");
    primary.replace(81, 4, "IACX");  // columns 82..85
    EntityMap entities = combine({primary}, registry);

    const RecordSchema& pg = schema("PG");
    Row row = build_row(*entities.begin(), pg, build_header(pg.fields(), {}));
    EXPECT_EQ(row["loc_mls_gls_ident"], "IACX");
}

TEST_F(ProjectionTest, TypeReportTables) {
    EntityMap old_entities = combine({
        runway_line("LTAC", "RW03R", "09000"),
        runway_line("LTBA", "RW05"),
    }, registry);
    EntityMap new_entities = combine({
        runway_line("LTAC", "RW03R", "09500"),
        runway_line("LTFM", "RW35L"),
    }, registry);

    RunContext ctx;
    TypeReport report = build_type_report(schema("PG"), old_entities, new_entities, ctx);

    EXPECT_EQ(report.type_code, "PG");
    EXPECT_EQ(report.counts.current, 2u);
    EXPECT_EQ(report.counts.added, 1u);
    EXPECT_EQ(report.counts.removed, 1u);
    EXPECT_EQ(report.counts.modified, 1u);
    EXPECT_TRUE(report.stale_tables.empty());

    const Table* modified = report.find_table("modified_PG");
    ASSERT_NE(modified, nullptr);
    ASSERT_EQ(modified->rows.size(), 1u);
    EXPECT_EQ(modified->header.back(), "changed_fields");
    EXPECT_EQ(modified->rows[0].at("changed_field_count"), "1");
    EXPECT_EQ(modified->rows[0].at("changed_fields"), "rwy_length_ft");
    EXPECT_EQ(modified->rows[0].at("rwy_length_ft"), "09500");

    ASSERT_NE(report.find_table("current_PG"), nullptr);
    ASSERT_NE(report.find_table("added_PG"), nullptr);
    EXPECT_EQ(report.find_table("removed_PG")->rows[0].at("icao"), "LTBA");
}

TEST_F(ProjectionTest, SupersedeMarksStale) {
    TypeReport report;
    report.tables.push_back({"current_XX", {}, {}});
    report.supersede("current_XX");
    report.supersede("current_XX");
    EXPECT_EQ(report.find_table("current_XX"), nullptr);
    EXPECT_EQ(report.stale_tables, (std::vector<std::string>{"current_XX"}));
}

// ---------------------------------------------------------------------------
// DV extra views
// ---------------------------------------------------------------------------

class NavaidViewTest : public ProjectionTest {
protected:
    static std::string navaid(std::string_view ident, std::string_view cls, char flag, std::string_view freq = "10970") {
        LineBuilder b = record_line("D", " ", "LTAC", ident);
        b.at(22, "0").at(23, freq).at(28, cls);
        std::string line = b;
        line[28] = flag;  // 0-based offset 28 of the payload
        return line;
    }

    TypeReport report(bool region_requested) {
        EntityMap old_entities = combine({
            navaid("IAN", "I  D", 'I', "10970"),
            navaid("ESB", "VD  ", 'D'),
        }, registry);
        EntityMap new_entities = combine({
            navaid("IAN", "I  D", 'I', "11010"),
            navaid("ESB", "VD  ", 'D', "11100"),
            navaid("NDB", "HW  ", 'W'),
        }, registry);

        RunContext ctx;
        ctx.region_requested = region_requested;
        return build_type_report(schema("DV"), old_entities, new_entities, ctx);
    }
};

TEST_F(NavaidViewTest, DefaultTablesSuperseded) {
    TypeReport r = report(true);
    for (auto prefix : SLICE_PREFIXES) {
        std::string name = table_name(prefix, "DV");
        EXPECT_EQ(r.find_table(name), nullptr) << name;
        EXPECT_NE(std::find(r.stale_tables.begin(), r.stale_tables.end(), name), r.stale_tables.end());
    }
    EXPECT_EQ(r.counts.current, 3u);
    EXPECT_EQ(r.counts.modified, 2u);
}

TEST_F(NavaidViewTest, IlsDmeSubset) {
    TypeReport r = report(false);
    const Table* current = r.find_table("current_dv_ils_dme");
    ASSERT_NE(current, nullptr);
    ASSERT_EQ(current->rows.size(), 1u);
    EXPECT_EQ(current->rows[0].at("ils_ident"), "IAN");

    const Table* modified = r.find_table("modified_dv_ils_dme");
    ASSERT_NE(modified, nullptr);
    ASSERT_EQ(modified->rows.size(), 1u);
    EXPECT_EQ(modified->rows[0].at("changed_fields"), "vor_frequency");
}

TEST_F(NavaidViewTest, VorSubsetRenamesIdent) {
    TypeReport r = report(true);
    const Table* current = r.find_table("current_dv_vor");
    ASSERT_NE(current, nullptr);
    ASSERT_EQ(current->rows.size(), 1u);
    EXPECT_EQ(current->rows[0].at("vor_ident"), "ESB");
    EXPECT_EQ(current->rows[0].count("ils_ident"), 0u);
    EXPECT_NE(std::find(current->header.begin(), current->header.end(), "vor_ident"), current->header.end());
    EXPECT_EQ(std::find(current->header.begin(), current->header.end(), "ils_ident"), current->header.end());

    const Table* modified = r.find_table("modified_dv_vor");
    ASSERT_NE(modified, nullptr);
    ASSERT_EQ(modified->rows.size(), 1u);
    EXPECT_EQ(modified->rows[0].at("changed_fields"), "vor_frequency");
}

TEST_F(NavaidViewTest, VorSubsetOnlyForRegionRuns) {
    TypeReport r = report(false);
    for (auto prefix : SLICE_PREFIXES) {
        std::string name = table_name(prefix, "dv_vor");
        EXPECT_EQ(r.find_table(name), nullptr);
        EXPECT_NE(std::find(r.stale_tables.begin(), r.stale_tables.end(), name), r.stale_tables.end());
    }
}
