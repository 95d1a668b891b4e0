#include <gtest/gtest.h>
#include <arincdelta/group.hpp>
#include <arincdelta/record.hpp>
#include <arincdelta/registry.hpp>
#include "line_builder.hpp"

using namespace arincdelta;

class GroupTest : public ::testing::Test {
protected:
    SchemaRegistry registry = make_default_registry();
};

TEST_F(GroupTest, EntityKeyIsTypeAndIdentifier) {
    Line line = runway_line("LTAC", "RW03R");
    EntityKey key = entity_key(line);
    EXPECT_EQ(key.type_code, "PG");
    EXPECT_EQ(key.ident, line.substr(0, 21));
}

TEST_F(GroupTest, PrimaryAndContinuationsShareEntity) {
    std::vector<Line> lines = {
        runway_line("LTAC", "RW03R"),
        runway_continuation("LTAC", "RW03R", "2", "A"),
        runway_line("LTAC", "RW21L"),
    };

    EntityMap entities = combine(lines, registry);
    ASSERT_EQ(entities.size(), 2u);

    const Entity* e = entities.find(entity_key(lines[0]));
    ASSERT_NE(e, nullptr);
    EXPECT_TRUE(e->has_primary());
    EXPECT_EQ(*e->primary, lines[0]);
    ASSERT_EQ(e->continuations.size(), 1u);
    EXPECT_EQ(e->continuations.at("2").application_type, "A");
    EXPECT_EQ(e->continuations.at("2").line, lines[1]);
    EXPECT_EQ(e->type, TypeTuple("P", "G"));
}

TEST_F(GroupTest, FirstPrimaryWins) {
    std::vector<Line> lines = {
        runway_line("LTAC", "RW03R", "09000"),
        runway_line("LTAC", "RW03R", "09500"),
    };

    EntityMap entities = combine(lines, registry);
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(*entities.begin()->primary, lines[0]);
}

TEST_F(GroupTest, LastContinuationWins) {
    std::vector<Line> lines = {
        runway_continuation("LTAC", "RW03R", "2", "A", "FIRST"),
        runway_continuation("LTAC", "RW03R", "2", "T", "SECOND"),
    };

    EntityMap entities = combine(lines, registry);
    const Entity& e = *entities.begin();
    ASSERT_EQ(e.continuations.size(), 1u);
    EXPECT_EQ(e.continuations.at("2").line, lines[1]);
    EXPECT_EQ(e.continuations.at("2").application_type, "T");
    EXPECT_FALSE(e.has_primary());
    EXPECT_EQ(e.sample, lines[0]);
    EXPECT_EQ(e.reference_line(), lines[0]);
}

TEST_F(GroupTest, RepeatedLineIsIdempotent) {
    Line primary = runway_line("LTAC", "RW03R");
    Line cont = runway_continuation("LTAC", "RW03R", "3", "N");
    std::vector<Line> lines = {primary, cont, primary, cont};

    EntityMap entities = combine(lines, registry);
    ASSERT_EQ(entities.size(), 1u);
    const Entity& e = *entities.begin();
    EXPECT_EQ(*e.primary, primary);
    EXPECT_EQ(e.continuations.size(), 1u);
}

TEST_F(GroupTest, ContinuationOrderIsLengthThenValue) {
    ContinuationMap conts;
    conts["10"] = Continuation{"x", "A"};
    conts["2"] = Continuation{"y", "A"};
    conts["3"] = Continuation{"z", "A"};

    std::vector<std::string> order;
    for (const auto& [cno, _] : conts) order.push_back(cno);
    EXPECT_EQ(order, (std::vector<std::string>{"2", "3", "10"}));
}

TEST_F(GroupTest, ContinuationColumnFollowsType) {
    // PV carries its continuation number in column 26
    Line primary = record_line("P", "V", "LTAC", "TWR").at(26, "0");
    Line cont = record_line("P", "V", "LTAC", "TWR").at(22, "5").at(26, "2").at(27, "c");

    EntityMap entities = combine({primary, cont}, registry);
    ASSERT_EQ(entities.size(), 1u);
    const Entity& e = *entities.begin();
    EXPECT_TRUE(e.has_primary());
    ASSERT_EQ(e.continuations.count("2"), 1u);
    EXPECT_EQ(e.continuations.at("2").application_type, "C");
}

TEST_F(GroupTest, KeysAreSortedAndOrderIsFirstSeen) {
    std::vector<Line> lines = {
        runway_line("LTFM", "RW35L"),
        runway_line("LTAC", "RW03R"),
    };

    EntityMap entities = combine(lines, registry);
    auto keys = entities.keys();
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_LT(keys[0], keys[1]);
    EXPECT_EQ(record::icao(entities.begin()->reference_line()), "LTFM");
}

TEST_F(GroupTest, OrphanIcaoDetected) {
    std::vector<Line> lines = {
        runway_continuation("LTAC", "LOC01", "2", "A"),
        runway_line("LTFM", "RW35L"),
        runway_continuation("LTFM", "RW35L", "2", "A"),
    };

    auto orphans = find_orphan_icaos(lines, registry);
    EXPECT_EQ(orphans, (std::set<std::string>{"LTAC"}));
}

TEST_F(GroupTest, PrimaryElsewhereInAirportPreventsOrphan) {
    // A continuation-only entity is fine if another entity of the airport has a primary
    std::vector<Line> lines = {
        runway_continuation("LTAC", "RW03R", "2", "A"),
        runway_line("LTAC", "RW21L"),
    };

    EXPECT_TRUE(find_orphan_icaos(lines, registry).empty());
}

TEST_F(GroupTest, BlankIcaoIsNeverOrphaned) {
    std::vector<Line> lines = {
        runway_continuation("    ", "RW03R", "2", "A"),
    };
    EXPECT_TRUE(find_orphan_icaos(lines, registry).empty());
}

TEST_F(GroupTest, DiscardIcaos) {
    std::vector<Line> lines = {
        runway_line("LTAC", "RW03R"),
        runway_line("LTFM", "RW35L"),
    };

    auto kept = discard_icaos(lines, {"LTAC"});
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(record::icao(kept[0]), "LTFM");
    EXPECT_EQ(discard_icaos(lines, {}).size(), 2u);
}
