/**
 * Voidrat - World State Parser Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "model/SolarNodes.hpp"
#include "parsers/WorldStateParser.hpp"

using namespace voidrat;

namespace {

const char* NODES = R"({
    "SolNode401": {"value": "Hepit (Void)", "enemy": "Corrupted", "type": "Capture"},
    "SolNode64": {"value": "Ur (Uranus)", "enemy": "Grineer", "type": "Disruption"},
    "CrewBattleNode501": {"value": "Bendar Cluster (Earth Proxima)", "enemy": "Grineer", "type": "Skirmish"}
})";

const char* WORLD_STATE = R"({
    "ActiveMissions": [
        {
            "Activation": {"$date": {"$numberLong": "1700000000000"}},
            "Expiry": {"$date": {"$numberLong": "1700003600000"}},
            "Node": "SolNode64",
            "MissionType": "MT_ARTIFACT",
            "Modifier": "VoidT4",
            "Hard": true
        },
        {
            "Activation": {"$date": {"$numberLong": 1700000100000}},
            "Expiry": {"$date": {"$numberLong": "1700001000000"}},
            "Node": "SolNode401",
            "MissionType": "MT_CAPTURE",
            "Modifier": "VoidT1"
        }
    ],
    "VoidStorms": [
        {
            "Activation": {"$date": {"$numberLong": "1700000200000"}},
            "Expiry": {"$date": {"$numberLong": "1700005000000"}},
            "Node": "CrewBattleNode501",
            "ActiveMissionTier": "VoidT2"
        }
    ],
    "SyndicateMissions": [
        {"Tag": "ArbitersSyndicate", "Expiry": {"$date": {"$numberLong": "1700009000000"}}},
        {"Tag": "CetusSyndicate", "Expiry": {"$date": {"$numberLong": "1700008000000"}}}
    ],
    "Invasions": [
        {
            "Activation": {"$date": {"$numberLong": "1699990000000"}},
            "Node": "SolNode64",
            "Completed": false,
            "AttackerReward": {"countedItems": [
                {"ItemType": "/Lotus/Types/Recipes/Components/FormaBlueprint", "ItemCount": 1}
            ]},
            "DefenderReward": {"countedItems": [
                {"ItemType": "/Lotus/Types/Items/Research/EnergyComponent", "ItemCount": 3}
            ]}
        },
        {
            "Activation": {"$date": {"$numberLong": "1699980000000"}},
            "Node": "SolNode401",
            "Completed": true,
            "AttackerReward": [],
            "DefenderReward": []
        },
        {
            "Activation": {"$date": {"$numberLong": "1699995000000"}},
            "Node": "SolNode401",
            "Completed": false,
            "AttackerReward": [],
            "DefenderReward": {"countedItems": [
                {"ItemType": "/Lotus/Types/Items/Research/BioComponent", "ItemCount": "2"}
            ]}
        }
    ]
})";

class WorldStateParserTest : public ::testing::Test {
protected:
    WorldStateParserTest()
        : nodes(SolarNodes::fromJson(NODES))
        , parser(nodes)
    {
    }

    SolarNodes nodes;
    WorldStateParser parser;
};

} // anonymous namespace

TEST_F(WorldStateParserTest, ParsesFissuresAndStormsSortedByTier) {
    auto fissures = parser.parseFissures(WORLD_STATE);
    ASSERT_EQ(fissures.size(), 3u);

    const auto& lith = fissures[0];
    EXPECT_EQ(lith.tier, FissureTier::Lith);
    EXPECT_EQ(lith.node.value, "Hepit (Void)");
    EXPECT_EQ(lith.mission, "Capture");
    EXPECT_FALSE(lith.isStorm);
    EXPECT_FALSE(lith.hard);
    ASSERT_TRUE(lith.activation.has_value());
    EXPECT_EQ(toEpochSeconds(*lith.activation), 1700000100);
    EXPECT_EQ(toEpochSeconds(lith.expiry), 1700001000);

    const auto& storm = fissures[1];
    EXPECT_EQ(storm.tier, FissureTier::Meso);
    EXPECT_TRUE(storm.isStorm);
    EXPECT_EQ(storm.mission, "Skirmish");
    EXPECT_EQ(storm.node.value, "Bendar Cluster (Earth Proxima)");

    const auto& axi = fissures[2];
    EXPECT_EQ(axi.tier, FissureTier::Axi);
    EXPECT_EQ(axi.mission, "Disruption");
    EXPECT_TRUE(axi.hard);
}

TEST_F(WorldStateParserTest, UnknownNodesAndModifiersAreTolerated) {
    auto fissures = parser.parseFissures(R"({
        "ActiveMissions": [{
            "Activation": {"$date": {"$numberLong": "1700000000000"}},
            "Expiry": {"$date": {"$numberLong": "1700003600000"}},
            "Node": "SolNode12345",
            "MissionType": "MT_NEW_THING",
            "Modifier": "VoidT9"
        }],
        "VoidStorms": [{
            "Activation": {"$date": {"$numberLong": "1700000000000"}},
            "Expiry": {"$date": {"$numberLong": "1700003600000"}},
            "Node": "CrewBattleNode999",
            "ActiveMissionTier": "VoidT3"
        }]
    })");

    ASSERT_EQ(fissures.size(), 2u);
    EXPECT_EQ(fissures[0].tier, FissureTier::Unknown);
    EXPECT_TRUE(fissures[0].node.isUnknown());
    EXPECT_EQ(fissures[0].mission, "Unknown");
    EXPECT_EQ(fissures[1].mission, "Unknown");
    EXPECT_TRUE(fissures[1].isStorm);
}

TEST_F(WorldStateParserTest, FissuresRequireBothArrays) {
    EXPECT_THROW(parser.parseFissures(R"({"ActiveMissions": []})"), ParseError);
    EXPECT_THROW(parser.parseFissures(R"({"ActiveMissions": {}, "VoidStorms": []})"), ParseError);
    EXPECT_THROW(parser.parseFissures("not json"), ParseError);
    EXPECT_TRUE(parser.parseFissures(R"({"ActiveMissions": [], "VoidStorms": []})").empty());
}

TEST_F(WorldStateParserTest, MissingDateFailsTheWholeParse) {
    EXPECT_THROW(parser.parseFissures(R"({
        "ActiveMissions": [{
            "Activation": {"$date": {"$numberLong": "1700000000000"}},
            "Node": "SolNode401"
        }],
        "VoidStorms": []
    })"), ParseError);

    EXPECT_THROW(parser.parseFissures(R"({
        "ActiveMissions": [{
            "Activation": {"$date": {"$numberLong": "soon"}},
            "Expiry": {"$date": {"$numberLong": "1700003600000"}},
            "Node": "SolNode401"
        }],
        "VoidStorms": []
    })"), ParseError);
}

TEST_F(WorldStateParserTest, CetusExpiryIsTakenVerbatim) {
    auto cycle = parser.parseCetusCycle(WORLD_STATE);
    EXPECT_EQ(toEpochSeconds(cycle.expiry), 1700008000);
}

TEST_F(WorldStateParserTest, CetusRequiresTheSyndicateEntry) {
    EXPECT_THROW(parser.parseCetusCycle(R"({"SyndicateMissions": [
        {"Tag": "ArbitersSyndicate", "Expiry": {"$date": {"$numberLong": "1700009000000"}}}
    ]})"), ParseError);
    EXPECT_THROW(parser.parseCetusCycle("{}"), ParseError);
}

TEST_F(WorldStateParserTest, ParsesOngoingInvasionsOnly) {
    auto invasions = parser.parseInvasions(WORLD_STATE);
    ASSERT_EQ(invasions.size(), 2u);

    const auto& first = invasions[0];
    EXPECT_EQ(toEpochSeconds(first.activation), 1699990000);
    EXPECT_EQ(first.node.value, "Ur (Uranus)");
    ASSERT_EQ(first.rewards.attacker.size(), 1u);
    EXPECT_EQ(first.rewards.attacker[0].item, "Forma Blueprint");
    ASSERT_EQ(first.rewards.defender.size(), 1u);
    EXPECT_EQ(first.rewards.defender[0].quantity, 3u);
    EXPECT_EQ(first.rewards.allRewardsString(), "Forma Blueprint, 3 Fieldron");

    const auto& second = invasions[1];
    EXPECT_TRUE(second.rewards.attacker.empty());
    EXPECT_EQ(second.rewards.allRewardsString(), "2 Mutagen Mass");
}

TEST_F(WorldStateParserTest, InvasionsRequireCompletedFlag) {
    EXPECT_THROW(parser.parseInvasions(R"({"Invasions": [{
        "Activation": {"$date": {"$numberLong": "1699990000000"}},
        "Node": "SolNode64"
    }]})"), ParseError);
    EXPECT_THROW(parser.parseInvasions(R"({"Invasions": "none"})"), ParseError);
}

TEST_F(WorldStateParserTest, RejectsTimestampsOutOfRange) {
    EXPECT_THROW(parser.parseFissures(R"({
        "ActiveMissions": [{
            "Activation": {"$date": {"$numberLong": "1700000000000"}},
            "Expiry": {"$date": {"$numberLong": "253402300799000"}},
            "Node": "SolNode401"
        }],
        "VoidStorms": []
    })"), ParseError);

    EXPECT_THROW(parser.parseCetusCycle(R"({
        "SyndicateMissions": [
            {"Tag": "CetusSyndicate", "Expiry": {"$date": {"$numberLong": "99999999999999"}}}
        ]
    })"), ParseError);

    EXPECT_THROW(parser.parseInvasions(R"({
        "Invasions": [{
            "Activation": {"$date": {"$numberLong": -5}},
            "Node": "SolNode401",
            "Completed": false
        }]
    })"), ParseError);
}

TEST_F(WorldStateParserTest, RejectsFissuresExpiringBeforeActivation) {
    EXPECT_THROW(parser.parseFissures(R"({
        "ActiveMissions": [{
            "Activation": {"$date": {"$numberLong": "1700003600000"}},
            "Expiry": {"$date": {"$numberLong": "1700000000000"}},
            "Node": "SolNode401",
            "Modifier": "VoidT1"
        }],
        "VoidStorms": []
    })"), ParseError);

    EXPECT_THROW(parser.parseFissures(R"({
        "ActiveMissions": [],
        "VoidStorms": [{
            "Activation": {"$date": {"$numberLong": "1700000000000"}},
            "Expiry": {"$date": {"$numberLong": "1700000000000"}},
            "Node": "CrewBattleNode501",
            "ActiveMissionTier": "VoidT2"
        }]
    })"), ParseError);
}
