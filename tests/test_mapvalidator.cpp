// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "map.h"
#include "mapvalidator.h"
#include "testutils.h"

#include <gtest/gtest.h>

using namespace otmapio::test;

class MapValidatorTest : public ::testing::Test
{
protected:
	MapValidatorTest()
	{
		fillItemDatabase(items);

		map.header.width = 256;
		map.header.height = 256;

		map.createTile(Position(100, 100, 7)).setGround(Item(GRASS));
		map.createTile(Position(101, 100, 7)).setGround(Item(GRASS));

		Town thais(1);
		thais.setName("Thais");
		thais.setTemplePos(Position(100, 100, 7));
		map.towns.addTown(1, thais);

		House& house = map.houses.addHouse(5);
		house.setName("Market Street 1");
		house.setTownId(1);
		house.setEntryPos(Position(100, 100, 7));
		map.addHouseTile(5, Position(101, 100, 7));

		map.waypoints["temple"] = Position(100, 100, 7);

		SpawnArea spawn(Position(100, 100, 7), 2);
		spawn.addCreature("Rat", 1, 1, 60);
		map.spawns.push_back(spawn);
	}

	ValidationResult validate() const { return MapValidator::validate(map, &items); }

	ItemDatabase items;
	Map map;
};

TEST_F(MapValidatorTest, ConsistentMapHasNoIssues)
{
	const ValidationResult result = validate();
	EXPECT_TRUE(result.getIssues().empty());
	EXPECT_FALSE(result.hasErrors());
}

TEST_F(MapValidatorTest, ZeroDimensionsAreAnError)
{
	map.header.width = 0;

	const ValidationResult result = validate();
	EXPECT_TRUE(result.hasIssue(VALIDATION_MAP_DIMENSIONS_INVALID));
	EXPECT_TRUE(result.hasErrors());
}

TEST_F(MapValidatorTest, TilesOutsideTheMapAreReportedOnce)
{
	map.createTile(Position(300, 10, 7));
	map.createTile(Position(10, 300, 7));

	const ValidationResult result = validate();
	const auto& issues = result.getIssues();
	ASSERT_EQ(std::count_if(issues.begin(), issues.end(),
	                        [](const ValidationIssue& issue) { return issue.code == VALIDATION_TILE_OUT_OF_BOUNDS; }),
	          1);

	const auto it = std::find_if(issues.begin(), issues.end(), [](const ValidationIssue& issue) {
		return issue.code == VALIDATION_TILE_OUT_OF_BOUNDS;
	});
	EXPECT_EQ(it->severity, VALIDATION_ERROR);
	ASSERT_TRUE(it->position);
	EXPECT_EQ(*it->position, Position(300, 10, 7));
}

TEST_F(MapValidatorTest, DanglingHouseReference)
{
	map.createTile(Position(120, 120, 7)).setHouseId(99);

	const ValidationResult result = validate();
	EXPECT_TRUE(result.hasIssue(VALIDATION_HOUSE_ID_MISSING));
	EXPECT_EQ(result.getErrorCount(), 1u);
}

TEST_F(MapValidatorTest, HouseMembershipMustAgree)
{
	map.houses.getHouse(5)->addTile(Position(100, 100, 7));
	map.createTile(Position(102, 100, 7)).setHouseId(5);

	const ValidationResult result = validate();
	EXPECT_TRUE(result.hasIssue(VALIDATION_HOUSE_TILE_MISMATCH));
	EXPECT_EQ(result.getErrorCount(), 2u);
}

TEST_F(MapValidatorTest, HouseReferenceWarnings)
{
	House& unused = map.houses.addHouse(6);
	unused.setTownId(42);
	unused.setEntryPos(Position(500, 500, 7));

	House& closed = map.houses.addHouse(7);
	closed.setEntryPos(Position(200, 200, 7));
	map.addHouseTile(7, Position(201, 200, 7));

	const ValidationResult result = validate();
	EXPECT_TRUE(result.hasIssue(VALIDATION_HOUSE_UNUSED));
	EXPECT_TRUE(result.hasIssue(VALIDATION_HOUSE_TOWN_MISSING));
	EXPECT_TRUE(result.hasIssue(VALIDATION_HOUSE_ENTRY_OUT_OF_BOUNDS));
	EXPECT_TRUE(result.hasIssue(VALIDATION_HOUSE_ENTRY_MISSING_TILE));
	EXPECT_FALSE(result.hasErrors());
	EXPECT_EQ(result.getWarningCount(), 4u);
}

TEST_F(MapValidatorTest, TownChecks)
{
	Town nowhere(2);
	nowhere.setName("Nowhere");
	nowhere.setTemplePos(Position(1000, 1000, 7));
	map.towns.addTown(2, nowhere);

	Town unnamed;
	unnamed.setName("Unnamed");
	unnamed.setTemplePos(Position(10, 10, 7));
	map.towns.addTown(0, unnamed);

	const ValidationResult result = validate();
	EXPECT_TRUE(result.hasIssue(VALIDATION_TOWN_TEMPLE_OUT_OF_BOUNDS));
	EXPECT_TRUE(result.hasIssue(VALIDATION_TOWN_ID_INVALID));
	EXPECT_EQ(result.getErrorCount(), 2u);
}

TEST_F(MapValidatorTest, WaypointAndSpawnChecks)
{
	map.waypoints[""] = Position(10, 10, 7);
	map.waypoints["far away"] = Position(10, 10, 16);

	SpawnArea lost(Position(900, 10, 7), 0);
	lost.addCreature("", 0, 0, 60);
	map.spawns.push_back(lost);

	const ValidationResult result = validate();
	EXPECT_TRUE(result.hasIssue(VALIDATION_WAYPOINT_EMPTY_NAME));
	EXPECT_TRUE(result.hasIssue(VALIDATION_WAYPOINT_OUT_OF_BOUNDS));
	EXPECT_TRUE(result.hasIssue(VALIDATION_SPAWN_OUT_OF_BOUNDS));
	EXPECT_TRUE(result.hasIssue(VALIDATION_SPAWN_RADIUS_INVALID));
	EXPECT_TRUE(result.hasIssue(VALIDATION_SPAWN_EMPTY_NAME));
	EXPECT_EQ(result.getErrorCount(), 1u);
}

TEST_F(MapValidatorTest, ItemChecks)
{
	Tile* tile = map.getTile(Position(100, 100, 7));
	ASSERT_NE(tile, nullptr);

	Item chest(CHEST);
	Item placeholder;
	placeholder.setPlaceholder(4242, true);
	chest.addItem(std::move(placeholder));
	tile->addItem(std::move(chest));
	tile->addItem(Item(9999));
	tile->addItem(Item(9999));

	ValidationResult result = validate();
	EXPECT_TRUE(result.hasIssue(VALIDATION_ITEM_PLACEHOLDER));
	EXPECT_TRUE(result.hasIssue(VALIDATION_ITEM_UNKNOWN));
	EXPECT_EQ(result.getErrorCount(), 1u);
	EXPECT_EQ(result.getWarningCount(), 1u);

	// without an item database only placeholders are reported
	result = MapValidator::validate(map);
	EXPECT_FALSE(result.hasIssue(VALIDATION_ITEM_UNKNOWN));
	EXPECT_TRUE(result.hasIssue(VALIDATION_ITEM_PLACEHOLDER));
}

TEST_F(MapValidatorTest, MapIsNotModified)
{
	map.createTile(Position(120, 120, 7)).setHouseId(99);
	const Map copy = map;

	validate();
	EXPECT_TRUE(map == copy);
}
