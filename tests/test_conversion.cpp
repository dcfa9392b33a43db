// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "iomap.h"
#include "iomapserialize.h"
#include "map.h"
#include "mapconverter.h"
#include "testutils.h"

#include <gtest/gtest.h>

using namespace otmapio::test;

class MapConverterTest : public ::testing::Test
{
protected:
	MapConverterTest()
	{
		fillItemDatabase(items);
		idMapper = IdMapper(items);
		context.items = &items;
		context.idMapper = &idMapper;
	}

	// writes a ServerID map with a waypoint and a few stacked items
	std::string writeSource(const std::string& name, uint16_t extraItem = TORCH)
	{
		Map map;
		map.header.width = 512;
		map.header.height = 512;
		map.header.majorVersionItems = 3;
		map.header.minorVersionItems = 57;

		Tile& tile = map.createTile(Position(260, 10, 7));
		tile.setGround(Item(GRASS));
		tile.addItem(Item(extraItem));

		Item coins(GOLD_COIN);
		coins.setSubType(100);
		tile.addItem(std::move(coins));

		map.waypoints["depot"] = Position(260, 10, 7);

		MapSaveContext saveContext;
		saveContext.format = MapFormat::forVersion(OTBM_VERSION_4);
		saveContext.items = &items;

		const std::string fileName = dir.file(name);
		const MapSaveReport report = IOMapSerialize::saveMap(map, fileName, saveContext);
		EXPECT_TRUE(report.success) << report.errorMessage;
		return fileName;
	}

	TemporaryDirectory dir;
	ItemDatabase items;
	IdMapper idMapper;
	MapLoadContext context;
};

TEST_F(MapConverterTest, ServerIdMapToClientIdVersion)
{
	const std::string source = writeSource("source.otbm");
	const std::string destination = dir.file("converted.otbm");

	const ConversionReport report =
	    MapConverter::convert(source, destination, MapFormat::forVersion(OTBM_VERSION_6), context);
	ASSERT_TRUE(report.success) << report.save.errorMessage;
	EXPECT_TRUE(report.load.success);
	EXPECT_EQ(report.save.tiles, 1u);
	EXPECT_EQ(report.save.items, 3u);

	MapLoadResult original = IOMap::loadMap(source, context);
	MapLoadResult converted = IOMap::loadMap(destination, context);
	ASSERT_TRUE(converted.report.success) << converted.report.errorMessage;
	EXPECT_EQ(converted.report.format.otbmVersion, OTBM_VERSION_6);
	EXPECT_TRUE(converted.report.format.usesClientId);
	EXPECT_EQ(converted.map->header.otbmVersion, OTBM_VERSION_6);
	EXPECT_EQ(converted.map->getTiles(), original.map->getTiles());
	EXPECT_EQ(converted.map->waypoints, original.map->waypoints);
}

TEST_F(MapConverterTest, DowngradeDropsWaypoints)
{
	const std::string source = writeSource("source.otbm");
	const std::string destination = dir.file("old.otbm");

	const ConversionReport report =
	    MapConverter::convert(source, destination, MapFormat::forVersion(OTBM_VERSION_2), context);
	ASSERT_TRUE(report.success) << report.save.errorMessage;
	ASSERT_EQ(report.save.warnings.size(), 1u);
	EXPECT_EQ(report.save.warnings.front().code, MAPWARNING_WAYPOINTS_DROPPED);

	MapLoadResult converted = IOMap::loadMap(destination, context);
	ASSERT_TRUE(converted.report.success) << converted.report.errorMessage;
	EXPECT_TRUE(converted.map->waypoints.empty());
	EXPECT_EQ(converted.map->getTileCount(), 1u);
}

TEST_F(MapConverterTest, UnmappableItemsAbortTheConversion)
{
	const std::string source = writeSource("source.otbm", SERVER_ONLY);
	const std::string destination = dir.write("converted.otbm", "keep me");

	const ConversionReport report =
	    MapConverter::convert(source, destination, MapFormat::forVersion(OTBM_VERSION_7), context);
	EXPECT_FALSE(report.success);
	EXPECT_TRUE(report.load.success);
	EXPECT_EQ(report.save.error, MAPIO_ERROR_UNMAPPABLE_ID);
	EXPECT_EQ(report.save.offendingIds, std::vector<uint16_t>{SERVER_ONLY});
	EXPECT_EQ(report.save.offendingPositions, std::vector<Position>{Position(260, 10, 7)});
	EXPECT_EQ(readFile(destination), "keep me");
}

TEST_F(MapConverterTest, UnreadableSourceIsReported)
{
	const std::string source = dir.write("broken.otbm", std::string("OTBM\xFE\x00\x02", 7));
	const std::string destination = dir.file("converted.otbm");

	const ConversionReport report =
	    MapConverter::convert(source, destination, MapFormat::forVersion(OTBM_VERSION_3), context);
	EXPECT_FALSE(report.success);
	EXPECT_FALSE(report.load.success);
	EXPECT_EQ(report.load.error, MAPIO_ERROR_STRUCTURAL_CORRUPTION);
	EXPECT_EQ(report.save.error, MAPIO_ERROR_STRUCTURAL_CORRUPTION);
	EXPECT_FALSE(std::filesystem::exists(destination));
}
