// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "mapversion.h"
#include "testutils.h"

#include <gtest/gtest.h>

using namespace otmapio::test;

namespace {

ItemsOtbVersion itemsVersion(uint32_t major, uint32_t minor, const std::string& csd)
{
	ItemsOtbVersion version;
	version.majorVersion = major;
	version.minorVersion = minor;
	version.csdVersion = csd;
	return version;
}

FormatHint emptyHint()
{
	FormatHint hint;
	hint.dataDirectory.clear();
	return hint;
}

} // namespace

// ==================================================================
// client version from items.otb
// ==================================================================

TEST(MapVersionTest, ClientVersionFromDescriptor)
{
	EXPECT_EQ(getClientVersionFromItems(itemsVersion(3, 57, "OTB 3.57.62-12.90")), 1290u);
	EXPECT_EQ(getClientVersionFromItems(itemsVersion(3, 20, "OTB 3.20.1-8.60")), 860u);
	EXPECT_EQ(getClientVersionFromItems(itemsVersion(1, 1, "")), 740u);
	EXPECT_EQ(getClientVersionFromItems(itemsVersion(1, 2, "OTB 1.2")), 750u);
	EXPECT_EQ(getClientVersionFromItems(itemsVersion(2, 9, "custom build")), 0u);
}

// ==================================================================
// resolution order
// ==================================================================

TEST(MapVersionTest, HintOverridesHeader)
{
	FormatHint hint = emptyHint();
	hint.otbmVersion = OTBM_VERSION_2;

	const MapFormat format = resolveMapFormat(hint, uint32_t(OTBM_VERSION_6));
	EXPECT_EQ(format.otbmVersion, OTBM_VERSION_2);
	EXPECT_EQ(format.source, VERSION_SOURCE_HINT);
	EXPECT_FALSE(format.usesClientId);
}

TEST(MapVersionTest, HeaderOverridesItems)
{
	const ItemsOtbVersion items = itemsVersion(3, 65, "OTB 3.65.62-13.10");

	const MapFormat format = resolveMapFormat(emptyHint(), uint32_t(OTBM_VERSION_3), &items);
	EXPECT_EQ(format.otbmVersion, OTBM_VERSION_3);
	EXPECT_EQ(format.source, VERSION_SOURCE_HEADER);
	EXPECT_EQ(format.clientVersion, 1310u);
	EXPECT_FALSE(format.usesClientId);
	EXPECT_EQ(format.engine, MAP_ENGINE_CANARY);
}

TEST(MapVersionTest, ClientVersionHintWithoutHeader)
{
	FormatHint hint = emptyHint();
	hint.clientVersion = 1310;

	const MapFormat format = resolveMapFormat(hint, std::nullopt);
	EXPECT_EQ(format.otbmVersion, OTBM_VERSION_LAST);
	EXPECT_EQ(format.source, VERSION_SOURCE_HINT);
	EXPECT_TRUE(format.usesClientId);
	EXPECT_EQ(format.clientVersion, 1310u);
}

TEST(MapVersionTest, ItemsVersionWithoutHeader)
{
	const ItemsOtbVersion items = itemsVersion(3, 20, "OTB 3.20.1-8.60");

	const MapFormat format = resolveMapFormat(emptyHint(), std::nullopt, &items);
	EXPECT_EQ(format.otbmVersion, OTBM_VERSION_DEFAULT);
	EXPECT_EQ(format.source, VERSION_SOURCE_ITEMS_OTB);
	EXPECT_EQ(format.engine, MAP_ENGINE_TFS);
}

TEST(MapVersionTest, FallbackWithoutAnyInput)
{
	const MapFormat format = resolveMapFormat(emptyHint(), std::nullopt);
	EXPECT_EQ(format.otbmVersion, OTBM_VERSION_DEFAULT);
	EXPECT_EQ(format.source, VERSION_SOURCE_FALLBACK);
	EXPECT_EQ(format.engine, MAP_ENGINE_TFS);
	EXPECT_TRUE(format.itemsOtbPath.empty());
}

TEST(MapVersionTest, EngineHintWins)
{
	FormatHint hint = emptyHint();
	hint.engine = MAP_ENGINE_TFS;

	const MapFormat format = resolveMapFormat(hint, uint32_t(OTBM_VERSION_6));
	EXPECT_TRUE(format.usesClientId);
	EXPECT_EQ(format.engine, MAP_ENGINE_TFS);
}

TEST(MapVersionTest, ItemsFilesAreFoundPerEngine)
{
	TemporaryDirectory dir;
	std::filesystem::create_directories(dir.getPath() / "canary" / "items");
	dir.write("canary/items/items.otb", "");
	std::filesystem::create_directories(dir.getPath() / "items");
	dir.write("items/items.xml", "");

	FormatHint hint;
	hint.dataDirectory = dir.getPath().string();
	hint.engine = MAP_ENGINE_CANARY;

	MapFormat format = resolveMapFormat(hint, uint32_t(OTBM_VERSION_7));
	EXPECT_EQ(format.itemsOtbPath, dir.file("canary/items/items.otb"));
	EXPECT_EQ(format.itemsXmlPath, dir.file("items/items.xml"));

	hint.itemsOtbPath = "/custom/items.otb";
	format = resolveMapFormat(hint, uint32_t(OTBM_VERSION_7));
	EXPECT_EQ(format.itemsOtbPath, "/custom/items.otb");

	EXPECT_TRUE(findItemsFile(dir.file("nothing"), MAP_ENGINE_TFS, "items.otb").empty());
}

// ==================================================================
// feature gates
// ==================================================================

TEST(MapVersionTest, FeaturesFollowVersion)
{
	EXPECT_TRUE(MapFormat::forVersion(OTBM_VERSION_1).hasInlineSubType());
	EXPECT_FALSE(MapFormat::forVersion(OTBM_VERSION_2).hasInlineSubType());

	EXPECT_FALSE(MapFormat::forVersion(OTBM_VERSION_2).hasWaypoints());
	EXPECT_TRUE(MapFormat::forVersion(OTBM_VERSION_3).hasWaypoints());

	EXPECT_FALSE(MapFormat::forVersion(OTBM_VERSION_3).hasAttributeMap());
	EXPECT_TRUE(MapFormat::forVersion(OTBM_VERSION_4).hasAttributeMap());

	EXPECT_FALSE(MapFormat::forVersion(OTBM_VERSION_5).usesClientId);
	EXPECT_TRUE(MapFormat::forVersion(OTBM_VERSION_6).usesClientId);

	EXPECT_FALSE(MapFormat::forVersion(OTBM_VERSION_6).hasTileZones());
	EXPECT_TRUE(MapFormat::forVersion(OTBM_VERSION_7).hasTileZones());

	EXPECT_TRUE(MapFormat::forVersion(OTBM_VERSION_LAST).isSupported());
	EXPECT_FALSE(MapFormat::forVersion(OTBM_VERSION_LAST + 1).isSupported());
}

TEST(MapVersionTest, Names)
{
	EXPECT_EQ(getOTBMVersionName(OTBM_VERSION_6), "OTBM 6");
	EXPECT_EQ(parseMapEngine("OTServBR"), MAP_ENGINE_CANARY);
	EXPECT_EQ(parseMapEngine("forgottenserver"), MAP_ENGINE_TFS);
	EXPECT_EQ(parseMapEngine("unknown engine"), MAP_ENGINE_UNKNOWN);
	EXPECT_STREQ(getMapEngineName(MAP_ENGINE_CANARY), "canary");
}
