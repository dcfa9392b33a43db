// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "items.h"
#include "testutils.h"

#include <gtest/gtest.h>

using namespace otmapio::test;

// ==================================================================
// items.otb
// ==================================================================

TEST(ItemsOtbTest, LoadsItemTypesAndVersion)
{
	ItemDatabase source;
	fillItemDatabase(source);

	std::istringstream stream(buildItemsOtb(source, 3, 57, "OTB 3.57.62-12.90"));

	ItemDatabase items;
	ASSERT_TRUE(items.loadFromOtb(stream)) << items.getLastError();
	EXPECT_EQ(items.size(), source.size());

	const ItemType* grass = items.getItemType(GRASS);
	ASSERT_NE(grass, nullptr);
	EXPECT_TRUE(grass->isGroundTile());
	EXPECT_EQ(grass->clientId, clientIdOf(GRASS));

	const ItemType* coins = items.getItemType(GOLD_COIN);
	ASSERT_NE(coins, nullptr);
	EXPECT_TRUE(coins->stackable);
	EXPECT_TRUE(coins->hasSubType());

	EXPECT_TRUE(items.getItemType(VIAL)->isFluidContainer());
	EXPECT_TRUE(items.getItemType(RUNE)->hasCharges());
	EXPECT_EQ(items.getItemType(SERVER_ONLY)->clientId, 0);
	EXPECT_EQ(items.getItemType(12345), nullptr);

	const ItemsOtbVersion& version = items.getOtbVersion();
	EXPECT_EQ(version.majorVersion, 3u);
	EXPECT_EQ(version.minorVersion, 57u);
	EXPECT_EQ(version.csdVersion, "OTB 3.57.62-12.90");
	EXPECT_EQ(items.getClientVersion(), 1290u);
}

TEST(ItemsOtbTest, MarkerBytesInIdsSurvive)
{
	ItemDatabase source;
	ItemType& iType = source.addItemType(0x00FE);
	iType.clientId = 0xFDFF;
	iType.group = ITEM_GROUP_GROUND;

	std::istringstream stream(buildItemsOtb(source, 3, 57, ""));

	ItemDatabase items;
	ASSERT_TRUE(items.loadFromOtb(stream)) << items.getLastError();
	ASSERT_TRUE(items.hasItemType(0x00FE));
	EXPECT_EQ(items.getItemType(0x00FE)->clientId, 0xFDFF);
}

TEST(ItemsOtbTest, DeprecatedGroupIsIgnored)
{
	ItemDatabase source;
	fillItemDatabase(source);
	source.addItemType(900).group = ITEM_GROUP_DEPRECATED;

	std::istringstream stream(buildItemsOtb(source, 3, 57, ""));

	ItemDatabase items;
	ASSERT_TRUE(items.loadFromOtb(stream)) << items.getLastError();
	EXPECT_FALSE(items.hasItemType(900));
	EXPECT_TRUE(items.hasItemType(GRASS));
}

TEST(ItemsOtbTest, LegacyVersionWithoutClientSuffix)
{
	ItemDatabase source;
	fillItemDatabase(source);

	std::istringstream stream(buildItemsOtb(source, 1, 2, "OTB 1.2"));

	ItemDatabase items;
	ASSERT_TRUE(items.loadFromOtb(stream)) << items.getLastError();
	EXPECT_EQ(items.getClientVersion(), 750u);
}

TEST(ItemsOtbTest, GarbageIsRejected)
{
	std::istringstream stream("this is not an items file");

	ItemDatabase items;
	EXPECT_FALSE(items.loadFromOtb(stream));
	EXPECT_FALSE(items.getLastError().empty());
	EXPECT_TRUE(items.empty());
}

TEST(ItemsOtbTest, MissingFileIsReported)
{
	TemporaryDirectory dir;

	ItemDatabase items;
	EXPECT_FALSE(items.loadFromOtb(dir.file("items.otb")));
	EXPECT_NE(items.getLastError().find("Could not open"), std::string::npos);
}

TEST(ItemsOtbTest, VersionIsReadWithoutItems)
{
	ItemDatabase source;
	fillItemDatabase(source);

	TemporaryDirectory dir;
	const std::string fileName = dir.write("items.otb", buildItemsOtb(source, 3, 20, "OTB 3.20.1-8.60"));

	ItemsOtbVersion version;
	ASSERT_TRUE(ItemDatabase::readOtbVersion(fileName, version));
	EXPECT_EQ(version.minorVersion, 20u);
	EXPECT_EQ(getClientVersionFromItems(version), 860u);

	EXPECT_FALSE(ItemDatabase::readOtbVersion(dir.file("missing.otb"), version));
}

// ==================================================================
// items.xml
// ==================================================================

TEST(ItemsXmlTest, FillsTypesAndClientIds)
{
	TemporaryDirectory dir;
	const std::string fileName = dir.write("items.xml", R"(<?xml version="1.0" encoding="UTF-8"?>
<items>
	<item id="100" name="grass">
		<attribute key="type" value="ground" />
	</item>
	<item fromid="300" toid="302" name="gold coin" clientid="1300">
		<attribute key="stackable" value="1" />
	</item>
	<item id="500" article="a" name="vial">
		<attribute key="fluidContainer" value="1" />
	</item>
	<item id="600" name="rune">
		<attribute key="charges" value="3" />
	</item>
	<item id="700" name="magic wall">
		<attribute key="clientId" value="1700" />
	</item>
</items>
)");

	ItemDatabase items;
	ASSERT_TRUE(items.loadFromXml(fileName)) << items.getLastError();
	EXPECT_EQ(items.size(), 7u);

	EXPECT_TRUE(items.getItemType(100)->isGroundTile());
	EXPECT_EQ(items.getItemType(100)->name, "grass");

	for (uint16_t id = 300; id <= 302; ++id) {
		const ItemType* coin = items.getItemType(id);
		ASSERT_NE(coin, nullptr);
		EXPECT_TRUE(coin->stackable);
		EXPECT_EQ(coin->clientId, 1000 + id);
	}

	EXPECT_TRUE(items.getItemType(500)->isFluidContainer());
	EXPECT_EQ(items.getItemType(500)->article, "a");
	EXPECT_TRUE(items.getItemType(600)->hasCharges());
	EXPECT_EQ(items.getItemType(700)->clientId, 1700);
}

TEST(ItemsXmlTest, OtbClientIdsTakePrecedence)
{
	ItemDatabase source;
	fillItemDatabase(source);

	TemporaryDirectory dir;
	const std::string otbFile = dir.write("items.otb", buildItemsOtb(source, 3, 57, ""));
	const std::string xmlFile = dir.write("items.xml", R"(<items>
	<item id="100" name="fresh grass" clientid="4000" />
	<item id="700" name="server only" clientid="4700" />
</items>
)");

	ItemDatabase items;
	ASSERT_TRUE(items.loadFromOtb(otbFile)) << items.getLastError();
	ASSERT_TRUE(items.loadFromXml(xmlFile)) << items.getLastError();

	EXPECT_EQ(items.getItemType(GRASS)->clientId, clientIdOf(GRASS));
	EXPECT_EQ(items.getItemType(GRASS)->name, "fresh grass");
	EXPECT_TRUE(items.getItemType(GRASS)->isGroundTile());
	EXPECT_EQ(items.getItemType(SERVER_ONLY)->clientId, 4700);
}

TEST(ItemsXmlTest, MalformedFileIsRejected)
{
	TemporaryDirectory dir;
	const std::string fileName = dir.write("items.xml", "<items><item id=\"1\"></items>");

	ItemDatabase items;
	EXPECT_FALSE(items.loadFromXml(fileName));
	EXPECT_FALSE(items.getLastError().empty());
}
