// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "mapversion.h"

#include <istream>
#include <map>
#include <string>

namespace pugi {
class xml_node;
}

enum itemgroup_t : uint8_t
{
	ITEM_GROUP_NONE,

	ITEM_GROUP_GROUND,
	ITEM_GROUP_CONTAINER,
	ITEM_GROUP_WEAPON,     // deprecated
	ITEM_GROUP_AMMUNITION, // deprecated
	ITEM_GROUP_ARMOR,      // deprecated
	ITEM_GROUP_CHARGES,
	ITEM_GROUP_TELEPORT,   // deprecated
	ITEM_GROUP_MAGICFIELD, // deprecated
	ITEM_GROUP_WRITEABLE,  // deprecated
	ITEM_GROUP_KEY,        // deprecated
	ITEM_GROUP_SPLASH,
	ITEM_GROUP_FLUID,
	ITEM_GROUP_DOOR, // deprecated
	ITEM_GROUP_DEPRECATED,

	ITEM_GROUP_LAST
};

enum itemflags_t : uint32_t
{
	FLAG_BLOCK_SOLID = 1 << 0,
	FLAG_BLOCK_PROJECTILE = 1 << 1,
	FLAG_BLOCK_PATHFIND = 1 << 2,
	FLAG_HAS_HEIGHT = 1 << 3,
	FLAG_USEABLE = 1 << 4,
	FLAG_PICKUPABLE = 1 << 5,
	FLAG_MOVEABLE = 1 << 6,
	FLAG_STACKABLE = 1 << 7,
	FLAG_FLOORCHANGEDOWN = 1 << 8,
	FLAG_FLOORCHANGENORTH = 1 << 9,
	FLAG_FLOORCHANGEEAST = 1 << 10,
	FLAG_FLOORCHANGESOUTH = 1 << 11,
	FLAG_FLOORCHANGEWEST = 1 << 12,
	FLAG_ALWAYSONTOP = 1 << 13,
	FLAG_READABLE = 1 << 14,
	FLAG_ROTATABLE = 1 << 15,
	FLAG_HANGABLE = 1 << 16,
	FLAG_VERTICAL = 1 << 17,
	FLAG_HORIZONTAL = 1 << 18,
	FLAG_CANNOTDECAY = 1 << 19,
	FLAG_ALLOWDISTREAD = 1 << 20,
	FLAG_UNUSED = 1 << 21,
	FLAG_CLIENTCHARGES = 1 << 22,
	FLAG_LOOKTHROUGH = 1 << 23,
	FLAG_ANIMATION = 1 << 24,
	FLAG_FULLTILE = 1 << 25,
	FLAG_FORCEUSE = 1 << 26,
};

enum itemattrib_t : uint8_t
{
	ITEM_ATTR_FIRST = 0x10,
	ITEM_ATTR_SERVERID = ITEM_ATTR_FIRST,
	ITEM_ATTR_CLIENTID,
	ITEM_ATTR_NAME,
	ITEM_ATTR_DESCR,
	ITEM_ATTR_SPEED,
	ITEM_ATTR_SLOT,
	ITEM_ATTR_MAXITEMS,
	ITEM_ATTR_WEIGHT,
	ITEM_ATTR_WEAPON,
	ITEM_ATTR_AMU,
	ITEM_ATTR_ARMOR,
	ITEM_ATTR_MAGLEVEL,
	ITEM_ATTR_MAGFIELDTYPE,
	ITEM_ATTR_WRITEABLE,
	ITEM_ATTR_ROTATETO,
	ITEM_ATTR_DECAY,
	ITEM_ATTR_SPRITEHASH,
	ITEM_ATTR_MINIMAPCOLOR,
	ITEM_ATTR_07,
	ITEM_ATTR_08,
	ITEM_ATTR_LIGHT,
	ITEM_ATTR_DECAY2,
	ITEM_ATTR_WEAPON2,
	ITEM_ATTR_AMU2,
	ITEM_ATTR_ARMOR2,
	ITEM_ATTR_WRITEABLE2,
	ITEM_ATTR_LIGHT2,
	ITEM_ATTR_TOPORDER,
	ITEM_ATTR_WRITEABLE3,
	ITEM_ATTR_WAREID,

	ITEM_ATTR_LAST
};

enum rootattrib_t : uint8_t
{
	ROOT_ATTR_VERSION = 0x01,
};

#pragma pack(1)

struct VERSIONINFO
{
	uint32_t dwMajorVersion;
	uint32_t dwMinorVersion;
	uint32_t dwBuildNumber;
	uint8_t CSDVersion[128];
};

#pragma pack()

class ItemType
{
public:
	bool isGroundTile() const { return group == ITEM_GROUP_GROUND; }
	bool isSplash() const { return group == ITEM_GROUP_SPLASH; }
	bool isFluidContainer() const { return group == ITEM_GROUP_FLUID; }

	// count, fluid type or splash type travels with the item id
	bool hasSubType() const { return stackable || isFluidContainer() || isSplash(); }
	bool hasCharges() const { return group == ITEM_GROUP_CHARGES || charges; }

	itemgroup_t group = ITEM_GROUP_NONE;

	std::string name;
	std::string article;

	uint32_t flags = 0;
	uint16_t id = 0;
	uint16_t clientId = 0;

	uint8_t alwaysOnTopOrder = 0;

	bool stackable = false;
	bool alwaysOnTop = false;
	bool charges = false;
};

class ItemDatabase
{
public:
	ItemDatabase() = default;

	// non-copyable
	ItemDatabase(const ItemDatabase&) = delete;
	ItemDatabase& operator=(const ItemDatabase&) = delete;

	ItemDatabase(ItemDatabase&&) = default;
	ItemDatabase& operator=(ItemDatabase&&) = default;

	bool loadFromOtb(const std::string& file);
	bool loadFromOtb(std::istream& stream);
	bool loadFromXml(const std::string& file);

	// reads only the version block of an items.otb root node
	static bool readOtbVersion(const std::string& file, ItemsOtbVersion& version);

	ItemType& addItemType(uint16_t id);

	const ItemType* getItemType(uint16_t id) const;
	bool hasItemType(uint16_t id) const { return items.find(id) != items.end(); }

	const std::map<uint16_t, ItemType>& getItemTypes() const { return items; }
	size_t size() const { return items.size(); }
	bool empty() const { return items.empty(); }

	const ItemsOtbVersion& getOtbVersion() const { return otbVersion; }
	uint32_t getClientVersion() const { return getClientVersionFromItems(otbVersion); }

	const std::string& getLastError() const { return lastError; }

private:
	void parseItemNode(const pugi::xml_node& itemNode, uint16_t id);

	std::map<uint16_t, ItemType> items;
	ItemsOtbVersion otbVersion;
	std::string lastError;
};
