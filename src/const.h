// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include <cstdint>

// Structural versions as stored in the root header. The editor releases call them OTBM 1..7.
enum OTBM_Version_t : uint32_t
{
	OTBM_VERSION_1 = 0,
	OTBM_VERSION_2 = 1,
	OTBM_VERSION_3 = 2,
	OTBM_VERSION_4 = 3,
	OTBM_VERSION_5 = 4,
	OTBM_VERSION_6 = 5,
	OTBM_VERSION_7 = 6,

	OTBM_VERSION_LAST = OTBM_VERSION_7,
	OTBM_VERSION_DEFAULT = OTBM_VERSION_3,
};

static constexpr uint32_t OTBM_FIRST_CLIENTID_VERSION = OTBM_VERSION_6;
static constexpr uint32_t CLIENT_VERSION_CANARY_MIN = 1300;

enum OTBM_AttrTypes_t : uint8_t
{
	OTBM_ATTR_DESCRIPTION = 1,
	OTBM_ATTR_EXT_FILE = 2,
	OTBM_ATTR_TILE_FLAGS = 3,
	OTBM_ATTR_ACTION_ID = 4,
	OTBM_ATTR_UNIQUE_ID = 5,
	OTBM_ATTR_TEXT = 6,
	OTBM_ATTR_DESC = 7,
	OTBM_ATTR_TELE_DEST = 8,
	OTBM_ATTR_ITEM = 9,
	OTBM_ATTR_DEPOT_ID = 10,
	OTBM_ATTR_EXT_SPAWN_FILE = 11,
	OTBM_ATTR_RUNE_CHARGES = 12,
	OTBM_ATTR_EXT_HOUSE_FILE = 13,
	OTBM_ATTR_HOUSEDOORID = 14,
	OTBM_ATTR_COUNT = 15,
	OTBM_ATTR_DURATION = 16,
	OTBM_ATTR_DECAYING_STATE = 17,
	OTBM_ATTR_WRITTENDATE = 18,
	OTBM_ATTR_WRITTENBY = 19,
	OTBM_ATTR_SLEEPERGUID = 20,
	OTBM_ATTR_SLEEPSTART = 21,
	OTBM_ATTR_CHARGES = 22,
	OTBM_ATTR_EXT_SPAWN_NPC_FILE = 23,
	OTBM_ATTR_EXT_ZONE_FILE = 24,

	OTBM_ATTR_ATTRIBUTE_MAP = 128,
};

enum OTBM_NodeTypes_t : uint8_t
{
	OTBM_ROOTV1 = 1,
	OTBM_MAP_DATA = 2,
	OTBM_ITEM_DEF = 3,
	OTBM_TILE_AREA = 4,
	OTBM_TILE = 5,
	OTBM_ITEM = 6,
	OTBM_TILE_SQUARE = 7,
	OTBM_TILE_REF = 8,
	OTBM_SPAWNS = 9,
	OTBM_SPAWN_AREA = 10,
	OTBM_MONSTER = 11,
	OTBM_TOWNS = 12,
	OTBM_TOWN = 13,
	OTBM_HOUSETILE = 14,
	OTBM_WAYPOINTS = 15,
	OTBM_WAYPOINT = 16,
	OTBM_TILE_ZONE = 19,
};

enum OTBM_TileFlag_t : uint32_t
{
	OTBM_TILEFLAG_PROTECTIONZONE = 1 << 0,
	OTBM_TILEFLAG_NOPVPZONE = 1 << 2,
	OTBM_TILEFLAG_NOLOGOUT = 1 << 3,
	OTBM_TILEFLAG_PVPZONE = 1 << 4,
	OTBM_TILEFLAG_REFRESH = 1 << 5,
};

// value types of OTBM_ATTR_ATTRIBUTE_MAP entries
enum OTBM_AttributeMapType_t : uint8_t
{
	OTBM_ATTRMAP_NONE = 0,
	OTBM_ATTRMAP_STRING = 1,
	OTBM_ATTRMAP_INTEGER = 2,
	OTBM_ATTRMAP_FLOAT = 3,
	OTBM_ATTRMAP_BOOLEAN = 4,
	OTBM_ATTRMAP_DOUBLE = 5,
};

static constexpr uint16_t OTBM_TILE_AREA_SIZE = 256;
static constexpr uint16_t OTBM_TILE_AREA_MASK = 0xFF00;

#pragma pack(1)

struct OTBM_root_header
{
	uint32_t version;
	uint16_t width;
	uint16_t height;
	uint32_t majorVersionItems;
	uint32_t minorVersionItems;
};

struct OTBM_Destination_coords
{
	uint16_t x;
	uint16_t y;
	uint8_t z;
};

struct OTBM_Tile_coords
{
	uint8_t x;
	uint8_t y;
};

#pragma pack()

const char* getOTBMNodeName(uint8_t type);
