// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "const.h"
#include "house.h"
#include "position.h"
#include "spawn.h"
#include "tile.h"
#include "town.h"

#include <map>
#include <string>

struct MapHeader
{
	uint32_t otbmVersion = OTBM_VERSION_DEFAULT;
	uint16_t width = 0;
	uint16_t height = 0;
	uint32_t majorVersionItems = 0;
	uint32_t minorVersionItems = 0;

	std::string description;
	std::string spawnFile;
	std::string npcFile;
	std::string houseFile;
	std::string zoneFile;

	// MAP_DATA attributes that could not be decoded, written back after the known ones
	std::string unknownAttributes;

	bool operator==(const MapHeader& other) const = default;
};

using TileMap = std::map<Position, Tile>;
using WaypointMap = std::map<std::string, Position>;

/**
 * Map class.
 * Holds all the actual map-data
 */
class Map
{
public:
	Map() = default;

	/**
	 * Get a single tile.
	 * \returns A pointer to that tile, nullptr if there is none.
	 */
	Tile* getTile(uint16_t x, uint16_t y, uint8_t z) { return getTile(Position(x, y, z)); }
	Tile* getTile(const Position& pos);
	const Tile* getTile(const Position& pos) const;

	/**
	 * Creates the tile at pos if it does not exist yet.
	 */
	Tile& createTile(const Position& pos);

	/**
	 * Set a single tile.
	 * \returns false if a tile already existed at that position and replaceExistingTiles is false
	 */
	bool setTile(Tile&& tile, bool replaceExistingTiles = true);

	/**
	 * Removes a single tile, together with its house membership.
	 */
	bool removeTile(const Position& pos);

	const TileMap& getTiles() const { return tiles; }
	size_t getTileCount() const { return tiles.size(); }

	// adds pos to the house and stamps the house id on its tile
	bool addHouseTile(uint32_t houseId, const Position& pos);

	bool operator==(const Map& other) const = default;

	MapHeader header;

	Houses houses;
	Towns towns;
	WaypointMap waypoints;
	SpawnList spawns;

private:
	TileMap tiles;
};
