// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "map.h"

Tile* Map::getTile(const Position& pos)
{
	auto it = tiles.find(pos);
	if (it == tiles.end()) {
		return nullptr;
	}
	return &it->second;
}

const Tile* Map::getTile(const Position& pos) const
{
	auto it = tiles.find(pos);
	if (it == tiles.end()) {
		return nullptr;
	}
	return &it->second;
}

Tile& Map::createTile(const Position& pos) { return tiles.try_emplace(pos, pos).first->second; }

bool Map::setTile(Tile&& tile, bool replaceExistingTiles /* = true*/)
{
	const Position pos = tile.getPosition();

	auto it = tiles.find(pos);
	if (it != tiles.end()) {
		if (!replaceExistingTiles) {
			return false;
		}

		it->second = std::move(tile);
		return true;
	}

	tiles.emplace(pos, std::move(tile));
	return true;
}

bool Map::removeTile(const Position& pos)
{
	auto it = tiles.find(pos);
	if (it == tiles.end()) {
		return false;
	}

	if (House* house = houses.getHouse(it->second.getHouseId())) {
		house->removeTile(pos);
	}

	tiles.erase(it);
	return true;
}

bool Map::addHouseTile(uint32_t houseId, const Position& pos)
{
	House* house = houses.getHouse(houseId);
	if (!house) {
		return false;
	}

	house->addTile(pos);
	createTile(pos).setHouseId(houseId);
	return true;
}
