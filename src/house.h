// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "position.h"

#include <map>
#include <string>
#include <vector>

enum HouseFlags_t : uint8_t
{
	HOUSE_FLAG_NONE = 0,
	HOUSE_FLAG_GUILDHALL = 1 << 0,
};

class House
{
public:
	House() = default;
	explicit House(uint32_t houseId) : id(houseId) {}

	uint32_t getId() const { return id; }

	void setName(const std::string& newName) { name = newName; }
	const std::string& getName() const { return name; }

	void setTownId(uint32_t newTownId) { townId = newTownId; }
	uint32_t getTownId() const { return townId; }

	void setRent(uint32_t newRent) { rent = newRent; }
	uint32_t getRent() const { return rent; }

	void setEntryPos(const Position& pos) { entryPos = pos; }
	const Position& getEntryPosition() const { return entryPos; }

	void setFlags(uint8_t newFlags) { flags = newFlags; }
	uint8_t getFlags() const { return flags; }
	bool isGuildhall() const { return (flags & HOUSE_FLAG_GUILDHALL) != 0; }

	// member tiles, kept sorted and unique
	const std::vector<Position>& getTiles() const { return tiles; }
	void addTile(const Position& pos);
	bool removeTile(const Position& pos);
	bool hasTile(const Position& pos) const;
	void clearTiles() { tiles.clear(); }

	bool operator==(const House& other) const = default;

private:
	std::string name;
	std::vector<Position> tiles;
	Position entryPos;

	uint32_t id = 0;
	uint32_t townId = 0;
	uint32_t rent = 0;
	uint8_t flags = HOUSE_FLAG_NONE;
};

using HouseMap = std::map<uint32_t, House>;

class Houses
{
public:
	House& addHouse(uint32_t id);

	House* getHouse(uint32_t houseId);
	const House* getHouse(uint32_t houseId) const;

	bool removeHouse(uint32_t houseId) { return houseMap.erase(houseId) != 0; }

	const HouseMap& getHouses() const { return houseMap; }
	HouseMap& getHouses() { return houseMap; }

	size_t size() const { return houseMap.size(); }
	bool empty() const { return houseMap.empty(); }

	bool operator==(const Houses& other) const = default;

private:
	HouseMap houseMap;
};
