// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "position.h"

#include <map>
#include <string>

class Town
{
public:
	Town() = default;
	explicit Town(uint32_t id) : id(id) {}

	const Position& getTemplePosition() const { return templePosition; }
	const std::string& getName() const { return name; }

	void setTemplePos(const Position& pos) { templePosition = pos; }
	void setName(const std::string& newName) { name = newName; }
	uint32_t getID() const { return id; }

	bool operator==(const Town& other) const = default;

private:
	uint32_t id = 0;
	std::string name;
	Position templePosition;
};

using TownMap = std::map<uint32_t, Town>;

class Towns
{
public:
	// returns false if the id was already taken, the existing town is left in place
	bool addTown(uint32_t townId, const Town& town) { return townMap.emplace(townId, town).second; }

	Town* getTown(const std::string& townName)
	{
		for (auto& it : townMap) {
			if (it.second.getName() == townName) {
				return &it.second;
			}
		}
		return nullptr;
	}

	Town* getTown(uint32_t townId)
	{
		auto it = townMap.find(townId);
		if (it == townMap.end()) {
			return nullptr;
		}
		return &it->second;
	}

	const Town* getTown(uint32_t townId) const
	{
		auto it = townMap.find(townId);
		if (it == townMap.end()) {
			return nullptr;
		}
		return &it->second;
	}

	const TownMap& getTowns() const { return townMap; }

	size_t size() const { return townMap.size(); }
	bool empty() const { return townMap.empty(); }

	bool operator==(const Towns& other) const = default;

private:
	TownMap townMap;
};
