// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "house.h"

void House::addTile(const Position& pos)
{
	auto it = std::lower_bound(tiles.begin(), tiles.end(), pos);
	if (it != tiles.end() && *it == pos) {
		return;
	}
	tiles.insert(it, pos);
}

bool House::removeTile(const Position& pos)
{
	auto it = std::lower_bound(tiles.begin(), tiles.end(), pos);
	if (it == tiles.end() || *it != pos) {
		return false;
	}

	tiles.erase(it);
	return true;
}

bool House::hasTile(const Position& pos) const { return std::binary_search(tiles.begin(), tiles.end(), pos); }

House& Houses::addHouse(uint32_t id)
{
	auto it = houseMap.find(id);
	if (it != houseMap.end()) {
		return it->second;
	}
	return houseMap.emplace(id, House(id)).first->second;
}

House* Houses::getHouse(uint32_t houseId)
{
	auto it = houseMap.find(houseId);
	if (it == houseMap.end()) {
		return nullptr;
	}
	return &it->second;
}

const House* Houses::getHouse(uint32_t houseId) const
{
	auto it = houseMap.find(houseId);
	if (it == houseMap.end()) {
		return nullptr;
	}
	return &it->second;
}
