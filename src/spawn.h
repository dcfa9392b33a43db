// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "position.h"

#include <string>
#include <vector>

struct spawnBlock_t
{
	std::string name;
	int16_t offsetX = 0;
	int16_t offsetY = 0;
	uint32_t interval = 0;

	bool operator==(const spawnBlock_t& other) const = default;
};

class SpawnArea
{
public:
	SpawnArea() = default;
	SpawnArea(const Position& pos, uint32_t radius) : centerPos(pos), radius(radius) {}

	const Position& getCenterPos() const { return centerPos; }
	void setCenterPos(const Position& pos) { centerPos = pos; }
	uint32_t getRadius() const { return radius; }
	void setRadius(uint32_t newRadius) { radius = newRadius; }

	const std::vector<spawnBlock_t>& getCreatures() const { return creatures; }
	void addCreature(const std::string& name, int16_t offsetX, int16_t offsetY, uint32_t interval)
	{
		creatures.push_back({name, offsetX, offsetY, interval});
	}

	// absolute position of a creature, clamped to the map coordinate range
	Position getCreaturePosition(const spawnBlock_t& sb) const;

	bool operator==(const SpawnArea& other) const = default;

private:
	Position centerPos;
	uint32_t radius = 0;
	std::vector<spawnBlock_t> creatures;
};

using SpawnList = std::vector<SpawnArea>;
