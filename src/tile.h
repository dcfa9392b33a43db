// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "item.h"
#include "position.h"

#include <optional>
#include <string>
#include <vector>

enum tileflags_t : uint32_t
{
	TILESTATE_NONE = 0,

	TILESTATE_PROTECTIONZONE = OTBM_TILEFLAG_PROTECTIONZONE,
	TILESTATE_NOPVPZONE = OTBM_TILEFLAG_NOPVPZONE,
	TILESTATE_NOLOGOUT = OTBM_TILEFLAG_NOLOGOUT,
	TILESTATE_PVPZONE = OTBM_TILEFLAG_PVPZONE,
	TILESTATE_REFRESH = OTBM_TILEFLAG_REFRESH,
};

class Tile
{
public:
	Tile() = default;
	explicit Tile(const Position& position) : position(position) {}
	Tile(uint16_t x, uint16_t y, uint8_t z) : position(x, y, z) {}

	const Position& getPosition() const { return position; }
	void setPosition(const Position& pos) { position = pos; }

	const std::optional<Item>& getGround() const { return ground; }
	std::optional<Item>& getGround() { return ground; }
	void setGround(Item&& item) { ground = std::move(item); }
	void removeGround() { ground.reset(); }

	const ItemVector& getItems() const { return items; }
	ItemVector& getItems() { return items; }
	Item& addItem(Item&& item)
	{
		items.push_back(std::move(item));
		return items.back();
	}

	// map flags are kept as stored, bits without a name survive a save unchanged
	uint32_t getFlags() const { return flags; }
	void setFlags(uint32_t newFlags) { flags = newFlags; }
	bool hasFlag(tileflags_t flag) const { return (flags & flag) != 0; }
	void setFlag(tileflags_t flag) { flags |= flag; }
	void resetFlag(tileflags_t flag) { flags &= ~flag; }

	bool isHouseTile() const { return houseId != 0; }
	uint32_t getHouseId() const { return houseId; }
	void setHouseId(uint32_t id) { houseId = id; }

	const std::vector<uint16_t>& getZoneIds() const { return zoneIds; }
	void addZoneId(uint16_t zoneId) { zoneIds.push_back(zoneId); }
	void clearZoneIds() { zoneIds.clear(); }

	const std::string& getUnknownAttributes() const { return unknownAttributes; }
	void setUnknownAttributes(const std::string& bytes) { unknownAttributes = bytes; }

	bool empty() const { return !ground && items.empty(); }
	size_t size() const { return items.size() + (ground ? 1 : 0); }

	// ground and stack, container contents included
	uint32_t getTotalItemCount() const;

	bool operator==(const Tile& other) const = default;

private:
	Position position;
	std::optional<Item> ground;
	ItemVector items;
	std::vector<uint16_t> zoneIds;
	std::string unknownAttributes;
	uint32_t flags = TILESTATE_NONE;
	uint32_t houseId = 0;
};
