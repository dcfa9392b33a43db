// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "mapvalidator.h"

#include "items.h"
#include "map.h"

#include <set>

namespace {

std::string formatPosition(const Position& pos)
{
	return fmt::format("[x:{:d}, y:{:d}, z:{:d}]", pos.x, pos.y, pos.z);
}

class Validator
{
public:
	Validator(const Map& map, const ItemDatabase* items, ValidationResult& result) :
	    map(map), items(items), result(result)
	{}

	void validate()
	{
		validateHeader();
		validateTiles();
		validateHouses();
		validateTowns();
		validateWaypoints();
		validateSpawns();
	}

private:
	bool inBounds(const Position& pos) const { return pos.isInBounds(map.header.width, map.header.height); }

	void validateHeader()
	{
		if (map.header.width == 0 || map.header.height == 0) {
			result.add(VALIDATION_ERROR, VALIDATION_MAP_DIMENSIONS_INVALID,
			           fmt::format("Map dimensions {:d}x{:d} must be positive.", map.header.width,
			                       map.header.height));
		}
	}

	void validateTiles()
	{
		std::vector<Position> outOfBounds;
		std::set<uint16_t> unknownIds;

		for (const auto& it : map.getTiles()) {
			const Tile& tile = it.second;
			const Position& pos = tile.getPosition();

			if (!inBounds(pos)) {
				outOfBounds.push_back(pos);
			}

			if (tile.isHouseTile()) {
				const House* house = map.houses.getHouse(tile.getHouseId());
				if (!house) {
					result.add(VALIDATION_ERROR, VALIDATION_HOUSE_ID_MISSING,
					           fmt::format("{:s} Tile references house id {:d} which is not defined.",
					                       formatPosition(pos), tile.getHouseId()),
					           pos);
				} else if (!house->hasTile(pos)) {
					result.add(VALIDATION_ERROR, VALIDATION_HOUSE_TILE_MISMATCH,
					           fmt::format("{:s} Tile belongs to house {:d} but is not one of its tiles.",
					                       formatPosition(pos), tile.getHouseId()),
					           pos);
				}
			}

			std::vector<const Item*> pending;
			if (tile.getGround()) {
				pending.push_back(&*tile.getGround());
			}
			for (const Item& item : tile.getItems()) {
				pending.push_back(&item);
			}

			while (!pending.empty()) {
				const Item* item = pending.back();
				pending.pop_back();

				if (item->isPlaceholder()) {
					result.add(VALIDATION_ERROR, VALIDATION_ITEM_PLACEHOLDER,
					           fmt::format("{:s} Placeholder for unmapped {:s} id {:d}.", formatPosition(pos),
					                       item->isRawClientId() ? "client" : "server", item->getRawUnknownId()),
					           pos);
				} else if (items && !items->hasItemType(item->getID()) && unknownIds.insert(item->getID()).second) {
					result.add(VALIDATION_WARNING, VALIDATION_ITEM_UNKNOWN,
					           fmt::format("{:s} Item id {:d} is not in the item database.", formatPosition(pos),
					                       item->getID()),
					           pos);
				}

				for (const Item& child : item->getItems()) {
					pending.push_back(&child);
				}
			}
		}

		if (!outOfBounds.empty()) {
			result.add(VALIDATION_ERROR, VALIDATION_TILE_OUT_OF_BOUNDS,
			           fmt::format("{:d} tiles are outside of the map size {:d}x{:d}, first at {:s}.",
			                       outOfBounds.size(), map.header.width, map.header.height,
			                       formatPosition(outOfBounds.front())),
			           outOfBounds.front());
		}
	}

	void validateHouses()
	{
		for (const auto& it : map.houses.getHouses()) {
			const House& house = it.second;

			if (house.getTiles().empty()) {
				result.add(VALIDATION_WARNING, VALIDATION_HOUSE_UNUSED,
				           fmt::format("House {:d} is defined but no tile references it.", house.getId()));
			}

			for (const Position& pos : house.getTiles()) {
				const Tile* tile = map.getTile(pos);
				if (!tile || tile->getHouseId() != house.getId()) {
					result.add(VALIDATION_ERROR, VALIDATION_HOUSE_TILE_MISMATCH,
					           fmt::format("{:s} House {:d} lists a tile that does not belong to it.",
					                       formatPosition(pos), house.getId()),
					           pos);
				}
			}

			if (house.getTownId() != 0 && !map.towns.getTown(house.getTownId())) {
				result.add(VALIDATION_WARNING, VALIDATION_HOUSE_TOWN_MISSING,
				           fmt::format("House {:d} references town id {:d} which is not defined.", house.getId(),
				                       house.getTownId()));
			}

			const Position& entry = house.getEntryPosition();
			if (entry == Position()) {
				continue;
			}

			if (!inBounds(entry)) {
				result.add(VALIDATION_WARNING, VALIDATION_HOUSE_ENTRY_OUT_OF_BOUNDS,
				           fmt::format("{:s} Entry of house {:d} is outside of the map.", formatPosition(entry),
				                       house.getId()),
				           entry);
			} else if (!map.getTile(entry)) {
				result.add(VALIDATION_WARNING, VALIDATION_HOUSE_ENTRY_MISSING_TILE,
				           fmt::format("{:s} Entry of house {:d} has no tile.", formatPosition(entry), house.getId()),
				           entry);
			}
		}
	}

	void validateTowns()
	{
		for (const auto& it : map.towns.getTowns()) {
			const Town& town = it.second;
			if (town.getID() == 0) {
				result.add(VALIDATION_ERROR, VALIDATION_TOWN_ID_INVALID,
				           fmt::format("Town \"{:s}\" has id 0.", town.getName()));
			}

			const Position& temple = town.getTemplePosition();
			if (!inBounds(temple)) {
				result.add(VALIDATION_ERROR, VALIDATION_TOWN_TEMPLE_OUT_OF_BOUNDS,
				           fmt::format("{:s} Temple of town {:d} is outside of the map.", formatPosition(temple),
				                       town.getID()),
				           temple);
			}
		}
	}

	void validateWaypoints()
	{
		for (const auto& it : map.waypoints) {
			if (it.first.empty()) {
				result.add(VALIDATION_WARNING, VALIDATION_WAYPOINT_EMPTY_NAME, "Waypoint name is empty.",
				           it.second);
			}

			if (!inBounds(it.second)) {
				result.add(VALIDATION_WARNING, VALIDATION_WAYPOINT_OUT_OF_BOUNDS,
				           fmt::format("{:s} Waypoint \"{:s}\" is outside of the map.", formatPosition(it.second),
				                       it.first),
				           it.second);
			}
		}
	}

	void validateSpawns()
	{
		for (const SpawnArea& spawn : map.spawns) {
			const Position& center = spawn.getCenterPos();
			if (!inBounds(center)) {
				result.add(VALIDATION_ERROR, VALIDATION_SPAWN_OUT_OF_BOUNDS,
				           fmt::format("{:s} Spawn center is outside of the map.", formatPosition(center)), center);
			}

			if (spawn.getRadius() == 0) {
				result.add(VALIDATION_WARNING, VALIDATION_SPAWN_RADIUS_INVALID,
				           fmt::format("{:s} Spawn has radius 0.", formatPosition(center)), center);
			}

			for (const spawnBlock_t& sb : spawn.getCreatures()) {
				if (sb.name.empty()) {
					result.add(VALIDATION_WARNING, VALIDATION_SPAWN_EMPTY_NAME,
					           fmt::format("{:s} Spawn entry has an empty name.", formatPosition(center)), center);
				}
			}
		}
	}

	const Map& map;
	const ItemDatabase* items;
	ValidationResult& result;
};

} // namespace

size_t ValidationResult::getErrorCount() const
{
	return std::count_if(issues.begin(), issues.end(),
	                     [](const ValidationIssue& issue) { return issue.severity == VALIDATION_ERROR; });
}

size_t ValidationResult::getWarningCount() const
{
	return std::count_if(issues.begin(), issues.end(),
	                     [](const ValidationIssue& issue) { return issue.severity == VALIDATION_WARNING; });
}

bool ValidationResult::hasIssue(ValidationCode_t code) const
{
	return std::any_of(issues.begin(), issues.end(), [code](const ValidationIssue& issue) { return issue.code == code; });
}

ValidationResult MapValidator::validate(const Map& map, const ItemDatabase* items)
{
	ValidationResult result;
	Validator validator(map, items, result);
	validator.validate();
	return result;
}
