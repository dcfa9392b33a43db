// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "iomapserialize.h"

#include "fileloader.h"
#include "idmapper.h"
#include "items.h"
#include "map.h"
#include "tools.h"

#include <boost/filesystem/operations.hpp>
#include <set>
#include <tuple>

#ifndef _WIN32
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace {

const OTB::Identifier OTBM_IDENTIFIER = {{'O', 'T', 'B', 'M'}};

// (z, y base, x base) sorts areas in the same order as the positions of their tiles
using AreaKey = std::tuple<uint8_t, uint16_t, uint16_t>;

std::string formatPosition(const Position& pos)
{
	return fmt::format("[x:{:d}, y:{:d}, z:{:d}]", pos.x, pos.y, pos.z);
}

class MapWriter
{
public:
	MapWriter(std::ostream& stream, const MapSaveContext& context, MapSaveReport& report) :
	    writer(stream), context(context), report(report)
	{
		format.format = context.format;
		format.items = context.items;
		format.idMapper = context.idMapper;
	}

	// non-copyable
	MapWriter(const MapWriter&) = delete;
	MapWriter& operator=(const MapWriter&) = delete;

	void write(const Map& map);

private:
	void writeMapData(const Map& map);
	void writeTileArea(const AreaKey& key, const std::vector<const Tile*>& tiles);
	void writeTile(const Tile& tile);
	void writeItem(const Item& item, const Position& pos);
	void writeItemProps(const Item& item, const Position& pos);
	void writeSpawns(const SpawnList& spawns);
	void writeTowns(const Towns& towns);
	void writeWaypoints(const WaypointMap& waypoints);

	uint16_t getItemId(const Item& item) const;

	OTB::NodeWriter writer;
	const MapSaveContext& context;
	MapSaveReport& report;
	FormatContext format;
	PropWriteStream props;

	bool attributeMapWarned = false;
	bool zonesWarned = false;
};

void MapWriter::write(const Map& map)
{
	const MapHeader& header = map.header;

	writer.writeIdentifier(OTBM_IDENTIFIER);
	writer.startNode(0);

	props.clear();
	props.write<uint32_t>(context.format.otbmVersion);
	props.write<uint16_t>(header.width);
	props.write<uint16_t>(header.height);
	props.write<uint32_t>(header.majorVersionItems);
	props.write<uint32_t>(header.minorVersionItems);
	writer.writeProps(props);

	writeMapData(map);

	writer.endNode();
}

void MapWriter::writeMapData(const Map& map)
{
	const MapHeader& header = map.header;

	writer.startNode(OTBM_MAP_DATA);

	props.clear();
	if (!header.description.empty()) {
		props.write<uint8_t>(OTBM_ATTR_DESCRIPTION);
		props.writeString(header.description);
	}

	if (!header.spawnFile.empty()) {
		props.write<uint8_t>(OTBM_ATTR_EXT_SPAWN_FILE);
		props.writeString(header.spawnFile);
	}

	if (!header.npcFile.empty()) {
		props.write<uint8_t>(OTBM_ATTR_EXT_SPAWN_NPC_FILE);
		props.writeString(header.npcFile);
	}

	if (!header.houseFile.empty()) {
		props.write<uint8_t>(OTBM_ATTR_EXT_HOUSE_FILE);
		props.writeString(header.houseFile);
	}

	if (!header.zoneFile.empty()) {
		props.write<uint8_t>(OTBM_ATTR_EXT_ZONE_FILE);
		props.writeString(header.zoneFile);
	}

	props.writeBytes(header.unknownAttributes);
	writer.writeProps(props);

	std::map<AreaKey, std::vector<const Tile*>> areas;
	for (const auto& it : map.getTiles()) {
		const Position& pos = it.first;
		areas[AreaKey(pos.z, pos.y & OTBM_TILE_AREA_MASK, pos.x & OTBM_TILE_AREA_MASK)].push_back(&it.second);
	}

	for (const auto& it : areas) {
		if (context.cancellation) {
			context.cancellation->throwIfCancelled();
		}
		writeTileArea(it.first, it.second);
	}

	if (!map.spawns.empty()) {
		writeSpawns(map.spawns);
	}

	if (!map.towns.empty()) {
		writeTowns(map.towns);
	}

	if (!map.waypoints.empty()) {
		if (context.format.hasWaypoints()) {
			writeWaypoints(map.waypoints);
		} else {
			report.addWarning(MAPWARNING_WAYPOINTS_DROPPED,
			                  fmt::format("{:s} has no waypoints, {:d} waypoints not written.",
			                              getOTBMVersionName(context.format.otbmVersion), map.waypoints.size()));
		}
	}

	writer.endNode();
}

void MapWriter::writeTileArea(const AreaKey& key, const std::vector<const Tile*>& tiles)
{
	writer.startNode(OTBM_TILE_AREA);

	props.clear();
	props.write<uint16_t>(std::get<2>(key));
	props.write<uint16_t>(std::get<1>(key));
	props.write<uint8_t>(std::get<0>(key));
	writer.writeProps(props);

	for (const Tile* tile : tiles) {
		writeTile(*tile);
	}

	writer.endNode();
}

void MapWriter::writeTile(const Tile& tile)
{
	const Position& pos = tile.getPosition();
	const std::optional<Item>& ground = tile.getGround();
	const bool compactGround = ground && ground->isCompact();

	writer.startNode(tile.isHouseTile() ? OTBM_HOUSETILE : OTBM_TILE);

	props.clear();
	props.write<uint8_t>(pos.x & 0xFF);
	props.write<uint8_t>(pos.y & 0xFF);

	if (tile.isHouseTile()) {
		props.write<uint32_t>(tile.getHouseId());
	}

	if (tile.getFlags() != TILESTATE_NONE) {
		props.write<uint8_t>(OTBM_ATTR_TILE_FLAGS);
		props.write<uint32_t>(tile.getFlags());
	}

	if (compactGround) {
		props.write<uint8_t>(OTBM_ATTR_ITEM);
		props.write<uint16_t>(getItemId(*ground));
		ground->writeInlineSubType(props, format);
		++report.items;
	}

	props.writeBytes(tile.getUnknownAttributes());
	writer.writeProps(props);

	if (ground && !compactGround) {
		writeItem(*ground, pos);
	}

	for (const Item& item : tile.getItems()) {
		writeItem(item, pos);
	}

	if (!tile.getZoneIds().empty()) {
		if (format.format.hasTileZones()) {
			writer.startNode(OTBM_TILE_ZONE);

			props.clear();
			props.write<uint16_t>(static_cast<uint16_t>(tile.getZoneIds().size()));
			for (uint16_t zoneId : tile.getZoneIds()) {
				props.write<uint16_t>(zoneId);
			}
			writer.writeProps(props);

			writer.endNode();
		} else if (!zonesWarned) {
			zonesWarned = true;
			report.addWarning(MAPWARNING_ZONES_DROPPED,
			                  fmt::format("{:s} {:s} has no tile zones, zone ids not written.", formatPosition(pos),
			                              getOTBMVersionName(format.format.otbmVersion)),
			                  pos);
		}
	}

	writer.endNode();
	++report.tiles;
}

void MapWriter::writeItemProps(const Item& item, const Position& pos)
{
	props.clear();
	props.write<uint16_t>(getItemId(item));
	item.writeInlineSubType(props, format);
	if (!item.serializeAttr(props, format) && !attributeMapWarned) {
		attributeMapWarned = true;
		report.addWarning(MAPWARNING_ATTRIBUTE_MAP_DROPPED,
		                  fmt::format("{:s} {:s} has no attribute map, custom attributes not written.",
		                              formatPosition(pos), getOTBMVersionName(format.format.otbmVersion)),
		                  pos);
	}
	writer.writeProps(props);
	++report.items;
}

void MapWriter::writeItem(const Item& item, const Position& pos)
{
	struct Frame
	{
		const Item* item;
		size_t next;
	};

	std::vector<Frame> stack;

	writer.startNode(OTBM_ITEM);
	writeItemProps(item, pos);
	stack.push_back({&item, 0});

	while (!stack.empty()) {
		Frame& frame = stack.back();
		const ItemVector& children = frame.item->getItems();
		if (frame.next == children.size()) {
			writer.endNode();
			stack.pop_back();
			continue;
		}

		const Item& child = children[frame.next++];
		writer.startNode(OTBM_ITEM);
		writeItemProps(child, pos);
		stack.push_back({&child, 0});
	}
}

void MapWriter::writeSpawns(const SpawnList& spawns)
{
	writer.startNode(OTBM_SPAWNS);
	for (const SpawnArea& spawn : spawns) {
		const Position& center = spawn.getCenterPos();

		writer.startNode(OTBM_SPAWN_AREA);
		props.clear();
		props.write<uint16_t>(center.x);
		props.write<uint16_t>(center.y);
		props.write<uint8_t>(center.z);
		props.write<uint32_t>(spawn.getRadius());
		writer.writeProps(props);

		for (const spawnBlock_t& sb : spawn.getCreatures()) {
			writer.startNode(OTBM_MONSTER);
			props.clear();
			props.writeString(sb.name);
			props.write<int16_t>(sb.offsetX);
			props.write<int16_t>(sb.offsetY);
			props.write<uint32_t>(sb.interval);
			writer.writeProps(props);
			writer.endNode();
		}

		writer.endNode();
	}
	writer.endNode();
}

void MapWriter::writeTowns(const Towns& towns)
{
	writer.startNode(OTBM_TOWNS);
	for (const auto& it : towns.getTowns()) {
		const Town& town = it.second;
		const Position& templePos = town.getTemplePosition();

		writer.startNode(OTBM_TOWN);
		props.clear();
		props.write<uint32_t>(town.getID());
		props.writeString(town.getName());
		props.write<uint16_t>(templePos.x);
		props.write<uint16_t>(templePos.y);
		props.write<uint8_t>(templePos.z);
		writer.writeProps(props);
		writer.endNode();
	}
	writer.endNode();
}

void MapWriter::writeWaypoints(const WaypointMap& waypoints)
{
	writer.startNode(OTBM_WAYPOINTS);
	for (const auto& it : waypoints) {
		writer.startNode(OTBM_WAYPOINT);
		props.clear();
		props.writeString(it.first);
		props.write<uint16_t>(it.second.x);
		props.write<uint16_t>(it.second.y);
		props.write<uint8_t>(it.second.z);
		writer.writeProps(props);
		writer.endNode();
	}
	writer.endNode();
}

uint16_t MapWriter::getItemId(const Item& item) const
{
	if (item.isPlaceholder()) {
		throw UnmappedItemId(item.getRawUnknownId(), item.isRawClientId());
	}

	if (!context.format.usesClientId) {
		return item.getID();
	}

	if (!context.idMapper) {
		throw UnmappedItemId(item.getID(), false);
	}
	return context.idMapper->requireClientId(item.getID());
}

bool syncFile(const std::filesystem::path& path)
{
#ifndef _WIN32
	const int fd = ::open(path.c_str(), O_WRONLY);
	if (fd < 0) {
		return false;
	}

	const bool synced = ::fsync(fd) == 0;
	::close(fd);
	return synced;
#else
	return true;
#endif
}

// reserves a fresh file beside the destination so concurrent saves never share one
bool createTemporary(const std::filesystem::path& destination, std::filesystem::path& temporary)
{
	const boost::filesystem::path model(destination.filename().string() + ".%%%%-%%%%-%%%%-%%%%.tmp");
	for (int attempt = 0; attempt < 16; ++attempt) {
		temporary = destination.parent_path() / boost::filesystem::unique_path(model).string();
#ifndef _WIN32
		const int fd = ::open(temporary.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
		if (fd >= 0) {
			::close(fd);
			return true;
		}

		if (errno != EEXIST) {
			return false;
		}
#else
		std::error_code ec;
		if (!std::filesystem::exists(temporary, ec) && !ec) {
			return true;
		}
#endif
	}
	return false;
}

void removeTemporary(const std::filesystem::path& path)
{
	std::error_code ec;
	std::filesystem::remove(path, ec);
}

} // namespace

bool IOMapSerialize::checkItemIds(const Map& map, const MapSaveContext& context, MapSaveReport& report)
{
	const bool clientSpace = context.format.usesClientId;

	std::set<Position> positions;
	std::set<uint16_t> ids;

	auto check = [&](const Item& root, const Position& pos) {
		std::vector<const Item*> pending{&root};
		while (!pending.empty()) {
			const Item* item = pending.back();
			pending.pop_back();

			if (item->isPlaceholder()) {
				positions.insert(pos);
				ids.insert(item->getRawUnknownId());
			} else if (clientSpace && (!context.idMapper || !context.idMapper->hasServerId(item->getID()))) {
				positions.insert(pos);
				ids.insert(item->getID());
			}

			for (const Item& child : item->getItems()) {
				pending.push_back(&child);
			}
		}
	};

	for (const auto& it : map.getTiles()) {
		const Tile& tile = it.second;
		if (const std::optional<Item>& ground = tile.getGround()) {
			check(*ground, tile.getPosition());
		}

		for (const Item& item : tile.getItems()) {
			check(item, tile.getPosition());
		}
	}

	if (positions.empty()) {
		return true;
	}

	report.offendingPositions.assign(positions.begin(), positions.end());
	report.offendingIds.assign(ids.begin(), ids.end());
	report.fail(MAPIO_ERROR_UNMAPPABLE_ID,
	            fmt::format("{:d} item ids cannot be written as {:s}, found on {:d} tiles, first at {:s}.", ids.size(),
	                        getOTBMVersionName(context.format.otbmVersion), positions.size(),
	                        formatPosition(*positions.begin())));
	return false;
}

bool IOMapSerialize::serializeMap(const Map& map, std::ostream& stream, const MapSaveContext& context,
                                  MapSaveReport& report)
{
	try {
		MapWriter writer(stream, context, report);
		writer.write(map);
	} catch (const UnmappedItemId& err) {
		report.fail(MAPIO_ERROR_UNMAPPABLE_ID, err.what());
		return false;
	} catch (const CancelledError& err) {
		report.fail(MAPIO_ERROR_CANCELLED, err.what());
		return false;
	}

	if (!stream.good()) {
		report.fail(MAPIO_ERROR_FILE_ACCESS, "Could not write map data.");
		return false;
	}

	report.success = true;
	return true;
}

MapSaveReport IOMapSerialize::saveMap(const Map& map, const std::string& fileName, const MapSaveContext& context)
{
	MapSaveReport report;

	if (!context.format.isSupported()) {
		report.fail(MAPIO_ERROR_VERSION_UNSUPPORTED,
		            fmt::format("Cannot write OTBM version {:d}, the newest known version is {:d}.",
		                        context.format.otbmVersion, otmapio::to_underlying(OTBM_VERSION_LAST)));
		return report;
	}

	if (!checkItemIds(map, context, report)) {
		return report;
	}

	const std::filesystem::path destination(fileName);
	std::filesystem::path temporary;
	if (!createTemporary(destination, temporary)) {
		report.fail(MAPIO_ERROR_FILE_ACCESS,
		            fmt::format("Cannot create a temporary file next to {:s}.", destination.string()));
		return report;
	}

	{
		std::ofstream file(temporary, std::ios::out | std::ios::binary | std::ios::trunc);
		if (!file.is_open()) {
			removeTemporary(temporary);
			report.fail(MAPIO_ERROR_FILE_ACCESS, fmt::format("Cannot open {:s} for saving.", temporary.string()));
			return report;
		}

		if (!serializeMap(map, file, context, report)) {
			file.close();
			removeTemporary(temporary);
			return report;
		}

		file.flush();
		report.bytesWritten = static_cast<uint64_t>(file.tellp());
		file.close();
		if (file.fail()) {
			removeTemporary(temporary);
			report.fail(MAPIO_ERROR_FILE_ACCESS, fmt::format("Could not write {:s}.", temporary.string()));
			return report;
		}
	}

	if (!syncFile(temporary)) {
		removeTemporary(temporary);
		report.fail(MAPIO_ERROR_FILE_ACCESS, fmt::format("Could not sync {:s} to disk.", temporary.string()));
		return report;
	}

	std::error_code ec;
	std::filesystem::rename(temporary, destination, ec);
	if (ec) {
		removeTemporary(temporary);
		report.fail(MAPIO_ERROR_FILE_ACCESS,
		            fmt::format("Could not replace {:s}: {:s}", destination.string(), ec.message()));
		return report;
	}

	report.success = true;
	return report;
}
