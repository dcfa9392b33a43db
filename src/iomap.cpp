// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "iomap.h"

#include "fileloader.h"
#include "idmapper.h"
#include "items.h"
#include "map.h"
#include "mapdetection.h"
#include "tools.h"

#include <set>

/*
	OTBM_ROOTV1
	|
	|--- OTBM_MAP_DATA
	|	|
	|	|--- OTBM_TILE_AREA
	|	|	|--- OTBM_TILE
	|	|	|	|--- OTBM_ITEM
	|	|	|	|	|--- OTBM_ITEM (container contents)
	|	|	|	|--- OTBM_TILE_ZONE
	|	|	|--- OTBM_HOUSETILE
	|	|
	|	|--- OTBM_SPAWNS
	|	|	|--- OTBM_SPAWN_AREA
	|	|	|	|--- OTBM_MONSTER
	|	|
	|	|--- OTBM_TOWNS
	|	|	|--- OTBM_TOWN
	|	|
	|	|--- OTBM_WAYPOINTS
	|		|--- OTBM_WAYPOINT
*/

namespace {

const OTB::Identifier OTBM_IDENTIFIER = {{'O', 'T', 'B', 'M'}};

class MapLoadError final : public std::runtime_error
{
public:
	MapLoadError(MapIOError_t code, const std::string& message) : std::runtime_error(message), code(code) {}

	MapIOError_t getCode() const { return code; }

private:
	MapIOError_t code;
};

std::string formatPosition(const Position& pos)
{
	return fmt::format("[x:{:d}, y:{:d}, z:{:d}]", pos.x, pos.y, pos.z);
}

class MapReader
{
public:
	MapReader(OTB::Loader& loader, const MapLoadContext& context, MapLoadReport& report, Map& map) :
	    loader(loader), context(context), report(report), map(map), guard(context.limits, report)
	{}

	// non-copyable
	MapReader(const MapReader&) = delete;
	MapReader& operator=(const MapReader&) = delete;

	void read();

private:
	using NodeHandler = void (MapReader::*)();

	struct NodeDecoder
	{
		uint8_t type;
		NodeHandler handler;
	};

	static const NodeDecoder mapDataDecoders[];

	void readRootHeader();
	void readMapDataAttributes();
	void readTileArea();
	void readTowns();
	void readWaypoints();
	void readSpawns();

	void readTile(uint8_t tileType, const Position& base);
	void readTileZones(Tile& tile);
	void addTile(Tile&& tile);

	std::optional<Item> readItemTree(const Position& pos);
	bool readItemNode(Item& item, const Position& pos);
	bool readItemId(PropStream& propStream, Item& item, const Position& pos, bool& keep);
	bool isGround(const Item& item) const;

	OTB::Loader& loader;
	const MapLoadContext& context;
	MapLoadReport& report;
	Map& map;
	ResourceGuard guard;
	FormatContext format;

	std::set<uint32_t> missingHouses;
	std::set<uint16_t> unknownItemIds;
};

const MapReader::NodeDecoder MapReader::mapDataDecoders[] = {
    {OTBM_TILE_AREA, &MapReader::readTileArea},
    {OTBM_TOWNS, &MapReader::readTowns},
    {OTBM_WAYPOINTS, &MapReader::readWaypoints},
    {OTBM_SPAWNS, &MapReader::readSpawns},
};

void MapReader::read()
{
	loader.enterRoot();
	if (!loader.hadIdentifier()) {
		report.addWarning(MAPWARNING_MISSING_IDENTIFIER, "File has no identifier, reading it as OTBM.");
	}

	readRootHeader();

	if (context.houseRegistry) {
		for (const auto& it : context.houseRegistry->getHouses()) {
			House& house = map.houses.addHouse(it.first);
			house = it.second;
			house.clearTiles();
		}
	}

	uint8_t type;
	if (!loader.nextChild(type) || type != OTBM_MAP_DATA) {
		loader.fail("Could not read data node.");
	}

	readMapDataAttributes();

	while (loader.nextChild(type)) {
		if (context.cancellation) {
			context.cancellation->throwIfCancelled();
		}

		auto it = std::find_if(std::begin(mapDataDecoders), std::end(mapDataDecoders),
		                       [type](const NodeDecoder& decoder) { return decoder.type == type; });
		if (it != std::end(mapDataDecoders)) {
			(this->*(it->handler))();
		} else {
			report.addWarning(MAPWARNING_UNKNOWN_NODE,
			                  fmt::format("Unknown map node {:d} at offset {:d} skipped.", type, loader.tell()));
		}
		loader.leaveNode();
	}
	loader.leaveNode();

	while (loader.nextChild(type)) {
		report.addWarning(MAPWARNING_UNKNOWN_NODE,
		                  fmt::format("Unknown root node {:d} at offset {:d} skipped.", type, loader.tell()));
		loader.leaveNode();
	}
	loader.leaveNode();

	// an END inside a payload closes nodes early and leaves the real END behind the root
	if (loader.hasTrailingData()) {
		loader.fail("Data after the root node.");
	}

	MapStatistics& stats = report.stats;
	stats.tiles = map.getTileCount();
	stats.items = guard.getItemCount();
	stats.towns = map.towns.size();
	stats.waypoints = map.waypoints.size();
	stats.spawns = map.spawns.size();
}

void MapReader::readRootHeader()
{
	PropStream propStream;
	if (!loader.getProps(propStream)) {
		loader.fail("Could not read root property.");
	}

	OTBM_root_header root_header;
	if (!propStream.read(root_header)) {
		loader.fail("Could not read header.");
	}

	const ItemsOtbVersion* itemsVersion = context.items ? &context.items->getOtbVersion() : nullptr;
	report.format = resolveMapFormat(context.hint, root_header.version, itemsVersion);

	if (!report.format.isSupported()) {
		if (!context.hint.allowUnsupportedVersions) {
			throw MapLoadError(MAPIO_ERROR_VERSION_UNSUPPORTED,
			                   fmt::format("Unsupported OTBM version {:d}, the newest known version is {:d}.",
			                               report.format.otbmVersion, otmapio::to_underlying(OTBM_VERSION_LAST)));
		}

		report.addWarning(MAPWARNING_UNSUPPORTED_VERSION,
		                  fmt::format("Unsupported OTBM version {:d}, reading it with the rules of version {:d}.",
		                              report.format.otbmVersion, otmapio::to_underlying(OTBM_VERSION_LAST)));
	}

	if (report.format.usesClientId && (!context.idMapper || context.idMapper->empty())) {
		throw MapLoadError(MAPIO_ERROR_UNMAPPABLE_ID,
		                   fmt::format("{:s} stores client ids, an item database with client ids is required.",
		                               getOTBMVersionName(report.format.otbmVersion)));
	}

	format.format = report.format;
	format.items = context.items;
	format.idMapper = context.idMapper;

	MapHeader& header = map.header;
	header.otbmVersion = root_header.version;
	header.width = root_header.width;
	header.height = root_header.height;
	header.majorVersionItems = root_header.majorVersionItems;
	header.minorVersionItems = root_header.minorVersionItems;
}

void MapReader::readMapDataAttributes()
{
	PropStream propStream;
	if (!loader.getProps(propStream)) {
		loader.fail("Could not read map data attributes.");
	}

	MapHeader& header = map.header;
	std::string tmp;

	while (propStream.size() > 0) {
		const size_t mark = propStream.tell();

		uint8_t attribute;
		propStream.read<uint8_t>(attribute);

		bool valid = true;
		switch (attribute) {
			case OTBM_ATTR_DESCRIPTION:
				valid = propStream.readString(tmp);
				if (valid) {
					if (!header.description.empty()) {
						header.description.push_back('\n');
					}
					header.description += tmp;
				}
				break;

			case OTBM_ATTR_EXT_SPAWN_FILE:
				valid = propStream.readString(header.spawnFile);
				break;

			case OTBM_ATTR_EXT_SPAWN_NPC_FILE:
				valid = propStream.readString(header.npcFile);
				break;

			case OTBM_ATTR_EXT_HOUSE_FILE:
				valid = propStream.readString(header.houseFile);
				break;

			case OTBM_ATTR_EXT_ZONE_FILE:
				valid = propStream.readString(header.zoneFile);
				break;

			default:
				propStream.seek(mark);
				propStream.readRemainder(header.unknownAttributes);
				report.addRecoverable(MAPWARNING_UNKNOWN_ATTRIBUTE,
				                      fmt::format("Unknown map data attribute {:d}, {:d} bytes kept.", attribute,
				                                  header.unknownAttributes.size()));
				return;
		}

		if (!valid) {
			propStream.seek(mark);
			propStream.readRemainder(header.unknownAttributes);
			report.addRecoverable(MAPWARNING_MALFORMED_ATTRIBUTE,
			                      fmt::format("Invalid map data attribute {:d}, {:d} bytes kept.", attribute,
			                                  header.unknownAttributes.size()));
			return;
		}
	}
}

void MapReader::readTileArea()
{
	PropStream propStream;
	if (!loader.getProps(propStream)) {
		loader.fail("Invalid map node.");
	}

	OTBM_Destination_coords area_coord;
	if (!propStream.read(area_coord)) {
		loader.fail("Invalid map node.");
	}

	const Position base(area_coord.x, area_coord.y, area_coord.z);

	uint8_t type;
	while (loader.nextChild(type)) {
		if (type != OTBM_TILE && type != OTBM_HOUSETILE) {
			loader.fail("Unknown tile node.");
		}

		readTile(type, base);
		loader.leaveNode();
	}
}

void MapReader::readTile(uint8_t tileType, const Position& base)
{
	PropStream propStream;
	if (!loader.getProps(propStream)) {
		loader.fail("Could not read node data.");
	}

	OTBM_Tile_coords tile_coord;
	if (!propStream.read(tile_coord)) {
		loader.fail("Could not read tile position.");
	}

	const uint32_t x = base.x + tile_coord.x;
	const uint32_t y = base.y + tile_coord.y;
	if (x > std::numeric_limits<uint16_t>::max() || y > std::numeric_limits<uint16_t>::max()) {
		report.addRecoverable(MAPWARNING_TILE_POSITION_INVALID,
		                      fmt::format("[x:{:d}, y:{:d}, z:{:d}] Tile position out of range, tile skipped.", x, y,
		                                  base.z),
		                      base);
		return;
	}

	Tile tile(x, y, base.z);
	const Position pos = tile.getPosition();

	if (tileType == OTBM_HOUSETILE) {
		uint32_t houseId;
		if (!propStream.read<uint32_t>(houseId)) {
			loader.fail(fmt::format("{:s} Could not read house id.", formatPosition(pos)));
		}
		tile.setHouseId(houseId);
	}

	// read tile attributes
	while (propStream.size() > 0) {
		const size_t mark = propStream.tell();

		uint8_t attribute;
		propStream.read<uint8_t>(attribute);

		bool valid = true;
		switch (attribute) {
			case OTBM_ATTR_TILE_FLAGS: {
				uint32_t flags;
				valid = propStream.read<uint32_t>(flags);
				if (valid) {
					tile.setFlags(flags);
				}
				break;
			}

			case OTBM_ATTR_ITEM: {
				Item item;
				bool keep = true;
				valid = readItemId(propStream, item, pos, keep) && item.readInlineSubType(propStream, format);
				if (valid && keep) {
					guard.addItems(1);
					if (!tile.getGround()) {
						tile.setGround(std::move(item));
					} else {
						tile.addItem(std::move(item));
					}
				}
				break;
			}

			default: {
				propStream.seek(mark);

				std::string remainder;
				propStream.readRemainder(remainder);
				tile.setUnknownAttributes(remainder);

				report.addRecoverable(MAPWARNING_UNKNOWN_ATTRIBUTE,
				                      fmt::format("{:s} Unknown tile attribute {:d}, {:d} bytes kept.",
				                                  formatPosition(pos), attribute, remainder.size()),
				                      pos);
				break;
			}
		}

		if (!valid) {
			propStream.seek(mark);

			std::string remainder;
			propStream.readRemainder(remainder);
			tile.setUnknownAttributes(remainder);

			report.addRecoverable(MAPWARNING_MALFORMED_ATTRIBUTE,
			                      fmt::format("{:s} Invalid tile attribute {:d}, {:d} bytes kept.", formatPosition(pos),
			                                  attribute, remainder.size()),
			                      pos);
		}
	}

	uint8_t type;
	while (loader.nextChild(type)) {
		if (type == OTBM_ITEM) {
			std::optional<Item> item = readItemTree(pos);
			if (item) {
				if (!tile.getGround() && tile.getItems().empty() && isGround(*item)) {
					tile.setGround(std::move(*item));
				} else {
					tile.addItem(std::move(*item));
				}
			}
		} else if (type == OTBM_TILE_ZONE) {
			readTileZones(tile);
			loader.leaveNode();
		} else {
			loader.fail(fmt::format("{:s} Unknown node type.", formatPosition(pos)));
		}
	}

	addTile(std::move(tile));
}

void MapReader::readTileZones(Tile& tile)
{
	const Position& pos = tile.getPosition();

	PropStream propStream;
	if (!loader.getProps(propStream)) {
		loader.fail("Invalid zone node.");
	}

	uint16_t count;
	if (!propStream.read<uint16_t>(count)) {
		report.addRecoverable(MAPWARNING_MALFORMED_ATTRIBUTE,
		                      fmt::format("{:s} Could not read zone count.", formatPosition(pos)), pos);
		return;
	}

	for (uint16_t i = 0; i < count; ++i) {
		uint16_t zoneId;
		if (!propStream.read<uint16_t>(zoneId)) {
			report.addRecoverable(
			    MAPWARNING_MALFORMED_ATTRIBUTE,
			    fmt::format("{:s} Zone list truncated after {:d} of {:d} ids.", formatPosition(pos), i, count), pos);
			return;
		}
		tile.addZoneId(zoneId);
	}
}

void MapReader::addTile(Tile&& tile)
{
	const Position pos = tile.getPosition();

	if (map.getTile(pos)) {
		report.addWarning(MAPWARNING_DUPLICATE_TILE,
		                  fmt::format("{:s} Tile defined twice, the second one is ignored.", formatPosition(pos)), pos);
		return;
	}

	guard.addTile();

	const MapHeader& header = map.header;
	if (header.width != 0 && header.height != 0 && !pos.isInBounds(header.width, header.height)) {
		report.addWarning(MAPWARNING_TILE_OUT_OF_BOUNDS,
		                  fmt::format("{:s} Tile outside of the declared map size {:d}x{:d}.", formatPosition(pos),
		                              header.width, header.height),
		                  pos);
	}

	if (const uint32_t houseId = tile.getHouseId(); houseId != 0) {
		if (House* house = map.houses.getHouse(houseId)) {
			house->addTile(pos);
			++report.stats.houseTiles;
		} else if (missingHouses.insert(houseId).second) {
			report.addWarning(MAPWARNING_HOUSE_MISSING,
			                  fmt::format("{:s} Tile references house id {:d} which is not defined.",
			                              formatPosition(pos), houseId),
			                  pos);
		}
	}

	map.setTile(std::move(tile));
}

std::optional<Item> MapReader::readItemTree(const Position& pos)
{
	Item root;
	if (!readItemNode(root, pos)) {
		loader.leaveNode();
		return std::nullopt;
	}

	// open containers, innermost last
	std::vector<Item*> parents{&root};
	while (!parents.empty()) {
		uint8_t type;
		if (!loader.nextChild(type)) {
			loader.leaveNode();
			parents.pop_back();
			continue;
		}

		if (type != OTBM_ITEM) {
			loader.fail(fmt::format("{:s} Unknown node type inside item {:d}.", formatPosition(pos),
			                        parents.back()->getID()));
		}

		Item child;
		if (!readItemNode(child, pos)) {
			loader.leaveNode();
			continue;
		}

		Item& added = parents.back()->addItem(std::move(child));
		parents.push_back(&added);
	}
	return root;
}

bool MapReader::readItemNode(Item& item, const Position& pos)
{
	PropStream propStream;
	if (!loader.getProps(propStream)) {
		loader.fail("Invalid item node.");
	}

	bool keep = true;
	if (!readItemId(propStream, item, pos, keep)) {
		loader.fail(fmt::format("{:s} Could not read item id.", formatPosition(pos)));
	}

	if (!keep) {
		return false;
	}

	guard.addItems(1);

	if (!item.readInlineSubType(propStream, format)) {
		report.addRecoverable(MAPWARNING_MALFORMED_ATTRIBUTE,
		                      fmt::format("{:s} Missing count of item {:d}.", formatPosition(pos), item.getID()), pos);
		return true;
	}

	uint8_t failedAttr = 0;
	if (!item.unserializeAttr(propStream, failedAttr)) {
		if (Item::isKnownAttribute(failedAttr)) {
			report.addRecoverable(MAPWARNING_MALFORMED_ATTRIBUTE,
			                      fmt::format("{:s} Invalid attribute {:d} on item {:d}, {:d} bytes kept.",
			                                  formatPosition(pos), failedAttr, item.getID(),
			                                  item.getUnknownAttributes().size()),
			                      pos);
		} else {
			report.addRecoverable(MAPWARNING_UNKNOWN_ATTRIBUTE,
			                      fmt::format("{:s} Unknown attribute {:d} on item {:d}, {:d} bytes kept.",
			                                  formatPosition(pos), failedAttr, item.getID(),
			                                  item.getUnknownAttributes().size()),
			                      pos);
		}
	}
	return true;
}

bool MapReader::readItemId(PropStream& propStream, Item& item, const Position& pos, bool& keep)
{
	uint16_t id;
	if (!propStream.read<uint16_t>(id)) {
		return false;
	}

	keep = true;

	if (format.format.usesClientId) {
		uint16_t serverId;
		if (format.idMapper->clientToServer(id, serverId)) {
			item.setID(serverId);
			return true;
		}

		switch (context.unknownItemPolicy) {
			case UNKNOWN_ITEM_ERROR:
				throw UnmappedItemId(id, true);

			case UNKNOWN_ITEM_SKIP:
				keep = false;
				report.addWarning(MAPWARNING_ITEM_SKIPPED,
				                  fmt::format("{:s} Client id {:d} has no server id, item skipped.",
				                              formatPosition(pos), id),
				                  pos);
				return true;

			default:
				item.setPlaceholder(id, true);
				report.addRecoverable(MAPWARNING_UNMAPPED_CLIENT_ID,
				                      fmt::format("{:s} Client id {:d} has no server id, kept as placeholder.",
				                                  formatPosition(pos), id),
				                      pos);
				return true;
		}
	}

	item.setID(id);
	if (context.items && !context.items->hasItemType(id) && unknownItemIds.insert(id).second) {
		report.addWarning(MAPWARNING_UNKNOWN_ITEM_ID,
		                  fmt::format("{:s} Item id {:d} is not in the item database.", formatPosition(pos), id), pos);
	}
	return true;
}

bool MapReader::isGround(const Item& item) const
{
	if (item.isPlaceholder()) {
		return false;
	}

	// ground is written first, an item type not known to the database is taken as ground
	if (!context.items) {
		return true;
	}

	const ItemType* iType = context.items->getItemType(item.getID());
	return !iType || iType->isGroundTile();
}

void MapReader::readTowns()
{
	uint8_t type;
	while (loader.nextChild(type)) {
		if (type != OTBM_TOWN) {
			loader.fail("Unknown town node.");
		}

		PropStream propStream;
		if (!loader.getProps(propStream)) {
			loader.fail("Could not read town data.");
		}

		uint32_t townId;
		if (!propStream.read<uint32_t>(townId)) {
			loader.fail("Could not read town id.");
		}

		std::string townName;
		if (!propStream.readString(townName)) {
			loader.fail("Could not read town name.");
		}

		OTBM_Destination_coords town_coords;
		if (!propStream.read(town_coords)) {
			loader.fail("Could not read town coordinates.");
		}

		Town* town = map.towns.getTown(townId);
		if (town) {
			report.addWarning(MAPWARNING_DUPLICATE_TOWN,
			                  fmt::format("Town {:d} defined twice, the later definition is used.", townId));
		} else {
			map.towns.addTown(townId, Town(townId));
			town = map.towns.getTown(townId);
		}

		town->setName(townName);
		town->setTemplePos(Position(town_coords.x, town_coords.y, town_coords.z));

		loader.leaveNode();
	}
}

void MapReader::readWaypoints()
{
	uint8_t type;
	while (loader.nextChild(type)) {
		if (type != OTBM_WAYPOINT) {
			loader.fail("Unknown waypoint node.");
		}

		PropStream propStream;
		if (!loader.getProps(propStream)) {
			loader.fail("Could not read waypoint data.");
		}

		std::string name;
		if (!propStream.readString(name)) {
			loader.fail("Could not read waypoint name.");
		}

		OTBM_Destination_coords waypoint_coords;
		if (!propStream.read(waypoint_coords)) {
			loader.fail("Could not read waypoint coordinates.");
		}

		if (map.waypoints.find(name) != map.waypoints.end()) {
			report.addWarning(MAPWARNING_DUPLICATE_WAYPOINT,
			                  fmt::format("Waypoint \"{:s}\" defined twice, the later definition is used.", name));
		}

		map.waypoints[name] = Position(waypoint_coords.x, waypoint_coords.y, waypoint_coords.z);
		loader.leaveNode();
	}
}

void MapReader::readSpawns()
{
	uint8_t type;
	while (loader.nextChild(type)) {
		if (type != OTBM_SPAWN_AREA) {
			loader.fail("Unknown spawn node.");
		}

		PropStream propStream;
		if (!loader.getProps(propStream)) {
			loader.fail("Could not read spawn data.");
		}

		OTBM_Destination_coords center;
		uint32_t radius;
		if (!propStream.read(center) || !propStream.read<uint32_t>(radius)) {
			loader.fail("Could not read spawn area.");
		}

		SpawnArea spawn(Position(center.x, center.y, center.z), radius);

		uint8_t creatureType;
		while (loader.nextChild(creatureType)) {
			if (creatureType != OTBM_MONSTER) {
				loader.fail("Unknown spawn creature node.");
			}

			if (!loader.getProps(propStream)) {
				loader.fail("Could not read spawn creature.");
			}

			std::string name;
			int16_t offsetX, offsetY;
			uint32_t interval;
			if (!propStream.readString(name) || !propStream.read<int16_t>(offsetX) ||
			    !propStream.read<int16_t>(offsetY) || !propStream.read<uint32_t>(interval)) {
				loader.fail("Could not read spawn creature.");
			}

			spawn.addCreature(name, offsetX, offsetY, interval);
			loader.leaveNode();
		}

		map.spawns.push_back(std::move(spawn));
		loader.leaveNode();
	}
}

void loadMapFromStream(std::istream& stream, const MapLoadContext& context, MapLoadResult& result)
{
	MapLoadReport& report = result.report;
	if (!stream.good()) {
		report.fail(MAPIO_ERROR_FILE_ACCESS, "Map stream is not readable.");
		return;
	}

	OTB::LoaderLimits loaderLimits;
	if (context.limits.enabled) {
		loaderLimits.maxPayloadSize = context.limits.maxNodePayload;
		loaderLimits.maxDepth = context.limits.maxNodeDepth;
	} else {
		loaderLimits.maxPayloadSize = std::numeric_limits<size_t>::max();
		loaderLimits.maxDepth = std::numeric_limits<size_t>::max();
	}

	OTB::Loader loader(stream, OTBM_IDENTIFIER, loaderLimits);
	loader.setNodeNamer(getOTBMNodeName);

	auto map = std::make_unique<Map>();
	try {
		MapReader reader(loader, context, report, *map);
		reader.read();
		report.success = true;
	} catch (const OTB::InvalidOTBFormat& err) {
		report.fail(MAPIO_ERROR_STRUCTURAL_CORRUPTION, err.what());
		report.errorOffset = err.getOffset();
		report.errorNodePath = err.getNodePath();
	} catch (const ResourceLimitError& err) {
		report.fail(MAPIO_ERROR_RESOURCE_LIMIT, err.what());
		report.errorOffset = loader.tell();
		report.errorNodePath = loader.getNodePath();
	} catch (const UnmappedItemId& err) {
		report.fail(MAPIO_ERROR_UNMAPPABLE_ID, err.what());
		report.errorOffset = loader.tell();
		report.errorNodePath = loader.getNodePath();
	} catch (const MapLoadError& err) {
		report.fail(err.getCode(), err.what());
	} catch (const CancelledError& err) {
		report.fail(MAPIO_ERROR_CANCELLED, err.what());
		report.errorOffset = loader.tell();
	} catch (const std::bad_alloc&) {
		report.fail(MAPIO_ERROR_RESOURCE_LIMIT, "Out of memory while loading the map.");
		report.errorOffset = loader.tell();
	}

	report.stats.peakPayloadSize = loader.getPeakPayloadSize();
	report.stats.peakDepth = loader.getPeakDepth();

	if (report.success) {
		result.map = std::move(map);
	}
}

} // namespace

MapLoadResult IOMap::loadMap(std::istream& stream, const MapLoadContext& context)
{
	MapLoadResult result;
	loadMapFromStream(stream, context, result);
	return result;
}

MapLoadResult IOMap::loadMap(const std::string& fileName, const MapLoadContext& context)
{
	MapLoadResult result;
	MapLoadReport& report = result.report;

	std::ifstream file(fileName, std::ios::binary);
	if (!file.is_open()) {
		report.fail(MAPIO_ERROR_FILE_ACCESS, fmt::format("Could not open file {:s}.", fileName));
		return result;
	}

	const MapFileKind_t kind = detectMapFile(file);
	if (!isOTBMFileKind(kind)) {
		report.fail(MAPIO_ERROR_STRUCTURAL_CORRUPTION,
		            fmt::format("{:s} is not an OTBM map, detected {:s}.", fileName, getMapFileKindName(kind)));
		return result;
	}

	std::error_code ec;
	const uintmax_t fileSize = std::filesystem::file_size(fileName, ec);
	if (!ec) {
		try {
			ResourceGuard guard(context.limits, report);
			guard.checkFileSize(fileSize);
		} catch (const ResourceLimitError& err) {
			report.fail(MAPIO_ERROR_RESOURCE_LIMIT, err.what());
			return result;
		}
	}

	loadMapFromStream(file, context, result);
	return result;
}

bool IOMap::readHeader(std::istream& stream, OTBM_root_header& header, bool& hadIdentifier, std::string& error)
{
	try {
		OTB::Loader loader(stream, OTBM_IDENTIFIER);
		loader.setNodeNamer(getOTBMNodeName);
		loader.enterRoot();
		hadIdentifier = loader.hadIdentifier();

		PropStream propStream;
		if (!loader.getProps(propStream) || !propStream.read(header)) {
			error = "Could not read header.";
			return false;
		}
	} catch (const OTB::InvalidOTBFormat& err) {
		error = err.what();
		return false;
	} catch (const ResourceLimitError& err) {
		error = err.what();
		return false;
	}
	return true;
}

bool IOMap::readHeader(const std::string& fileName, OTBM_root_header& header, bool& hadIdentifier,
                       std::string& error)
{
	std::ifstream file(fileName, std::ios::binary);
	if (!file.is_open()) {
		error = fmt::format("Could not open file {:s}.", fileName);
		return false;
	}
	return readHeader(file, header, hadIdentifier, error);
}
