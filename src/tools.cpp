// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "tools.h"

#include "const.h"

#include <pugixml.hpp>

void printXMLError(const std::string& where, const std::string& fileName, const pugi::xml_parse_result& result,
                   std::string& error)
{
	error = fmt::format("[{:s}] Failed to load {:s}: {:s}", where, fileName, result.description());

	FILE* file = fopen(fileName.c_str(), "rb");
	if (!file) {
		return;
	}

	char buffer[32768];
	uint32_t currentLine = 1;
	std::string line;

	auto offset = static_cast<size_t>(result.offset);
	size_t lineOffsetPosition = 0;
	size_t index = 0;
	size_t bytes;
	do {
		bytes = fread(buffer, 1, 32768, file);
		for (size_t i = 0; i < bytes; ++i) {
			char ch = buffer[i];
			if (ch == '\n') {
				if ((index + i) >= offset) {
					lineOffsetPosition = line.length() - ((index + i) - offset);
					bytes = 0;
					break;
				}
				++currentLine;
				line.clear();
			} else {
				line.push_back(ch);
			}
		}
		index += bytes;
	} while (bytes == 32768);
	fclose(file);

	error += fmt::format("\nLine {:d}:\n{:s}\n{:s}^", currentLine, line, std::string(lineOffsetPosition, ' '));
}

void toLowerCaseString(std::string& source)
{
	std::transform(source.begin(), source.end(), source.begin(), [](unsigned char c) { return std::tolower(c); });
}

std::string asLowerCaseString(std::string source)
{
	toLowerCaseString(source);
	return source;
}

bool booleanString(const std::string& str)
{
	if (str.empty()) {
		return false;
	}

	char ch = std::tolower(static_cast<unsigned char>(str.front()));
	return ch != 'f' && ch != 'n' && ch != '0';
}

std::string formatBytes(uint64_t bytes)
{
	if (bytes >= 1024 * 1024) {
		return fmt::format("{:.2f} MB", bytes / (1024. * 1024.));
	} else if (bytes >= 1024) {
		return fmt::format("{:.2f} KB", bytes / 1024.);
	}
	return fmt::format("{:d} bytes", bytes);
}

const char* getOTBMNodeName(uint8_t type)
{
	switch (type) {
		case 0:
		case OTBM_ROOTV1:
			return "root";
		case OTBM_MAP_DATA:
			return "map_data";
		case OTBM_ITEM_DEF:
			return "item_def";
		case OTBM_TILE_AREA:
			return "tile_area";
		case OTBM_TILE:
			return "tile";
		case OTBM_ITEM:
			return "item";
		case OTBM_TILE_SQUARE:
			return "tile_square";
		case OTBM_TILE_REF:
			return "tile_ref";
		case OTBM_SPAWNS:
			return "spawns";
		case OTBM_SPAWN_AREA:
			return "spawn_area";
		case OTBM_MONSTER:
			return "monster";
		case OTBM_TOWNS:
			return "towns";
		case OTBM_TOWN:
			return "town";
		case OTBM_HOUSETILE:
			return "house_tile";
		case OTBM_WAYPOINTS:
			return "waypoints";
		case OTBM_WAYPOINT:
			return "waypoint";
		case OTBM_TILE_ZONE:
			return "tile_zone";
		default:
			return nullptr;
	}
}

const char* getMapIOErrorName(MapIOError_t error)
{
	switch (error) {
		case MAPIO_ERROR_NONE:
			return "None";
		case MAPIO_ERROR_STRUCTURAL_CORRUPTION:
			return "StructuralCorruption";
		case MAPIO_ERROR_UNMAPPABLE_ID:
			return "UnmappableId";
		case MAPIO_ERROR_RESOURCE_LIMIT:
			return "ResourceLimitExceeded";
		case MAPIO_ERROR_VERSION_UNSUPPORTED:
			return "VersionUnsupported";
		case MAPIO_ERROR_CANCELLED:
			return "Cancelled";
		case MAPIO_ERROR_FILE_ACCESS:
			return "FileAccess";
		default:
			return "Unknown";
	}
}

const char* getMapWarningName(MapWarningCode_t code)
{
	switch (code) {
		case MAPWARNING_UNKNOWN_ATTRIBUTE:
			return "UNKNOWN_ATTRIBUTE";
		case MAPWARNING_MALFORMED_ATTRIBUTE:
			return "MALFORMED_ATTRIBUTE";
		case MAPWARNING_UNMAPPED_CLIENT_ID:
			return "UNMAPPED_CLIENT_ID";
		case MAPWARNING_TILE_POSITION_INVALID:
			return "TILE_POSITION_INVALID";
		case MAPWARNING_UNKNOWN_ITEM_ID:
			return "UNKNOWN_ITEM_ID";
		case MAPWARNING_TILE_OUT_OF_BOUNDS:
			return "TILE_OUT_OF_BOUNDS";
		case MAPWARNING_DUPLICATE_TILE:
			return "DUPLICATE_TILE";
		case MAPWARNING_HOUSE_MISSING:
			return "HOUSE_MISSING";
		case MAPWARNING_DUPLICATE_TOWN:
			return "DUPLICATE_TOWN";
		case MAPWARNING_DUPLICATE_WAYPOINT:
			return "DUPLICATE_WAYPOINT";
		case MAPWARNING_MISSING_IDENTIFIER:
			return "MISSING_IDENTIFIER";
		case MAPWARNING_RESOURCE_SOFT_LIMIT:
			return "RESOURCE_SOFT_LIMIT";
		case MAPWARNING_UNSUPPORTED_VERSION:
			return "UNSUPPORTED_VERSION";
		case MAPWARNING_ATTRIBUTE_MAP_DROPPED:
			return "ATTRIBUTE_MAP_DROPPED";
		case MAPWARNING_WAYPOINTS_DROPPED:
			return "WAYPOINTS_DROPPED";
		case MAPWARNING_ITEM_SKIPPED:
			return "ITEM_SKIPPED";
		case MAPWARNING_UNKNOWN_NODE:
			return "UNKNOWN_NODE";
		case MAPWARNING_ZONES_DROPPED:
			return "ZONES_DROPPED";
		default:
			return "UNKNOWN";
	}
}

const char* getValidationCodeName(ValidationCode_t code)
{
	switch (code) {
		case VALIDATION_MAP_DIMENSIONS_INVALID:
			return "MAP_DIMENSIONS_INVALID";
		case VALIDATION_TILE_OUT_OF_BOUNDS:
			return "TILE_OUT_OF_BOUNDS";
		case VALIDATION_HOUSE_ID_MISSING:
			return "HOUSE_ID_MISSING";
		case VALIDATION_HOUSE_TILE_MISMATCH:
			return "HOUSE_TILE_MISMATCH";
		case VALIDATION_HOUSE_UNUSED:
			return "HOUSE_UNUSED";
		case VALIDATION_HOUSE_TOWN_MISSING:
			return "HOUSE_TOWN_MISSING";
		case VALIDATION_HOUSE_ENTRY_OUT_OF_BOUNDS:
			return "HOUSE_ENTRY_OUT_OF_BOUNDS";
		case VALIDATION_HOUSE_ENTRY_MISSING_TILE:
			return "HOUSE_ENTRY_MISSING_TILE";
		case VALIDATION_TOWN_ID_INVALID:
			return "TOWN_ID_INVALID";
		case VALIDATION_TOWN_TEMPLE_OUT_OF_BOUNDS:
			return "TOWN_TEMPLE_OUT_OF_BOUNDS";
		case VALIDATION_WAYPOINT_EMPTY_NAME:
			return "WAYPOINT_EMPTY_NAME";
		case VALIDATION_WAYPOINT_OUT_OF_BOUNDS:
			return "WAYPOINT_OUT_OF_BOUNDS";
		case VALIDATION_SPAWN_OUT_OF_BOUNDS:
			return "SPAWN_OUT_OF_BOUNDS";
		case VALIDATION_SPAWN_RADIUS_INVALID:
			return "SPAWN_RADIUS_INVALID";
		case VALIDATION_SPAWN_EMPTY_NAME:
			return "SPAWN_EMPTY_NAME";
		case VALIDATION_ITEM_PLACEHOLDER:
			return "ITEM_PLACEHOLDER";
		case VALIDATION_ITEM_UNKNOWN:
			return "ITEM_UNKNOWN";
		default:
			return "UNKNOWN";
	}
}
