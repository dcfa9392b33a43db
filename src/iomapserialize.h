// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "mapreport.h"
#include "mapversion.h"

#include <ostream>
#include <string>

class CancellationToken;
class IdMapper;
class ItemDatabase;
class Map;

struct MapSaveContext
{
	// target format, the header version of the map is not consulted
	MapFormat format;

	const ItemDatabase* items = nullptr;
	// required for ClientID targets
	const IdMapper* idMapper = nullptr;
	const CancellationToken* cancellation = nullptr;
};

class IOMapSerialize
{
public:
	/**
	 * Writes the map to fileName through a temporary file in the same directory.
	 * The destination is untouched unless the whole map was written and synced.
	 */
	static MapSaveReport saveMap(const Map& map, const std::string& fileName, const MapSaveContext& context);

	// writes the map onto stream without any pre-flight check
	static bool serializeMap(const Map& map, std::ostream& stream, const MapSaveContext& context,
	                         MapSaveReport& report);

	// verifies that every item can be written in the id space of the target format
	static bool checkItemIds(const Map& map, const MapSaveContext& context, MapSaveReport& report);
};
