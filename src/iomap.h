// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "const.h"
#include "enums.h"
#include "mapreport.h"
#include "mapversion.h"
#include "resourceguard.h"

#include <istream>
#include <string>

class CancellationToken;
class Houses;
class IdMapper;
class ItemDatabase;

struct MapLoadContext
{
	FormatHint hint;

	const ItemDatabase* items = nullptr;
	// required for ClientID maps
	const IdMapper* idMapper = nullptr;
	// houses known from outside the map file, house tiles are matched against them
	const Houses* houseRegistry = nullptr;
	const CancellationToken* cancellation = nullptr;

	ResourceLimits limits;
	UnknownItemPolicy_t unknownItemPolicy = UNKNOWN_ITEM_PLACEHOLDER;
};

class IOMap
{
public:
	/**
	 * Loads a map file.
	 * Never throws for file content, every failure is described by the report.
	 * \returns the map, or no map and report.success == false
	 */
	static MapLoadResult loadMap(const std::string& fileName, const MapLoadContext& context);
	static MapLoadResult loadMap(std::istream& stream, const MapLoadContext& context);

	// reads the root header only, without visiting any other node
	static bool readHeader(std::istream& stream, OTBM_root_header& header, bool& hadIdentifier, std::string& error);
	static bool readHeader(const std::string& fileName, OTBM_root_header& header, bool& hadIdentifier,
	                       std::string& error);
};
