// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "const.h"
#include "enums.h"

#include <optional>
#include <string>

class IdMapper;
class ItemDatabase;

// version block of an items.otb root node
struct ItemsOtbVersion
{
	uint32_t majorVersion = 0;
	uint32_t minorVersion = 0;
	uint32_t buildNumber = 0;
	std::string csdVersion;
};

// what a project file, a workspace or the user knows about the map before it is opened
struct FormatHint
{
	uint32_t clientVersion = 0;
	std::optional<uint32_t> otbmVersion;
	MapEngine_t engine = MAP_ENGINE_UNKNOWN;
	std::string itemsOtbPath;
	std::string itemsXmlPath;
	std::string dataDirectory = "data";
	bool allowUnsupportedVersions = false;
};

struct MapFormat
{
	uint32_t otbmVersion = OTBM_VERSION_DEFAULT;
	bool usesClientId = false;
	uint32_t clientVersion = 0;
	MapEngine_t engine = MAP_ENGINE_TFS;
	std::string itemsOtbPath;
	std::string itemsXmlPath;
	VersionSource_t source = VERSION_SOURCE_FALLBACK;

	static MapFormat forVersion(uint32_t otbmVersion);

	bool isSupported() const { return otbmVersion <= OTBM_VERSION_LAST; }
	bool hasInlineSubType() const { return otbmVersion == OTBM_VERSION_1; }
	bool hasWaypoints() const { return otbmVersion >= OTBM_VERSION_3; }
	bool hasAttributeMap() const { return otbmVersion >= OTBM_VERSION_4; }
	bool hasTileZones() const { return otbmVersion >= OTBM_VERSION_7; }
};

/**
 * Everything an entity decoder or encoder needs to know about the file it works on.
 * Passed explicitly through every call, nothing about the format is kept globally.
 */
struct FormatContext
{
	MapFormat format;
	const ItemDatabase* items = nullptr;
	const IdMapper* idMapper = nullptr;
};

uint32_t getClientVersionFromItems(const ItemsOtbVersion& version);

MapFormat resolveMapFormat(const FormatHint& hint, std::optional<uint32_t> headerVersion,
                           const ItemsOtbVersion* itemsVersion = nullptr);

// looks for items.otb or items.xml below the data directory, empty if nothing exists
std::string findItemsFile(const std::string& dataDirectory, MapEngine_t engine, const std::string& fileName);

MapEngine_t parseMapEngine(const std::string& name);
const char* getMapEngineName(MapEngine_t engine);
const char* getVersionSourceName(VersionSource_t source);
std::string getOTBMVersionName(uint32_t otbmVersion);
