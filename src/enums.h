// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include <cstdint>

enum MapIOError_t : uint8_t
{
	MAPIO_ERROR_NONE,
	MAPIO_ERROR_STRUCTURAL_CORRUPTION,
	MAPIO_ERROR_UNMAPPABLE_ID,
	MAPIO_ERROR_RESOURCE_LIMIT,
	MAPIO_ERROR_VERSION_UNSUPPORTED,
	MAPIO_ERROR_CANCELLED,
	MAPIO_ERROR_FILE_ACCESS,
};

enum MapWarningCode_t : uint8_t
{
	// attribute anomalies, reported as recoverable errors
	MAPWARNING_UNKNOWN_ATTRIBUTE,
	MAPWARNING_MALFORMED_ATTRIBUTE,
	MAPWARNING_UNMAPPED_CLIENT_ID,
	MAPWARNING_TILE_POSITION_INVALID,

	// informational
	MAPWARNING_UNKNOWN_ITEM_ID,
	MAPWARNING_TILE_OUT_OF_BOUNDS,
	MAPWARNING_DUPLICATE_TILE,
	MAPWARNING_HOUSE_MISSING,
	MAPWARNING_DUPLICATE_TOWN,
	MAPWARNING_DUPLICATE_WAYPOINT,
	MAPWARNING_MISSING_IDENTIFIER,
	MAPWARNING_RESOURCE_SOFT_LIMIT,
	MAPWARNING_UNSUPPORTED_VERSION,
	MAPWARNING_ATTRIBUTE_MAP_DROPPED,
	MAPWARNING_WAYPOINTS_DROPPED,
	MAPWARNING_ITEM_SKIPPED,
	MAPWARNING_UNKNOWN_NODE,
	MAPWARNING_ZONES_DROPPED,
};

enum UnknownItemPolicy_t : uint8_t
{
	UNKNOWN_ITEM_PLACEHOLDER,
	UNKNOWN_ITEM_SKIP,
	UNKNOWN_ITEM_ERROR,
};

enum MapEngine_t : uint8_t
{
	MAP_ENGINE_UNKNOWN,
	MAP_ENGINE_TFS,
	MAP_ENGINE_CANARY,
};

enum VersionSource_t : uint8_t
{
	VERSION_SOURCE_HINT,
	VERSION_SOURCE_HEADER,
	VERSION_SOURCE_ITEMS_OTB,
	VERSION_SOURCE_FALLBACK,
};

enum MapFileKind_t : uint8_t
{
	MAP_FILE_UNKNOWN,
	MAP_FILE_OTBM,
	MAP_FILE_OTBM_NO_IDENTIFIER,
	MAP_FILE_OTMM,
	MAP_FILE_XML,
	MAP_FILE_JSON,
	MAP_FILE_EMPTY,
};

enum ValidationSeverity_t : uint8_t
{
	VALIDATION_WARNING,
	VALIDATION_ERROR,
};

enum ValidationCode_t : uint8_t
{
	VALIDATION_MAP_DIMENSIONS_INVALID,
	VALIDATION_TILE_OUT_OF_BOUNDS,
	VALIDATION_HOUSE_ID_MISSING,
	VALIDATION_HOUSE_TILE_MISMATCH,
	VALIDATION_HOUSE_UNUSED,
	VALIDATION_HOUSE_TOWN_MISSING,
	VALIDATION_HOUSE_ENTRY_OUT_OF_BOUNDS,
	VALIDATION_HOUSE_ENTRY_MISSING_TILE,
	VALIDATION_TOWN_ID_INVALID,
	VALIDATION_TOWN_TEMPLE_OUT_OF_BOUNDS,
	VALIDATION_WAYPOINT_EMPTY_NAME,
	VALIDATION_WAYPOINT_OUT_OF_BOUNDS,
	VALIDATION_SPAWN_OUT_OF_BOUNDS,
	VALIDATION_SPAWN_RADIUS_INVALID,
	VALIDATION_SPAWN_EMPTY_NAME,
	VALIDATION_ITEM_PLACEHOLDER,
	VALIDATION_ITEM_UNKNOWN,
};
