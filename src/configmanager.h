// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "enums.h"

#include <string>

struct FormatHint;

class ConfigManager
{
public:
	ConfigManager();

	enum boolean_config_t
	{
		RESOURCE_GUARD_ENABLED,
		ALLOW_UNSUPPORTED_VERSIONS,

		LAST_BOOLEAN_CONFIG /* this must be the last one */
	};

	enum string_config_t
	{
		CONFIG_FILE,
		DATA_DIRECTORY,
		ENGINE,
		ITEMS_OTB_PATH,
		ITEMS_XML_PATH,
		UNKNOWN_ITEM_POLICY,

		LAST_STRING_CONFIG /* this must be the last one */
	};

	enum integer_config_t
	{
		CLIENT_VERSION,
		OTBM_VERSION,
		MAX_FILE_SIZE_MB,
		WARN_FILE_SIZE_MB,
		MAX_TILES,
		WARN_TILES,
		MAX_ITEMS,
		WARN_ITEMS,
		MAX_NODE_PAYLOAD_KB,
		MAX_NODE_DEPTH,

		LAST_INTEGER_CONFIG /* this must be the last one */
	};

	bool load();

	// project sidecar next to a map, only the format hints are taken from it
	bool loadProjectHints(const std::string& mapFileName);
	static std::string findProjectFile(const std::string& mapFileName);

	const std::string& getString(string_config_t what) const;
	int32_t getNumber(integer_config_t what) const;
	bool getBoolean(boolean_config_t what) const;

	bool setString(string_config_t what, const std::string& value);
	bool setNumber(integer_config_t what, int32_t value);
	bool setBoolean(boolean_config_t what, bool value);

	UnknownItemPolicy_t getUnknownItemPolicy() const;
	FormatHint getFormatHint() const;

	const std::string& getLastError() const { return lastError; }

private:
	bool loadFile(const std::string& fileName, bool hintsOnly);

	std::string string[LAST_STRING_CONFIG] = {};
	int32_t integer[LAST_INTEGER_CONFIG] = {};
	bool boolean[LAST_BOOLEAN_CONFIG] = {};

	std::string lastError;
};
