// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include <lua.hpp>

#include "configmanager.h"
#include "mapversion.h"
#include "tools.h"

#if LUA_VERSION_NUM >= 502
#undef lua_strlen
#define lua_strlen lua_rawlen
#endif

namespace {

std::string getGlobalString(lua_State* L, const char* identifier, const char* defaultValue)
{
	lua_getglobal(L, identifier);
	if (!lua_isstring(L, -1)) {
		lua_pop(L, 1);
		return defaultValue;
	}

	size_t len = lua_strlen(L, -1);
	std::string ret(lua_tostring(L, -1), len);
	lua_pop(L, 1);
	return ret;
}

int32_t getGlobalNumber(lua_State* L, const char* identifier, const int32_t defaultValue = 0)
{
	lua_getglobal(L, identifier);
	if (!lua_isnumber(L, -1)) {
		lua_pop(L, 1);
		return defaultValue;
	}

	int32_t val = lua_tonumber(L, -1);
	lua_pop(L, 1);
	return val;
}

bool getGlobalBoolean(lua_State* L, const char* identifier, const bool defaultValue)
{
	lua_getglobal(L, identifier);
	if (!lua_isboolean(L, -1)) {
		if (!lua_isstring(L, -1)) {
			lua_pop(L, 1);
			return defaultValue;
		}

		size_t len = lua_strlen(L, -1);
		std::string ret(lua_tostring(L, -1), len);
		lua_pop(L, 1);
		return booleanString(ret);
	}

	int val = lua_toboolean(L, -1);
	lua_pop(L, 1);
	return val != 0;
}

// paths inside a configuration file are relative to the file itself
std::string resolvePath(const std::string& fileName, const std::string& path)
{
	if (path.empty()) {
		return path;
	}

	std::filesystem::path value(path);
	if (value.is_absolute()) {
		return path;
	}
	return (std::filesystem::path(fileName).parent_path() / value).lexically_normal().string();
}

} // namespace

ConfigManager::ConfigManager()
{
	string[CONFIG_FILE] = "otmapio.lua";
	string[DATA_DIRECTORY] = "data";
	string[ENGINE] = "unknown";
	string[UNKNOWN_ITEM_POLICY] = "placeholder";

	integer[OTBM_VERSION] = -1;
	integer[MAX_FILE_SIZE_MB] = 1024;
	integer[WARN_FILE_SIZE_MB] = 256;
	integer[MAX_TILES] = 2000000;
	integer[WARN_TILES] = 1000000;
	integer[MAX_ITEMS] = 16000000;
	integer[WARN_ITEMS] = 8000000;
	integer[MAX_NODE_PAYLOAD_KB] = 16 * 1024;
	integer[MAX_NODE_DEPTH] = 512;

	boolean[RESOURCE_GUARD_ENABLED] = true;
}

bool ConfigManager::load() { return loadFile(getString(CONFIG_FILE), false); }

std::string ConfigManager::findProjectFile(const std::string& mapFileName)
{
	std::filesystem::path mapPath(mapFileName);

	std::filesystem::path sidecar = mapPath;
	sidecar.replace_extension(".lua");

	std::error_code ec;
	if (std::filesystem::is_regular_file(sidecar, ec)) {
		return sidecar.string();
	}

	std::filesystem::path project = mapPath.parent_path() / "map_project.lua";
	if (std::filesystem::is_regular_file(project, ec)) {
		return project.string();
	}
	return {};
}

bool ConfigManager::loadProjectHints(const std::string& mapFileName)
{
	const std::string projectFile = findProjectFile(mapFileName);
	if (projectFile.empty()) {
		return false;
	}
	return loadFile(projectFile, true);
}

bool ConfigManager::loadFile(const std::string& fileName, bool hintsOnly)
{
	lua_State* L = luaL_newstate();
	if (!L) {
		throw std::runtime_error("Failed to allocate memory");
	}

	luaL_openlibs(L);

	if (luaL_dofile(L, fileName.c_str())) {
		lastError = fmt::format("[Error - ConfigManager::load] {:s}", lua_tostring(L, -1));
		lua_close(L);
		return false;
	}

	// format hints, shared by engine configuration and project files
	integer[CLIENT_VERSION] = getGlobalNumber(L, "clientVersion", integer[CLIENT_VERSION]);
	integer[OTBM_VERSION] = getGlobalNumber(L, "otbmVersion", integer[OTBM_VERSION]);
	string[ENGINE] = getGlobalString(L, "engine", string[ENGINE].c_str());

	const std::string itemsOtbPath = getGlobalString(L, "itemsOtbPath", "");
	if (!itemsOtbPath.empty()) {
		string[ITEMS_OTB_PATH] = resolvePath(fileName, itemsOtbPath);
	}

	const std::string itemsXmlPath = getGlobalString(L, "itemsXmlPath", "");
	if (!itemsXmlPath.empty()) {
		string[ITEMS_XML_PATH] = resolvePath(fileName, itemsXmlPath);
	}

	if (!hintsOnly) {
		const std::string dataDirectory = getGlobalString(L, "dataDirectory", "");
		if (!dataDirectory.empty()) {
			string[DATA_DIRECTORY] = resolvePath(fileName, dataDirectory);
		}

		string[UNKNOWN_ITEM_POLICY] =
		    asLowerCaseString(getGlobalString(L, "unknownItemPolicy", string[UNKNOWN_ITEM_POLICY].c_str()));

		integer[MAX_FILE_SIZE_MB] = getGlobalNumber(L, "maxFileSizeMB", 1024);
		integer[WARN_FILE_SIZE_MB] = getGlobalNumber(L, "warnFileSizeMB", 256);
		integer[MAX_TILES] = getGlobalNumber(L, "maxTiles", 2000000);
		integer[WARN_TILES] = getGlobalNumber(L, "warnTiles", 1000000);
		integer[MAX_ITEMS] = getGlobalNumber(L, "maxItems", 16000000);
		integer[WARN_ITEMS] = getGlobalNumber(L, "warnItems", 8000000);
		integer[MAX_NODE_PAYLOAD_KB] = getGlobalNumber(L, "maxNodePayloadKB", 16 * 1024);
		integer[MAX_NODE_DEPTH] = getGlobalNumber(L, "maxNodeDepth", 512);

		boolean[RESOURCE_GUARD_ENABLED] = getGlobalBoolean(L, "resourceGuardEnabled", true);
		boolean[ALLOW_UNSUPPORTED_VERSIONS] = getGlobalBoolean(L, "allowUnsupportedVersions", false);
	}

	lua_close(L);
	return true;
}

static std::string dummyStr;

const std::string& ConfigManager::getString(string_config_t what) const
{
	if (what >= LAST_STRING_CONFIG) {
		return dummyStr;
	}
	return string[what];
}

int32_t ConfigManager::getNumber(integer_config_t what) const
{
	if (what >= LAST_INTEGER_CONFIG) {
		return 0;
	}
	return integer[what];
}

bool ConfigManager::getBoolean(boolean_config_t what) const
{
	if (what >= LAST_BOOLEAN_CONFIG) {
		return false;
	}
	return boolean[what];
}

bool ConfigManager::setString(string_config_t what, const std::string& value)
{
	if (what >= LAST_STRING_CONFIG) {
		return false;
	}

	string[what] = value;
	return true;
}

bool ConfigManager::setNumber(integer_config_t what, int32_t value)
{
	if (what >= LAST_INTEGER_CONFIG) {
		return false;
	}

	integer[what] = value;
	return true;
}

bool ConfigManager::setBoolean(boolean_config_t what, bool value)
{
	if (what >= LAST_BOOLEAN_CONFIG) {
		return false;
	}

	boolean[what] = value;
	return true;
}

UnknownItemPolicy_t ConfigManager::getUnknownItemPolicy() const
{
	const std::string& policy = getString(UNKNOWN_ITEM_POLICY);
	if (policy == "skip") {
		return UNKNOWN_ITEM_SKIP;
	} else if (policy == "error") {
		return UNKNOWN_ITEM_ERROR;
	}
	return UNKNOWN_ITEM_PLACEHOLDER;
}

FormatHint ConfigManager::getFormatHint() const
{
	FormatHint hint;
	hint.clientVersion = static_cast<uint32_t>(std::max<int32_t>(0, getNumber(CLIENT_VERSION)));
	if (getNumber(OTBM_VERSION) >= 0) {
		hint.otbmVersion = static_cast<uint32_t>(getNumber(OTBM_VERSION));
	}
	hint.engine = parseMapEngine(getString(ENGINE));
	hint.itemsOtbPath = getString(ITEMS_OTB_PATH);
	hint.itemsXmlPath = getString(ITEMS_XML_PATH);
	hint.dataDirectory = getString(DATA_DIRECTORY);
	hint.allowUnsupportedVersions = getBoolean(ALLOW_UNSUPPORTED_VERSIONS);
	return hint;
}
