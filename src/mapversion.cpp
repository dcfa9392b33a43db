// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "mapversion.h"

#include "tools.h"

#include <regex>

namespace {

// items.otb files older than the client version suffix in their CSD string
uint32_t getLegacyClientVersion(uint32_t otbVersion)
{
	switch (otbVersion) {
		case 101:
			return 740;
		case 102:
			return 750;
		default:
			return 0;
	}
}

MapEngine_t getEngineForClientVersion(uint32_t clientVersion)
{
	if (clientVersion == 0) {
		return MAP_ENGINE_UNKNOWN;
	}
	return clientVersion >= CLIENT_VERSION_CANARY_MIN ? MAP_ENGINE_CANARY : MAP_ENGINE_TFS;
}

} // namespace

MapFormat MapFormat::forVersion(uint32_t otbmVersion)
{
	MapFormat format;
	format.otbmVersion = otbmVersion;
	format.usesClientId = otbmVersion >= OTBM_FIRST_CLIENTID_VERSION;
	format.engine = format.usesClientId ? MAP_ENGINE_CANARY : MAP_ENGINE_TFS;
	format.source = VERSION_SOURCE_HINT;
	return format;
}

uint32_t getClientVersionFromItems(const ItemsOtbVersion& version)
{
	static const std::regex clientSuffix(R"(-(\d{1,4})\.(\d{1,4}))");

	std::smatch match;
	if (std::regex_search(version.csdVersion, match, clientSuffix)) {
		const uint32_t major = std::stoul(match[1].str());
		const uint32_t minor = std::stoul(match[2].str());
		return major * 100 + minor;
	}
	return getLegacyClientVersion(version.majorVersion * 100 + version.minorVersion);
}

MapFormat resolveMapFormat(const FormatHint& hint, std::optional<uint32_t> headerVersion,
                           const ItemsOtbVersion* itemsVersion)
{
	MapFormat format;

	uint32_t itemsClientVersion = 0;
	if (itemsVersion) {
		itemsClientVersion = getClientVersionFromItems(*itemsVersion);
	}

	format.clientVersion = hint.clientVersion != 0 ? hint.clientVersion : itemsClientVersion;

	if (hint.otbmVersion) {
		format.otbmVersion = *hint.otbmVersion;
		format.source = VERSION_SOURCE_HINT;
	} else if (headerVersion) {
		format.otbmVersion = *headerVersion;
		format.source = VERSION_SOURCE_HEADER;
	} else if (hint.clientVersion != 0) {
		format.otbmVersion =
		    hint.clientVersion >= CLIENT_VERSION_CANARY_MIN ? OTBM_VERSION_LAST : OTBM_VERSION_DEFAULT;
		format.source = VERSION_SOURCE_HINT;
	} else if (itemsClientVersion != 0) {
		format.otbmVersion =
		    itemsClientVersion >= CLIENT_VERSION_CANARY_MIN ? OTBM_VERSION_LAST : OTBM_VERSION_DEFAULT;
		format.source = VERSION_SOURCE_ITEMS_OTB;
	} else {
		format.otbmVersion = OTBM_VERSION_DEFAULT;
		format.source = VERSION_SOURCE_FALLBACK;
	}

	format.usesClientId = format.otbmVersion >= OTBM_FIRST_CLIENTID_VERSION;

	if (hint.engine != MAP_ENGINE_UNKNOWN) {
		format.engine = hint.engine;
	} else if (MapEngine_t engine = getEngineForClientVersion(format.clientVersion); engine != MAP_ENGINE_UNKNOWN) {
		format.engine = engine;
	} else {
		format.engine = format.usesClientId ? MAP_ENGINE_CANARY : MAP_ENGINE_TFS;
	}

	format.itemsOtbPath = !hint.itemsOtbPath.empty() ? hint.itemsOtbPath
	                                                 : findItemsFile(hint.dataDirectory, format.engine, "items.otb");
	format.itemsXmlPath = !hint.itemsXmlPath.empty() ? hint.itemsXmlPath
	                                                 : findItemsFile(hint.dataDirectory, format.engine, "items.xml");
	return format;
}

std::string findItemsFile(const std::string& dataDirectory, MapEngine_t engine, const std::string& fileName)
{
	if (dataDirectory.empty()) {
		return {};
	}

	const std::filesystem::path root(dataDirectory);
	const std::filesystem::path engineDirectory = root / getMapEngineName(engine);

	std::error_code ec;
	for (const auto& candidate : {engineDirectory / fileName, engineDirectory / "items" / fileName,
	                              root / "items" / fileName}) {
		if (std::filesystem::is_regular_file(candidate, ec)) {
			return candidate.string();
		}
	}
	return {};
}

MapEngine_t parseMapEngine(const std::string& name)
{
	const std::string engine = asLowerCaseString(name);
	if (engine == "canary" || engine == "otservbr") {
		return MAP_ENGINE_CANARY;
	} else if (engine == "tfs" || engine == "forgottenserver" || engine == "otx") {
		return MAP_ENGINE_TFS;
	}
	return MAP_ENGINE_UNKNOWN;
}

const char* getMapEngineName(MapEngine_t engine)
{
	switch (engine) {
		case MAP_ENGINE_TFS:
			return "tfs";
		case MAP_ENGINE_CANARY:
			return "canary";
		default:
			return "unknown";
	}
}

const char* getVersionSourceName(VersionSource_t source)
{
	switch (source) {
		case VERSION_SOURCE_HINT:
			return "project hint";
		case VERSION_SOURCE_HEADER:
			return "map header";
		case VERSION_SOURCE_ITEMS_OTB:
			return "items.otb";
		default:
			return "fallback";
	}
}

std::string getOTBMVersionName(uint32_t otbmVersion) { return fmt::format("OTBM {:d}", otbmVersion + 1); }
