// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "configmanager.h"
#include "idmapper.h"
#include "iomap.h"
#include "items.h"
#include "map.h"
#include "mapconverter.h"
#include "mapdetection.h"
#include "mapvalidator.h"
#include "tools.h"

#include <chrono>

namespace {

struct Options
{
	std::string command;
	std::string source;
	std::string destination;
	std::string configFile;
	std::optional<uint32_t> targetVersion;
};

void printUsage()
{
	std::cout << "Usage:" << std::endl;
	std::cout << "  otmaptool info <map.otbm> [--config <file.lua>]" << std::endl;
	std::cout << "  otmaptool validate <map.otbm> [--config <file.lua>]" << std::endl;
	std::cout << "  otmaptool convert <source.otbm> <destination.otbm> --otbm-version <1-7> [--config <file.lua>]"
	          << std::endl;
}

bool parseArguments(int argc, char** argv, Options& options)
{
	std::vector<std::string> positional;
	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];
		if (arg == "--config") {
			if (++i >= argc) {
				return false;
			}
			options.configFile = argv[i];
		} else if (arg == "--otbm-version") {
			if (++i >= argc) {
				return false;
			}

			int32_t version = std::atoi(argv[i]);
			if (version < 1 || static_cast<uint32_t>(version) > OTBM_VERSION_LAST + 1) {
				std::cout << "> ERROR: OTBM version must be between 1 and " << OTBM_VERSION_LAST + 1 << '.'
				          << std::endl;
				return false;
			}
			options.targetVersion = static_cast<uint32_t>(version - 1);
		} else {
			positional.push_back(arg);
		}
	}

	if (positional.empty()) {
		return false;
	}

	options.command = positional[0];
	if (options.command == "info" || options.command == "validate") {
		if (positional.size() != 2) {
			return false;
		}
		options.source = positional[1];
		return true;
	} else if (options.command == "convert") {
		if (positional.size() != 3 || !options.targetVersion) {
			return false;
		}
		options.source = positional[1];
		options.destination = positional[2];
		return true;
	}
	return false;
}

void printIssues(const char* title, const MapIssueList& issues)
{
	if (issues.empty()) {
		return;
	}

	std::cout << "> " << title << " (" << issues.size() << "):" << std::endl;
	for (const MapIssue& issue : issues) {
		std::cout << fmt::format("  [{:s}] {:s}", getMapWarningName(issue.code), issue.message) << std::endl;
	}
}

void printLoadReport(const MapLoadReport& report)
{
	printIssues("Warnings", report.warnings);
	printIssues("Recoverable errors", report.recoverableErrors);

	if (!report.success) {
		std::cout << fmt::format("> ERROR: {:s}: {:s}", getMapIOErrorName(report.error), report.errorMessage)
		          << std::endl;
		if (!report.errorNodePath.empty()) {
			std::cout << fmt::format("  at offset {:d} in {:s}", report.errorOffset, report.errorNodePath)
			          << std::endl;
		}
	}
}

class Session
{
public:
	bool open(const Options& options)
	{
		if (!options.configFile.empty()) {
			config.setString(ConfigManager::CONFIG_FILE, options.configFile);
			if (!config.load()) {
				std::cout << config.getLastError() << std::endl;
				return false;
			}
		} else if (std::filesystem::is_regular_file(config.getString(ConfigManager::CONFIG_FILE))) {
			if (!config.load()) {
				std::cout << config.getLastError() << std::endl;
				return false;
			}
		}

		if (config.loadProjectHints(options.source)) {
			std::cout << "> Using project file " << ConfigManager::findProjectFile(options.source) << std::endl;
		} else if (!config.getLastError().empty()) {
			std::cout << config.getLastError() << std::endl;
			return false;
		}

		context.hint = config.getFormatHint();
		context.limits = ResourceLimits::fromConfig(config);
		context.unknownItemPolicy = config.getUnknownItemPolicy();

		loadItems(options.source);
		return true;
	}

	const MapLoadContext& getContext() const { return context; }
	const ItemDatabase& getItems() const { return items; }

private:
	void loadItems(const std::string& mapFileName)
	{
		std::optional<uint32_t> headerVersion;

		OTBM_root_header header;
		bool hadIdentifier;
		std::string error;
		if (IOMap::readHeader(mapFileName, header, hadIdentifier, error)) {
			headerVersion = header.version;
		}

		const MapFormat format = resolveMapFormat(context.hint, headerVersion);

		if (!format.itemsOtbPath.empty()) {
			std::cout << "> Loading " << format.itemsOtbPath << std::endl;
			if (!items.loadFromOtb(format.itemsOtbPath)) {
				std::cout << "> WARNING: " << items.getLastError() << std::endl;
			}
		}

		if (!format.itemsXmlPath.empty()) {
			std::cout << "> Loading " << format.itemsXmlPath << std::endl;
			if (!items.loadFromXml(format.itemsXmlPath)) {
				std::cout << "> WARNING: " << items.getLastError() << std::endl;
			}
		}

		if (items.empty()) {
			std::cout << "> No item database, ground detection and id translation are limited." << std::endl;
			return;
		}

		idMapper = IdMapper(items);
		context.items = &items;
		context.idMapper = &idMapper;
		std::cout << fmt::format("> {:d} item types, {:d} client ids.", items.size(), idMapper.size()) << std::endl;
	}

	ConfigManager config;
	ItemDatabase items;
	IdMapper idMapper;
	MapLoadContext context;
};

MapLoadResult loadMap(const Options& options, const Session& session)
{
	const MapFileKind_t kind = detectMapFile(options.source);
	std::cout << fmt::format("> Loading {:s} ({:s})", options.source, getMapFileKindName(kind)) << std::endl;

	const auto start = std::chrono::steady_clock::now();

	MapLoadResult result = IOMap::loadMap(options.source, session.getContext());
	printLoadReport(result.report);

	if (result.map) {
		const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
		std::cout << fmt::format("> Map loaded in {:.3f} seconds.", elapsed.count()) << std::endl;
	}
	return result;
}

int runInfo(const Options& options, const Session& session)
{
	MapLoadResult result = loadMap(options, session);
	if (!result.map) {
		return EXIT_FAILURE;
	}

	const Map& map = *result.map;
	const MapLoadReport& report = result.report;
	const MapStatistics& stats = report.stats;

	std::cout << fmt::format("> Format: {:s}, {:s} ids, client {:d}, engine {:s} (from {:s})",
	                         getOTBMVersionName(report.format.otbmVersion),
	                         report.format.usesClientId ? "client" : "server", report.format.clientVersion,
	                         getMapEngineName(report.format.engine), getVersionSourceName(report.format.source))
	          << std::endl;
	std::cout << fmt::format("> Size: {:d}x{:d}, items {:d}.{:d}", map.header.width, map.header.height,
	                         map.header.majorVersionItems, map.header.minorVersionItems)
	          << std::endl;

	if (!map.header.description.empty()) {
		std::cout << "> Description: " << map.header.description << std::endl;
	}
	if (!map.header.spawnFile.empty()) {
		std::cout << "> Spawn file: " << map.header.spawnFile << std::endl;
	}
	if (!map.header.houseFile.empty()) {
		std::cout << "> House file: " << map.header.houseFile << std::endl;
	}

	std::cout << fmt::format("> {:d} tiles ({:d} house tiles), {:d} items", stats.tiles, stats.houseTiles,
	                         stats.items)
	          << std::endl;
	std::cout << fmt::format("> {:d} towns, {:d} houses, {:d} waypoints, {:d} spawns", stats.towns,
	                         map.houses.size(), stats.waypoints, stats.spawns)
	          << std::endl;
	std::cout << fmt::format("> Largest node {:s}, deepest nesting {:d}", formatBytes(stats.peakPayloadSize),
	                         stats.peakDepth)
	          << std::endl;
	return EXIT_SUCCESS;
}

int runValidate(const Options& options, const Session& session)
{
	MapLoadResult result = loadMap(options, session);
	if (!result.map) {
		return EXIT_FAILURE;
	}

	const ValidationResult validation = MapValidator::validate(*result.map, session.getContext().items);
	for (const ValidationIssue& issue : validation.getIssues()) {
		std::cout << fmt::format("  [{:s}] {:s}: {:s}", issue.severity == VALIDATION_ERROR ? "ERROR" : "WARNING",
		                         getValidationCodeName(issue.code), issue.message)
		          << std::endl;
	}

	std::cout << fmt::format("> Validation finished with {:d} errors and {:d} warnings.",
	                         validation.getErrorCount(), validation.getWarningCount())
	          << std::endl;
	return validation.hasErrors() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int runConvert(const Options& options, const Session& session)
{
	MapFormat target = MapFormat::forVersion(*options.targetVersion);
	std::cout << fmt::format("> Converting {:s} to {:s} as {:s}", options.source, options.destination,
	                         getOTBMVersionName(target.otbmVersion))
	          << std::endl;

	const ConversionReport report =
	    MapConverter::convert(options.source, options.destination, target, session.getContext());
	printLoadReport(report.load);
	if (!report.load.success) {
		return EXIT_FAILURE;
	}

	printIssues("Save warnings", report.save.warnings);
	if (!report.success) {
		std::cout << fmt::format("> ERROR: {:s}: {:s}", getMapIOErrorName(report.save.error),
		                         report.save.errorMessage)
		          << std::endl;
		for (uint16_t id : report.save.offendingIds) {
			std::cout << fmt::format("  item id {:d}", id) << std::endl;
		}
		for (const Position& pos : report.save.offendingPositions) {
			std::cout << fmt::format("  tile [x:{:d}, y:{:d}, z:{:d}]", pos.x, pos.y, pos.z) << std::endl;
		}
		return EXIT_FAILURE;
	}

	std::cout << fmt::format("> Wrote {:d} tiles and {:d} items ({:s}).", report.save.tiles, report.save.items,
	                         formatBytes(report.save.bytesWritten))
	          << std::endl;
	return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv)
{
	std::cout << OTMAPIO_NAME << " - Version " << OTMAPIO_VERSION << std::endl;
	std::cout << "Developed by " << OTMAPIO_DEVELOPERS << std::endl << std::endl;

	Options options;
	if (!parseArguments(argc, argv, options)) {
		printUsage();
		return EXIT_FAILURE;
	}

	Session session;
	if (!session.open(options)) {
		return EXIT_FAILURE;
	}

	if (options.command == "info") {
		return runInfo(options, session);
	} else if (options.command == "validate") {
		return runValidate(options, session);
	}
	return runConvert(options, session);
}
