// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "mapconverter.h"

#include "iomapserialize.h"
#include "map.h"

ConversionReport MapConverter::convert(const std::string& source, const std::string& destination,
                                       const MapFormat& targetFormat, const MapLoadContext& context)
{
	ConversionReport report;

	MapLoadResult result = IOMap::loadMap(source, context);
	report.load = std::move(result.report);
	if (!result.map) {
		report.save.fail(report.load.error, "Source map could not be loaded.");
		return report;
	}

	Map& map = *result.map;
	map.header.otbmVersion = targetFormat.otbmVersion;

	MapSaveContext saveContext;
	saveContext.format = targetFormat;
	saveContext.items = context.items;
	saveContext.idMapper = context.idMapper;
	saveContext.cancellation = context.cancellation;

	report.save = IOMapSerialize::saveMap(map, destination, saveContext);
	report.success = report.save.success;
	return report;
}
