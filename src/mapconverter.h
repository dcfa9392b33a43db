// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "iomap.h"
#include "mapreport.h"

#include <string>

struct ConversionReport
{
	bool success = false;

	MapLoadReport load;
	MapSaveReport save;
};

class MapConverter
{
public:
	/**
	 * Loads source with the given load context and writes it to destination in targetFormat.
	 * The item database and id mapper of the load context are used for both directions.
	 * Nothing is written if loading fails.
	 */
	static ConversionReport convert(const std::string& source, const std::string& destination,
	                                const MapFormat& targetFormat, const MapLoadContext& context);
};
