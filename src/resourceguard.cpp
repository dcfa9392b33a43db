// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "resourceguard.h"

#include "configmanager.h"
#include "mapreport.h"

ResourceLimits ResourceLimits::fromConfig(const ConfigManager& config)
{
	constexpr uint64_t MB = 1024 * 1024;

	ResourceLimits limits;
	limits.enabled = config.getBoolean(ConfigManager::RESOURCE_GUARD_ENABLED);
	limits.maxFileSize = std::max<int32_t>(0, config.getNumber(ConfigManager::MAX_FILE_SIZE_MB)) * MB;
	limits.warnFileSize = std::max<int32_t>(0, config.getNumber(ConfigManager::WARN_FILE_SIZE_MB)) * MB;
	limits.maxTiles = std::max<int32_t>(0, config.getNumber(ConfigManager::MAX_TILES));
	limits.warnTiles = std::max<int32_t>(0, config.getNumber(ConfigManager::WARN_TILES));
	limits.maxItems = std::max<int32_t>(0, config.getNumber(ConfigManager::MAX_ITEMS));
	limits.warnItems = std::max<int32_t>(0, config.getNumber(ConfigManager::WARN_ITEMS));
	limits.maxNodePayload =
	    static_cast<size_t>(std::max<int32_t>(1, config.getNumber(ConfigManager::MAX_NODE_PAYLOAD_KB))) * 1024;
	limits.maxNodeDepth = std::max<int32_t>(4, config.getNumber(ConfigManager::MAX_NODE_DEPTH));
	return limits;
}

void ResourceGuard::softLimit(bool& warned, const std::string& message)
{
	if (warned) {
		return;
	}

	warned = true;
	report.addWarning(MAPWARNING_RESOURCE_SOFT_LIMIT, message);
}

void ResourceGuard::checkFileSize(uint64_t size)
{
	if (!limits.enabled) {
		return;
	}

	if (size > limits.maxFileSize) {
		throw ResourceLimitError(
		    fmt::format("File size {:d} bytes exceeds the limit of {:d} bytes.", size, limits.maxFileSize));
	}

	if (size > limits.warnFileSize) {
		softLimit(fileWarned, fmt::format("Large map file: {:d} bytes.", size));
	}
}

void ResourceGuard::addTile()
{
	++tiles;
	if (!limits.enabled) {
		return;
	}

	if (tiles > limits.maxTiles) {
		throw ResourceLimitError(fmt::format("Tile count exceeds the limit of {:d}.", limits.maxTiles));
	}

	if (tiles > limits.warnTiles) {
		softLimit(tilesWarned, fmt::format("Map has more than {:d} tiles.", limits.warnTiles));
	}
}

void ResourceGuard::addItems(uint64_t count)
{
	items += count;
	if (!limits.enabled) {
		return;
	}

	if (items > limits.maxItems) {
		throw ResourceLimitError(fmt::format("Item count exceeds the limit of {:d}.", limits.maxItems));
	}

	if (items > limits.warnItems) {
		softLimit(itemsWarned, fmt::format("Map has more than {:d} items.", limits.warnItems));
	}
}
