// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

class ConfigManager;
struct MapLoadReport;

class ResourceLimitError final : public std::runtime_error
{
public:
	using std::runtime_error::runtime_error;
};

struct ResourceLimits
{
	bool enabled = true;

	uint64_t maxFileSize = 1024ull * 1024 * 1024;
	uint64_t warnFileSize = 256ull * 1024 * 1024;
	uint64_t maxTiles = 2000000;
	uint64_t warnTiles = 1000000;
	uint64_t maxItems = 16000000;
	uint64_t warnItems = 8000000;

	size_t maxNodePayload = 16 * 1024 * 1024;
	size_t maxNodeDepth = 512;

	static ResourceLimits fromConfig(const ConfigManager& config);
};

/**
 * Tracks decoded entity counts during a load.
 * Soft limits add a single warning to the report, hard limits throw ResourceLimitError.
 */
class ResourceGuard
{
public:
	ResourceGuard(const ResourceLimits& limits, MapLoadReport& report) : limits(limits), report(report) {}

	// non-copyable
	ResourceGuard(const ResourceGuard&) = delete;
	ResourceGuard& operator=(const ResourceGuard&) = delete;

	void checkFileSize(uint64_t size);
	void addTile();
	void addItems(uint64_t count);

	uint64_t getTileCount() const { return tiles; }
	uint64_t getItemCount() const { return items; }

private:
	void softLimit(bool& warned, const std::string& message);

	const ResourceLimits& limits;
	MapLoadReport& report;

	uint64_t tiles = 0;
	uint64_t items = 0;

	bool fileWarned = false;
	bool tilesWarned = false;
	bool itemsWarned = false;
};
