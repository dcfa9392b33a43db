// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "enums.h"
#include "mapversion.h"
#include "position.h"

#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class Map;

struct MapIssue
{
	MapWarningCode_t code;
	std::string message;
	std::optional<Position> position;
};

using MapIssueList = std::vector<MapIssue>;

struct MapStatistics
{
	uint64_t tiles = 0;
	uint64_t houseTiles = 0;
	uint64_t items = 0;
	uint64_t towns = 0;
	uint64_t waypoints = 0;
	uint64_t spawns = 0;

	// largest decoded node payload and deepest node nesting seen while streaming
	size_t peakPayloadSize = 0;
	size_t peakDepth = 0;
};

struct MapLoadReport
{
	bool success = false;

	MapIOError_t error = MAPIO_ERROR_NONE;
	std::string errorMessage;
	uint64_t errorOffset = 0;
	std::string errorNodePath;

	// informational anomalies
	MapIssueList warnings;
	// attribute anomalies that were skipped or preserved raw
	MapIssueList recoverableErrors;

	MapFormat format;
	MapStatistics stats;

	void addWarning(MapWarningCode_t code, const std::string& message,
	                const std::optional<Position>& position = std::nullopt)
	{
		warnings.push_back({code, message, position});
	}

	void addRecoverable(MapWarningCode_t code, const std::string& message,
	                    const std::optional<Position>& position = std::nullopt)
	{
		recoverableErrors.push_back({code, message, position});
	}

	void fail(MapIOError_t code, const std::string& message)
	{
		success = false;
		error = code;
		errorMessage = message;
	}
};

struct MapSaveReport
{
	bool success = false;

	MapIOError_t error = MAPIO_ERROR_NONE;
	std::string errorMessage;

	// filled when ids could not be written in the target id space
	std::vector<Position> offendingPositions;
	std::vector<uint16_t> offendingIds;

	MapIssueList warnings;

	uint64_t tiles = 0;
	uint64_t items = 0;
	uint64_t bytesWritten = 0;

	void addWarning(MapWarningCode_t code, const std::string& message,
	                const std::optional<Position>& position = std::nullopt)
	{
		warnings.push_back({code, message, position});
	}

	void fail(MapIOError_t code, const std::string& message)
	{
		success = false;
		error = code;
		errorMessage = message;
	}
};

struct MapLoadResult
{
	std::unique_ptr<Map> map;
	MapLoadReport report;
};

class CancelledError final : public std::runtime_error
{
public:
	CancelledError() : std::runtime_error("Operation cancelled.") {}
};

class CancellationToken
{
public:
	CancellationToken() = default;

	// non-copyable
	CancellationToken(const CancellationToken&) = delete;
	CancellationToken& operator=(const CancellationToken&) = delete;

	void cancel() { cancelled.store(true, std::memory_order_relaxed); }
	void reset() { cancelled.store(false, std::memory_order_relaxed); }
	bool isCancelled() const { return cancelled.load(std::memory_order_relaxed); }

	void throwIfCancelled() const
	{
		if (isCancelled()) {
			throw CancelledError();
		}
	}

private:
	std::atomic<bool> cancelled{false};
};
